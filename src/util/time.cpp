// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace skiff {
namespace util {

namespace {

// 0 means mock time is disabled
std::atomic<int64_t> g_mock_time{0};

// Reference points pairing the first observed mock value with a real steady
// time point, so mock steady time stays monotonic across SetMockTime calls.
std::mutex g_steady_mutex;
std::chrono::steady_clock::time_point g_steady_anchor;
int64_t g_mock_anchor{0};
bool g_anchored{false};

}  // namespace

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_anchored) {
    g_steady_anchor = std::chrono::steady_clock::now();
    g_mock_anchor = mock;
    g_anchored = true;
  }
  return g_steady_anchor + std::chrono::seconds(mock - g_mock_anchor);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_anchored = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace skiff

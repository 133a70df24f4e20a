// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace skiff {
namespace util {

// Steady clock that honours mock time. While mock time is set, the returned
// time point advances by exactly the mock-time delta (whole seconds).
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock unix time in seconds (0 disables mock time).
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII helper for tests: enables mock time on construction, restores the
// previous value on destruction.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace skiff

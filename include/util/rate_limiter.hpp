// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Token-bucket limiter for log lines triggered by remote peers

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace skiff {
namespace util {

/**
 * RateLimiter - per-callsite token bucket
 *
 * A remote endpoint that keeps sending undecodable frames or unknown message
 * types must not be able to flood the log. Each callsite starts with a full
 * bucket of tokens_per_period tokens, refilled linearly over period_seconds.
 */
class RateLimiter {
public:
  // Returns true if the line at callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    bool primed{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace skiff

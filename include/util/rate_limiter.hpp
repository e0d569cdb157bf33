// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for logging driven by remote device output

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cartograph {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets N tokens that refill linearly over a period. Used by the
 * *_RL logging macros so that a fleet returning garbage neighbor output cannot
 * turn one crawl into millions of identical warnings.
 */
class RateLimiter {
public:
  // Returns true if a message from callsite_key may be logged now.
  // tokens_per_period is both the burst capacity and the refill amount per
  // period_seconds.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace cartograph

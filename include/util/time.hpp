// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cartograph {
namespace util {

// Unix time in seconds (mockable)
int64_t GetTime();

// Monotonic clock used for rate limiting and crawl durations (mockable).
// While mock time is set, the steady clock advances with the mock value.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time for tests. 0 disables mocking.
void SetMockTime(int64_t time);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string FormatIsoTime(int64_t unix_time);

// RAII guard that enables mock time for the current scope
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(0); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
};

}  // namespace util
}  // namespace cartograph

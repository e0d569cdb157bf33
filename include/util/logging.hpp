// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cartograph {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the per-component
 * loggers used by the crawler ("crawl"), the platform detector ("detect")
 * and the topology assembler ("topology").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex, so crawl workers may log concurrently.
 */
class LogManager {
public:
  // Initialize logging with the specified minimum level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "cartograph.log");

  // Flush and drop all loggers. Later logging calls re-initialize with defaults.
  static void Shutdown();

  // Get logger for a component ("crawl", "detect", "topology").
  // Unknown component names map to the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace cartograph

// Convenience macros for logging
#define LOG_TRACE(...) cartograph::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) cartograph::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) cartograph::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) cartograph::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) cartograph::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CRAWL_TRACE(...) cartograph::util::LogManager::GetLogger("crawl")->trace(__VA_ARGS__)
#define LOG_CRAWL_DEBUG(...) cartograph::util::LogManager::GetLogger("crawl")->debug(__VA_ARGS__)
#define LOG_CRAWL_INFO(...) cartograph::util::LogManager::GetLogger("crawl")->info(__VA_ARGS__)
#define LOG_CRAWL_WARN(...) cartograph::util::LogManager::GetLogger("crawl")->warn(__VA_ARGS__)
#define LOG_CRAWL_ERROR(...) cartograph::util::LogManager::GetLogger("crawl")->error(__VA_ARGS__)

#define LOG_DETECT_TRACE(...) cartograph::util::LogManager::GetLogger("detect")->trace(__VA_ARGS__)
#define LOG_DETECT_DEBUG(...) cartograph::util::LogManager::GetLogger("detect")->debug(__VA_ARGS__)
#define LOG_DETECT_INFO(...) cartograph::util::LogManager::GetLogger("detect")->info(__VA_ARGS__)
#define LOG_DETECT_WARN(...) cartograph::util::LogManager::GetLogger("detect")->warn(__VA_ARGS__)

#define LOG_TOPO_DEBUG(...) cartograph::util::LogManager::GetLogger("topology")->debug(__VA_ARGS__)
#define LOG_TOPO_INFO(...) cartograph::util::LogManager::GetLogger("topology")->info(__VA_ARGS__)
#define LOG_TOPO_WARN(...) cartograph::util::LogManager::GetLogger("topology")->warn(__VA_ARGS__)
#define LOG_TOPO_ERROR(...) cartograph::util::LogManager::GetLogger("topology")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite for messages driven by remote device
// output (malformed neighbor records, failing dialect attempts). A large
// crawl against a misbehaving fleet can otherwise emit one line per record
// per device.
//
// Rate limits (token bucket): 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_CRAWL_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (cartograph::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      cartograph::util::LogManager::GetLogger("crawl")->warn(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)

#define LOG_DETECT_DEBUG_RL(...)                                                                                       \
  do {                                                                                                                 \
    if (cartograph::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      cartograph::util::LogManager::GetLogger("detect")->debug(__VA_ARGS__);                                           \
    }                                                                                                                  \
  } while (0)

#define LOG_TOPO_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (cartograph::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      cartograph::util::LogManager::GetLogger("topology")->warn(__VA_ARGS__);                                          \
    }                                                                                                                  \
  } while (0)

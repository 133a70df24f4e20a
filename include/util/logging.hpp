// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace skiff {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "session", "app"), all
 * sharing the same sinks. Unknown component names resolve to "default".
 *
 * Thread-safety: all methods are thread-safe. Initialization happens exactly
 * once per process via std::call_once; later Initialize() calls are no-ops.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level ("trace" .. "off").
  // When log_to_file is set, lines are also appended to log_file_path.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "skiff.log");

  // Flush and drop all loggers. Logging afterwards reinitializes with defaults.
  static void Shutdown();

  // Auto-initializes if needed. Returns the cached logger for the component.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);

  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace skiff

#define LOG_TRACE(...) skiff::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) skiff::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) skiff::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) skiff::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) skiff::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) skiff::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) skiff::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) skiff::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) skiff::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) skiff::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SESSION_TRACE(...) skiff::util::LogManager::GetLogger("session")->trace(__VA_ARGS__)
#define LOG_SESSION_DEBUG(...) skiff::util::LogManager::GetLogger("session")->debug(__VA_ARGS__)
#define LOG_SESSION_INFO(...) skiff::util::LogManager::GetLogger("session")->info(__VA_ARGS__)
#define LOG_SESSION_WARN(...) skiff::util::LogManager::GetLogger("session")->warn(__VA_ARGS__)
#define LOG_SESSION_ERROR(...) skiff::util::LogManager::GetLogger("session")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) skiff::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...) skiff::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For lines a remote endpoint can trigger at will (undecodable frames,
// unknown message types). 200 lines per hour per callsite.

#include "util/rate_limiter.hpp"

#define SKIFF_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (skiff::util::RateLimiter::instance().should_log(SKIFF_CALLSITE_KEY_, 200, 3600)) {                             \
      skiff::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                                \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_ERROR_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (skiff::util::RateLimiter::instance().should_log(SKIFF_CALLSITE_KEY_, 200, 3600)) {                             \
      skiff::util::LogManager::GetLogger("network")->error(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)

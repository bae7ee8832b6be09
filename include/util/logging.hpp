// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ftpctl {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component, all sharing the same sinks. Relay internals log
 * through the "relay" and "tls" components so a single connection can be
 * traced with --debug=relay,tls without drowning in accept/socket noise.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "ftpctl.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "relay", "tls")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, relay, tls, auth, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace ftpctl

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  ftpctl::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  ftpctl::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  ftpctl::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  ftpctl::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  ftpctl::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  ftpctl::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  ftpctl::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  ftpctl::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  ftpctl::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  ftpctl::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...)                                                   \
  ftpctl::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...)                                                   \
  ftpctl::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_WARN(...)                                                    \
  ftpctl::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)
#define LOG_RELAY_ERROR(...)                                                   \
  ftpctl::util::LogManager::GetLogger("relay")->error(__VA_ARGS__)

#define LOG_TLS_TRACE(...)                                                     \
  ftpctl::util::LogManager::GetLogger("tls")->trace(__VA_ARGS__)
#define LOG_TLS_DEBUG(...)                                                     \
  ftpctl::util::LogManager::GetLogger("tls")->debug(__VA_ARGS__)
#define LOG_TLS_WARN(...)                                                      \
  ftpctl::util::LogManager::GetLogger("tls")->warn(__VA_ARGS__)

#define LOG_AUTH_DEBUG(...)                                                    \
  ftpctl::util::LogManager::GetLogger("auth")->debug(__VA_ARGS__)
#define LOG_AUTH_WARN(...)                                                     \
  ftpctl::util::LogManager::GetLogger("auth")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  ftpctl::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  ftpctl::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  ftpctl::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

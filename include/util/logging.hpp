// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace forksim {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the
 * per-component loggers (default, chain, sim, stats, app).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "forksim.log");

  // Shutdown logging system (flushes buffers)
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("chain", "sim", "stats", "app")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace forksim

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  forksim::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  forksim::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  forksim::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  forksim::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  forksim::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  forksim::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  forksim::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  forksim::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  forksim::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  forksim::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_SIM_TRACE(...)                                                     \
  forksim::util::LogManager::GetLogger("sim")->trace(__VA_ARGS__)
#define LOG_SIM_DEBUG(...)                                                     \
  forksim::util::LogManager::GetLogger("sim")->debug(__VA_ARGS__)
#define LOG_SIM_INFO(...)                                                      \
  forksim::util::LogManager::GetLogger("sim")->info(__VA_ARGS__)
#define LOG_SIM_WARN(...)                                                      \
  forksim::util::LogManager::GetLogger("sim")->warn(__VA_ARGS__)

#define LOG_STATS_TRACE(...)                                                   \
  forksim::util::LogManager::GetLogger("stats")->trace(__VA_ARGS__)
#define LOG_STATS_DEBUG(...)                                                   \
  forksim::util::LogManager::GetLogger("stats")->debug(__VA_ARGS__)
#define LOG_STATS_INFO(...)                                                    \
  forksim::util::LogManager::GetLogger("stats")->info(__VA_ARGS__)

#define LOG_APP_TRACE(...)                                                     \
  forksim::util::LogManager::GetLogger("app")->trace(__VA_ARGS__)
#define LOG_APP_DEBUG(...)                                                     \
  forksim::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  forksim::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  forksim::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  forksim::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

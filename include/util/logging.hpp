// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pgprobe {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "rpc", "harness", "report").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use by group workers.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "pgprobe.log");

  // Flush and drop all loggers. Later logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component (default, rpc, harness, report).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace pgprobe

// Convenience macros for logging
#define LOG_TRACE(...) pgprobe::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) pgprobe::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) pgprobe::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) pgprobe::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) pgprobe::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_RPC_TRACE(...) pgprobe::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...) pgprobe::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...) pgprobe::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...) pgprobe::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...) pgprobe::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_HARNESS_TRACE(...) pgprobe::util::LogManager::GetLogger("harness")->trace(__VA_ARGS__)
#define LOG_HARNESS_DEBUG(...) pgprobe::util::LogManager::GetLogger("harness")->debug(__VA_ARGS__)
#define LOG_HARNESS_INFO(...) pgprobe::util::LogManager::GetLogger("harness")->info(__VA_ARGS__)
#define LOG_HARNESS_WARN(...) pgprobe::util::LogManager::GetLogger("harness")->warn(__VA_ARGS__)
#define LOG_HARNESS_ERROR(...) pgprobe::util::LogManager::GetLogger("harness")->error(__VA_ARGS__)

#define LOG_REPORT_INFO(...) pgprobe::util::LogManager::GetLogger("report")->info(__VA_ARGS__)
#define LOG_REPORT_WARN(...) pgprobe::util::LogManager::GetLogger("report")->warn(__VA_ARGS__)
#define LOG_REPORT_ERROR(...) pgprobe::util::LogManager::GetLogger("report")->error(__VA_ARGS__)

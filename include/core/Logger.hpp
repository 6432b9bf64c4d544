/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace HexPath {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file logger in release)
  ERROR_LEVEL = 1,  // Always logs (file logger in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("HexPath Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define HEXPATH_CRITICAL(system, msg)                                          \
  HexPath::Logger::Log(HexPath::LogLevel::CRITICAL, system, msg)
#define HEXPATH_ERROR(system, msg)                                             \
  HexPath::Logger::Log(HexPath::LogLevel::ERROR_LEVEL, system, msg)
#define HEXPATH_WARN(system, msg)                                              \
  HexPath::Logger::Log(HexPath::LogLevel::WARNING, system, msg)
#define HEXPATH_INFO(system, msg)                                              \
  HexPath::Logger::Log(HexPath::LogLevel::INFO, system, msg)
#define HEXPATH_DEBUG(system, msg)                                             \
  HexPath::Logger::Log(HexPath::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define HEXPATH_CRITICAL(system, msg)                                          \
  HexPath::Logger::Log("CRITICAL", system, msg)

#define HEXPATH_ERROR(system, msg) HexPath::Logger::Log("ERROR", system, msg)

#define HEXPATH_WARN(system, msg) ((void)0)  // Zero overhead
#define HEXPATH_INFO(system, msg) ((void)0)  // Zero overhead
#define HEXPATH_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define THREADSYSTEM_CRITICAL(msg) HEXPATH_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) HEXPATH_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) HEXPATH_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) HEXPATH_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) HEXPATH_DEBUG("ThreadSystem", msg)

#define CONFIG_CRITICAL(msg) HEXPATH_CRITICAL("PathfindingConfig", msg)
#define CONFIG_ERROR(msg) HEXPATH_ERROR("PathfindingConfig", msg)
#define CONFIG_WARN(msg) HEXPATH_WARN("PathfindingConfig", msg)
#define CONFIG_INFO(msg) HEXPATH_INFO("PathfindingConfig", msg)
#define CONFIG_DEBUG(msg) HEXPATH_DEBUG("PathfindingConfig", msg)

// Pathfinding Systems
#define PATHFIND_CRITICAL(msg) HEXPATH_CRITICAL("PathfindingManager", msg)
#define PATHFIND_ERROR(msg) HEXPATH_ERROR("PathfindingManager", msg)
#define PATHFIND_WARN(msg) HEXPATH_WARN("PathfindingManager", msg)
#define PATHFIND_INFO(msg) HEXPATH_INFO("PathfindingManager", msg)
#define PATHFIND_DEBUG(msg) HEXPATH_DEBUG("PathfindingManager", msg)

#define SEARCH_ERROR(msg) HEXPATH_ERROR("Search", msg)
#define SEARCH_WARN(msg) HEXPATH_WARN("Search", msg)
#define SEARCH_DEBUG(msg) HEXPATH_DEBUG("Search", msg)

// Benchmark mode convenience macros
#define HEXPATH_ENABLE_BENCHMARK_MODE()                                        \
  HexPath::Logger::SetBenchmarkMode(true)
#define HEXPATH_DISABLE_BENCHMARK_MODE()                                       \
  HexPath::Logger::SetBenchmarkMode(false)

} // namespace HexPath

#endif // LOGGER_HPP

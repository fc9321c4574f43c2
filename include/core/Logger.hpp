/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace Mythweave {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("Mythweave - [%s] %s: %s\n", system, getLevelString(level),
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

#define MYTHWEAVE_CRITICAL(system, msg)                                        \
  Mythweave::Logger::Log(Mythweave::LogLevel::CRITICAL, system, msg)
#define MYTHWEAVE_ERROR(system, msg)                                           \
  Mythweave::Logger::Log(Mythweave::LogLevel::ERROR_LEVEL, system, msg)
#define MYTHWEAVE_WARN(system, msg)                                            \
  Mythweave::Logger::Log(Mythweave::LogLevel::WARNING, system, msg)
#define MYTHWEAVE_INFO(system, msg)                                            \
  Mythweave::Logger::Log(Mythweave::LogLevel::INFO, system, msg)
#define MYTHWEAVE_DEBUG(system, msg)                                           \
  Mythweave::Logger::Log(Mythweave::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL and ERROR in <pref path>/logs, the rest compiles away
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

#define MYTHWEAVE_CRITICAL(system, msg)                                        \
  Mythweave::Logger::Log("CRITICAL", system, msg)

#define MYTHWEAVE_ERROR(system, msg)                                           \
  Mythweave::Logger::Log("ERROR", system, msg)

#define MYTHWEAVE_WARN(system, msg) ((void)0)
#define MYTHWEAVE_INFO(system, msg) ((void)0)
#define MYTHWEAVE_DEBUG(system, msg) ((void)0)
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each simulation subsystem

// Core Systems
#define CLOCK_CRITICAL(msg) MYTHWEAVE_CRITICAL("WorldClock", msg)
#define CLOCK_ERROR(msg) MYTHWEAVE_ERROR("WorldClock", msg)
#define CLOCK_WARN(msg) MYTHWEAVE_WARN("WorldClock", msg)
#define CLOCK_INFO(msg) MYTHWEAVE_INFO("WorldClock", msg)
#define CLOCK_DEBUG(msg) MYTHWEAVE_DEBUG("WorldClock", msg)

#define EVENTBUS_CRITICAL(msg) MYTHWEAVE_CRITICAL("EventBus", msg)
#define EVENTBUS_ERROR(msg) MYTHWEAVE_ERROR("EventBus", msg)
#define EVENTBUS_WARN(msg) MYTHWEAVE_WARN("EventBus", msg)
#define EVENTBUS_INFO(msg) MYTHWEAVE_INFO("EventBus", msg)
#define EVENTBUS_DEBUG(msg) MYTHWEAVE_DEBUG("EventBus", msg)

#define SIMULATOR_CRITICAL(msg) MYTHWEAVE_CRITICAL("Simulator", msg)
#define SIMULATOR_ERROR(msg) MYTHWEAVE_ERROR("Simulator", msg)
#define SIMULATOR_WARN(msg) MYTHWEAVE_WARN("Simulator", msg)
#define SIMULATOR_INFO(msg) MYTHWEAVE_INFO("Simulator", msg)
#define SIMULATOR_DEBUG(msg) MYTHWEAVE_DEBUG("Simulator", msg)

#define SNAPSHOTWRITER_CRITICAL(msg) MYTHWEAVE_CRITICAL("SnapshotWriter", msg)
#define SNAPSHOTWRITER_ERROR(msg) MYTHWEAVE_ERROR("SnapshotWriter", msg)
#define SNAPSHOTWRITER_WARN(msg) MYTHWEAVE_WARN("SnapshotWriter", msg)
#define SNAPSHOTWRITER_INFO(msg) MYTHWEAVE_INFO("SnapshotWriter", msg)
#define SNAPSHOTWRITER_DEBUG(msg) MYTHWEAVE_DEBUG("SnapshotWriter", msg)

// World Systems
#define WORLD_CRITICAL(msg) MYTHWEAVE_CRITICAL("World", msg)
#define WORLD_ERROR(msg) MYTHWEAVE_ERROR("World", msg)
#define WORLD_WARN(msg) MYTHWEAVE_WARN("World", msg)
#define WORLD_INFO(msg) MYTHWEAVE_INFO("World", msg)
#define WORLD_DEBUG(msg) MYTHWEAVE_DEBUG("World", msg)

#define FACTORY_CRITICAL(msg) MYTHWEAVE_CRITICAL("EntityFactory", msg)
#define FACTORY_ERROR(msg) MYTHWEAVE_ERROR("EntityFactory", msg)
#define FACTORY_WARN(msg) MYTHWEAVE_WARN("EntityFactory", msg)
#define FACTORY_INFO(msg) MYTHWEAVE_INFO("EntityFactory", msg)
#define FACTORY_DEBUG(msg) MYTHWEAVE_DEBUG("EntityFactory", msg)

#define GENERATOR_CRITICAL(msg) MYTHWEAVE_CRITICAL("ContentGenerator", msg)
#define GENERATOR_ERROR(msg) MYTHWEAVE_ERROR("ContentGenerator", msg)
#define GENERATOR_WARN(msg) MYTHWEAVE_WARN("ContentGenerator", msg)
#define GENERATOR_INFO(msg) MYTHWEAVE_INFO("ContentGenerator", msg)
#define GENERATOR_DEBUG(msg) MYTHWEAVE_DEBUG("ContentGenerator", msg)

// Entity Systems
#define BEHAVIOR_CRITICAL(msg) MYTHWEAVE_CRITICAL("BehaviorEngine", msg)
#define BEHAVIOR_ERROR(msg) MYTHWEAVE_ERROR("BehaviorEngine", msg)
#define BEHAVIOR_WARN(msg) MYTHWEAVE_WARN("BehaviorEngine", msg)
#define BEHAVIOR_INFO(msg) MYTHWEAVE_INFO("BehaviorEngine", msg)
#define BEHAVIOR_DEBUG(msg) MYTHWEAVE_DEBUG("BehaviorEngine", msg)

// Manager Systems
#define STATE_CRITICAL(msg) MYTHWEAVE_CRITICAL("StateManager", msg)
#define STATE_ERROR(msg) MYTHWEAVE_ERROR("StateManager", msg)
#define STATE_WARN(msg) MYTHWEAVE_WARN("StateManager", msg)
#define STATE_INFO(msg) MYTHWEAVE_INFO("StateManager", msg)
#define STATE_DEBUG(msg) MYTHWEAVE_DEBUG("StateManager", msg)

#define SETTINGS_CRITICAL(msg) MYTHWEAVE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) MYTHWEAVE_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) MYTHWEAVE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) MYTHWEAVE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) MYTHWEAVE_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define MYTHWEAVE_ENABLE_BENCHMARK_MODE()                                      \
  Mythweave::Logger::SetBenchmarkMode(true)
#define MYTHWEAVE_DISABLE_BENCHMARK_MODE()                                     \
  Mythweave::Logger::SetBenchmarkMode(false)

} // namespace Mythweave

#endif // LOGGER_HPP

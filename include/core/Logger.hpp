/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace AnchorMud {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (file sink in release)
  ERROR_LEVEL = 1,  // Always logs (file sink in release)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds - everything goes to stdout
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

  // Debug builds never write files; kept so callers need no #ifdef
  static void SetLogDirectory(const std::string &) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("AnchorMud Server - [%s] %s: %s\n", system, getLevelString(level),
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

#define ANCHOR_CRITICAL(system, msg)                                           \
  AnchorMud::Logger::Log(AnchorMud::LogLevel::CRITICAL, system, msg)
#define ANCHOR_ERROR(system, msg)                                              \
  AnchorMud::Logger::Log(AnchorMud::LogLevel::ERROR_LEVEL, system, msg)
#define ANCHOR_WARN(system, msg)                                               \
  AnchorMud::Logger::Log(AnchorMud::LogLevel::WARNING, system, msg)
#define ANCHOR_INFO(system, msg)                                               \
  AnchorMud::Logger::Log(AnchorMud::LogLevel::INFO, system, msg)
#define ANCHOR_DEBUG(system, msg)                                              \
  AnchorMud::Logger::Log(AnchorMud::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR only, written to a rotating log file
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  /**
   * @brief Directory used by the file sink. Must be called before the first
   * log line; an empty string means "./logs".
   */
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(const char *level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }
    writeToFile(level, system, message);
  }

private:
  static void writeToFile(const char *level, const char *system,
                          const char *message);
};

#define ANCHOR_CRITICAL(system, msg)                                           \
  AnchorMud::Logger::Log("CRITICAL", system, msg)

#define ANCHOR_ERROR(system, msg)                                              \
  AnchorMud::Logger::Log("ERROR", system, msg)

#define ANCHOR_WARN(system, msg) ((void)0)  // Zero overhead
#define ANCHOR_INFO(system, msg) ((void)0)  // Zero overhead
#define ANCHOR_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each runtime system

// Core Systems
#define SERVER_CRITICAL(msg) ANCHOR_CRITICAL("ServerLoop", msg)
#define SERVER_ERROR(msg) ANCHOR_ERROR("ServerLoop", msg)
#define SERVER_WARN(msg) ANCHOR_WARN("ServerLoop", msg)
#define SERVER_INFO(msg) ANCHOR_INFO("ServerLoop", msg)
#define SERVER_DEBUG(msg) ANCHOR_DEBUG("ServerLoop", msg)

#define RUNTIME_CRITICAL(msg) ANCHOR_CRITICAL("MudRuntime", msg)
#define RUNTIME_ERROR(msg) ANCHOR_ERROR("MudRuntime", msg)
#define RUNTIME_WARN(msg) ANCHOR_WARN("MudRuntime", msg)
#define RUNTIME_INFO(msg) ANCHOR_INFO("MudRuntime", msg)
#define RUNTIME_DEBUG(msg) ANCHOR_DEBUG("MudRuntime", msg)

#define THREADSYSTEM_CRITICAL(msg) ANCHOR_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) ANCHOR_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) ANCHOR_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) ANCHOR_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) ANCHOR_DEBUG("ThreadSystem", msg)

#define CLOCK_CRITICAL(msg) ANCHOR_CRITICAL("WorldClock", msg)
#define CLOCK_ERROR(msg) ANCHOR_ERROR("WorldClock", msg)
#define CLOCK_WARN(msg) ANCHOR_WARN("WorldClock", msg)
#define CLOCK_INFO(msg) ANCHOR_INFO("WorldClock", msg)
#define CLOCK_DEBUG(msg) ANCHOR_DEBUG("WorldClock", msg)

// Manager Systems
#define EVENT_CRITICAL(msg) ANCHOR_CRITICAL("EventManager", msg)
#define EVENT_ERROR(msg) ANCHOR_ERROR("EventManager", msg)
#define EVENT_WARN(msg) ANCHOR_WARN("EventManager", msg)
#define EVENT_INFO(msg) ANCHOR_INFO("EventManager", msg)
#define EVENT_DEBUG(msg) ANCHOR_DEBUG("EventManager", msg)

#define SETTINGS_CRITICAL(msg) ANCHOR_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) ANCHOR_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) ANCHOR_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) ANCHOR_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) ANCHOR_DEBUG("SettingsManager", msg)

#define CONTENT_CRITICAL(msg) ANCHOR_CRITICAL("ContentRegistry", msg)
#define CONTENT_ERROR(msg) ANCHOR_ERROR("ContentRegistry", msg)
#define CONTENT_WARN(msg) ANCHOR_WARN("ContentRegistry", msg)
#define CONTENT_INFO(msg) ANCHOR_INFO("ContentRegistry", msg)
#define CONTENT_DEBUG(msg) ANCHOR_DEBUG("ContentRegistry", msg)

#define REGISTRY_CRITICAL(msg) ANCHOR_CRITICAL("EntityRegistry", msg)
#define REGISTRY_ERROR(msg) ANCHOR_ERROR("EntityRegistry", msg)
#define REGISTRY_WARN(msg) ANCHOR_WARN("EntityRegistry", msg)
#define REGISTRY_INFO(msg) ANCHOR_INFO("EntityRegistry", msg)
#define REGISTRY_DEBUG(msg) ANCHOR_DEBUG("EntityRegistry", msg)

#define ROOMSTATE_CRITICAL(msg) ANCHOR_CRITICAL("RoomStateManager", msg)
#define ROOMSTATE_ERROR(msg) ANCHOR_ERROR("RoomStateManager", msg)
#define ROOMSTATE_WARN(msg) ANCHOR_WARN("RoomStateManager", msg)
#define ROOMSTATE_INFO(msg) ANCHOR_INFO("RoomStateManager", msg)
#define ROOMSTATE_DEBUG(msg) ANCHOR_DEBUG("RoomStateManager", msg)

#define SPAWN_CRITICAL(msg) ANCHOR_CRITICAL("SpawnLootEngine", msg)
#define SPAWN_ERROR(msg) ANCHOR_ERROR("SpawnLootEngine", msg)
#define SPAWN_WARN(msg) ANCHOR_WARN("SpawnLootEngine", msg)
#define SPAWN_INFO(msg) ANCHOR_INFO("SpawnLootEngine", msg)
#define SPAWN_DEBUG(msg) ANCHOR_DEBUG("SpawnLootEngine", msg)

#define SCHEDULE_CRITICAL(msg) ANCHOR_CRITICAL("ScheduleResolver", msg)
#define SCHEDULE_ERROR(msg) ANCHOR_ERROR("ScheduleResolver", msg)
#define SCHEDULE_WARN(msg) ANCHOR_WARN("ScheduleResolver", msg)
#define SCHEDULE_INFO(msg) ANCHOR_INFO("ScheduleResolver", msg)
#define SCHEDULE_DEBUG(msg) ANCHOR_DEBUG("ScheduleResolver", msg)

#define PERSIST_CRITICAL(msg) ANCHOR_CRITICAL("PersistenceGateway", msg)
#define PERSIST_ERROR(msg) ANCHOR_ERROR("PersistenceGateway", msg)
#define PERSIST_WARN(msg) ANCHOR_WARN("PersistenceGateway", msg)
#define PERSIST_INFO(msg) ANCHOR_INFO("PersistenceGateway", msg)
#define PERSIST_DEBUG(msg) ANCHOR_DEBUG("PersistenceGateway", msg)

// Controllers
#define COMBAT_CRITICAL(msg) ANCHOR_CRITICAL("CombatController", msg)
#define COMBAT_ERROR(msg) ANCHOR_ERROR("CombatController", msg)
#define COMBAT_WARN(msg) ANCHOR_WARN("CombatController", msg)
#define COMBAT_INFO(msg) ANCHOR_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) ANCHOR_DEBUG("CombatController", msg)

#define TICKER_CRITICAL(msg) ANCHOR_CRITICAL("AttackTicker", msg)
#define TICKER_ERROR(msg) ANCHOR_ERROR("AttackTicker", msg)
#define TICKER_WARN(msg) ANCHOR_WARN("AttackTicker", msg)
#define TICKER_INFO(msg) ANCHOR_INFO("AttackTicker", msg)
#define TICKER_DEBUG(msg) ANCHOR_DEBUG("AttackTicker", msg)

#define PURSUIT_CRITICAL(msg) ANCHOR_CRITICAL("PursuitController", msg)
#define PURSUIT_ERROR(msg) ANCHOR_ERROR("PursuitController", msg)
#define PURSUIT_WARN(msg) ANCHOR_WARN("PursuitController", msg)
#define PURSUIT_INFO(msg) ANCHOR_INFO("PursuitController", msg)
#define PURSUIT_DEBUG(msg) ANCHOR_DEBUG("PursuitController", msg)

#define WEATHER_CRITICAL(msg) ANCHOR_CRITICAL("WeatherController", msg)
#define WEATHER_ERROR(msg) ANCHOR_ERROR("WeatherController", msg)
#define WEATHER_WARN(msg) ANCHOR_WARN("WeatherController", msg)
#define WEATHER_INFO(msg) ANCHOR_INFO("WeatherController", msg)
#define WEATHER_DEBUG(msg) ANCHOR_DEBUG("WeatherController", msg)

#define UPKEEP_CRITICAL(msg) ANCHOR_CRITICAL("UpkeepController", msg)
#define UPKEEP_ERROR(msg) ANCHOR_ERROR("UpkeepController", msg)
#define UPKEEP_WARN(msg) ANCHOR_WARN("UpkeepController", msg)
#define UPKEEP_INFO(msg) ANCHOR_INFO("UpkeepController", msg)
#define UPKEEP_DEBUG(msg) ANCHOR_DEBUG("UpkeepController", msg)

} // namespace AnchorMud

#endif // LOGGER_HPP

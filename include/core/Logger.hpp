/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for serialised console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialised console output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace DelveEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (invariant violations)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds, written straight to the console
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
    printf("Delve Engine - [%s] %s: %s\n", system, getLevelString(level),
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

// Debug build macros - full functionality
#define DELVE_CRITICAL(system, msg)                                            \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::CRITICAL, system, msg)
#define DELVE_ERROR(system, msg)                                               \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::ERROR_LEVEL, system, msg)
#define DELVE_WARN(system, msg)                                                \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::WARNING, system, msg)
#define DELVE_INFO(system, msg)                                                \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::INFO, system, msg)
#define DELVE_DEBUG(system, msg)                                               \
  DelveEngine::Logger::Log(DelveEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file (see Logger.cpp)
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

#define DELVE_CRITICAL(system, msg)                                            \
  DelveEngine::Logger::Log("CRITICAL", system, msg)

#define DELVE_ERROR(system, msg)                                               \
  DelveEngine::Logger::Log("ERROR", system, msg)

#define DELVE_WARN(system, msg) ((void)0)  // Zero overhead
#define DELVE_INFO(system, msg) ((void)0)  // Zero overhead
#define DELVE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each kernel system

#define ENTITY_CRITICAL(msg) DELVE_CRITICAL("EntityStorage", msg)
#define ENTITY_ERROR(msg) DELVE_ERROR("EntityStorage", msg)
#define ENTITY_WARN(msg) DELVE_WARN("EntityStorage", msg)
#define ENTITY_INFO(msg) DELVE_INFO("EntityStorage", msg)
#define ENTITY_DEBUG(msg) DELVE_DEBUG("EntityStorage", msg)

#define SPATIAL_CRITICAL(msg) DELVE_CRITICAL("SpatialTable", msg)
#define SPATIAL_ERROR(msg) DELVE_ERROR("SpatialTable", msg)
#define SPATIAL_WARN(msg) DELVE_WARN("SpatialTable", msg)
#define SPATIAL_INFO(msg) DELVE_INFO("SpatialTable", msg)
#define SPATIAL_DEBUG(msg) DELVE_DEBUG("SpatialTable", msg)

#define VISIBILITY_CRITICAL(msg) DELVE_CRITICAL("Visibility", msg)
#define VISIBILITY_ERROR(msg) DELVE_ERROR("Visibility", msg)
#define VISIBILITY_WARN(msg) DELVE_WARN("Visibility", msg)
#define VISIBILITY_INFO(msg) DELVE_INFO("Visibility", msg)
#define VISIBILITY_DEBUG(msg) DELVE_DEBUG("Visibility", msg)

#define BEHAVIOUR_CRITICAL(msg) DELVE_CRITICAL("Behaviour", msg)
#define BEHAVIOUR_ERROR(msg) DELVE_ERROR("Behaviour", msg)
#define BEHAVIOUR_WARN(msg) DELVE_WARN("Behaviour", msg)
#define BEHAVIOUR_INFO(msg) DELVE_INFO("Behaviour", msg)
#define BEHAVIOUR_DEBUG(msg) DELVE_DEBUG("Behaviour", msg)

#define WORLD_CRITICAL(msg) DELVE_CRITICAL("World", msg)
#define WORLD_ERROR(msg) DELVE_ERROR("World", msg)
#define WORLD_WARN(msg) DELVE_WARN("World", msg)
#define WORLD_INFO(msg) DELVE_INFO("World", msg)
#define WORLD_DEBUG(msg) DELVE_DEBUG("World", msg)

#define TERRAIN_CRITICAL(msg) DELVE_CRITICAL("TerrainGenerator", msg)
#define TERRAIN_ERROR(msg) DELVE_ERROR("TerrainGenerator", msg)
#define TERRAIN_WARN(msg) DELVE_WARN("TerrainGenerator", msg)
#define TERRAIN_INFO(msg) DELVE_INFO("TerrainGenerator", msg)
#define TERRAIN_DEBUG(msg) DELVE_DEBUG("TerrainGenerator", msg)

#define GAMESTATE_CRITICAL(msg) DELVE_CRITICAL("GameState", msg)
#define GAMESTATE_ERROR(msg) DELVE_ERROR("GameState", msg)
#define GAMESTATE_WARN(msg) DELVE_WARN("GameState", msg)
#define GAMESTATE_INFO(msg) DELVE_INFO("GameState", msg)
#define GAMESTATE_DEBUG(msg) DELVE_DEBUG("GameState", msg)

#define SETTINGS_CRITICAL(msg) DELVE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) DELVE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) DELVE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) DELVE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) DELVE_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define DELVE_ENABLE_BENCHMARK_MODE()                                          \
  DelveEngine::Logger::SetBenchmarkMode(true)
#define DELVE_DISABLE_BENCHMARK_MODE()                                         \
  DelveEngine::Logger::SetBenchmarkMode(false)

} // namespace DelveEngine

#endif // LOGGER_HPP

#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cassert>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace SimPool {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Engine, Evolution, Network, Orchestrator, Ppo, Router, Scheduler, Unit };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Engine:
            return "engine";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Network:
            return "network";
        case LogChannel::Orchestrator:
            return "orchestrator";
        case LogChannel::Ppo:
            return "ppo";
        case LogChannel::Router:
            return "router";
        case LogChannel::Scheduler:
            return "scheduler";
        case LogChannel::Unit:
            return "unit";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for each subsystem so router or unit traffic can be
 * traced without flooding the console with trainer output.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log pattern (e.g., "cli", "test")
     * @param consoleToStderr Send console output to stderr instead of stdout
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath> if not found.
     * @return true if config was loaded successfully, false if already initialized
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "router:trace,unit:debug"
     *   "*:off,ppo:info" - Disable all except ppo
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers(spdlog::level::level_enum level);

    /**
     * @brief Load JSON config from file, with .local override support.
     * Creates default config file if neither exists.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static nlohmann::json defaultConfig();
    static bool createDefaultConfigFile(const std::string& path);

    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static void installDefaultLogger(
        const std::string& componentName,
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        bool consoleToStderr);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros from other libraries.
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::SimPool::LoggingChannels::get(::SimPool::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::SimPool::LoggingChannels::get(::SimPool::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::SimPool::LoggingChannels::get(::SimPool::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::SimPool::LoggingChannels::get(::SimPool::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::SimPool::LoggingChannels::get(::SimPool::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace SimPool

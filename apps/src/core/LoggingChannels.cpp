#include "LoggingChannels.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace SimPool {

namespace {

constexpr const char* kLogFile = "simpool.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

// Unit threads may log before main() has finished initializing.
std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool>& initializedFlag()
{
    static std::atomic<bool> flag{ false };
    return flag;
}

std::string channelPattern(const std::string& componentName)
{
    return componentName == "default"
        ? std::string(kBasePattern)
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
}

std::string trim(std::string value)
{
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);
    return value;
}

} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    spdlog::sink_ptr consoleSink;
    if (consoleToStderr) {
        consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };

    const std::string pattern = channelPattern(componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    installDefaultLogger(componentName, consoleLevel, fileLevel, consoleToStderr);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    initializedFlag().store(true);
    SLOG_DEBUG("LoggingChannels initialized");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initializedFlag().load()) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (const auto channel : { LogChannel::Engine,
                                LogChannel::Evolution,
                                LogChannel::Network,
                                LogChannel::Orchestrator,
                                LogChannel::Ppo,
                                LogChannel::Router,
                                LogChannel::Scheduler,
                                LogChannel::Unit }) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    applyConfig(config, componentName);

    initialized_ = true;
    initializedFlag().store(true);
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" }, { "stderr", false } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "engine", "info" },
            { "evolution", "info" },
            { "network", "info" },
            { "orchestrator", "info" },
            { "ppo", "info" },
            { "router", "info" },
            { "scheduler", "info" },
            { "unit", "info" } } }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create config file, using built-in defaults");
        }
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open config file {}, using built-in defaults", pathToUse);
            return defaultConfig();
        }
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse config file {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string pattern = channelPattern(componentName);
    int flushIntervalMs = 1000;
    bool consoleToStderr = false;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
            if (defaults.contains("pattern") && componentName == "default") {
                pattern = defaults["pattern"].get<std::string>();
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;
    try {
        const nlohmann::json sinksConfig =
            config.contains("sinks") ? config["sinks"] : nlohmann::json::object();

        const auto consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            consoleToStderr = consoleCfg.value("stderr", false);
            spdlog::sink_ptr consoleSink;
            if (consoleToStderr) {
                consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            }
            else {
                consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            }
            consoleSink->set_level(parseLevelString(consoleCfg.value("level", "info")));
            sinks.push_back(consoleSink);
        }

        const auto fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            const std::string path = fileCfg.value("path", std::string(kLogFile));
            spdlog::sink_ptr fileSink;
            // Use rotating sink if max_size_mb is specified, otherwise basic sink.
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path, maxSizeMB * 1024 * 1024, maxFiles);
            }
            else {
                fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, fileCfg.value("truncate", true));
            }
            fileSink->set_level(parseLevelString(fileCfg.value("level", "debug")));
            sinks.push_back(fileSink);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(consoleLevel);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(componentName, consoleLevel, fileLevel, consoleToStderr);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_DEBUG("LoggingChannels initialized from config");
}

void LoggingChannels::installDefaultLogger(
    const std::string& componentName,
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    bool consoleToStderr)
{
    // Separate sinks so the default logger's pattern doesn't affect channel loggers.
    spdlog::sink_ptr consoleSink;
    if (consoleToStderr) {
        consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    fileSink->set_level(fileLevel);

    // Omits channel name to avoid redundancy.
    const std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
    consoleSink->set_pattern(defaultPattern);
    fileSink->set_pattern(defaultPattern);

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { consoleSink, fileSink };
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);

    spdlog::set_default_logger(defaultLogger);
}

} // namespace SimPool

#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace SimPool {

/**
 * @brief Finds and parses JSON configuration files.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/simpool/ (user overrides)
 * 4. /etc/simpool/ (system defaults)
 *
 * At each location <name>.local replaces <name> entirely when present.
 *
 * Config structs are decoded through ADL from_json; keys missing from the file
 * keep the struct's member defaults.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    /**
     * @brief Load one top-level section of a composite config file.
     * A missing section yields a default-constructed T.
     */
    template <typename T>
    static Result<T, std::string> loadSection(
        const std::string& filename, const std::string& section);

    template <typename T>
    static Result<T, std::string> parse(const nlohmann::json& json, const std::string& context);

    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readJsonFile(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const nlohmann::json& json, const std::string& context)
{
    try {
        T config;
        // Unqualified call so from_json is found by ADL.
        from_json(json, config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + context + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return parse<T>(jsonResult.value(), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadSection(
    const std::string& filename, const std::string& section)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    const auto& root = jsonResult.value();
    if (!root.is_object() || !root.contains(section)) {
        return Result<T, std::string>::okay(T{});
    }
    return parse<T>(root.at(section), filename + ":" + section);
}

} // namespace SimPool

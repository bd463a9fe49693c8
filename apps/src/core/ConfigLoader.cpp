#include "ConfigLoader.h"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace SimPool {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "simpool");
    }

    paths.emplace_back("/etc/simpool");

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }

    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJsonFile(const std::filesystem::path& path)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    try {
        if (std::filesystem::file_size(path) == 0) {
            std::string error = "Empty config file: " + path.string();
            spdlog::warn("ConfigLoader: {}", error);
            return JsonResult::error(error);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            std::string error = "Cannot open config file: " + path.string();
            spdlog::warn("ConfigLoader: {}", error);
            return JsonResult::error(error);
        }

        return JsonResult::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }
    catch (const std::exception& e) {
        std::string error = "Error reading " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        std::string error = "Config file not found: " + filename;
        spdlog::debug("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    spdlog::info("ConfigLoader: Loading config from {}", path->string());
    return readJsonFile(path.value());
}

} // namespace SimPool

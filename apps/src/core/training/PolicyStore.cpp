#include "PolicyStore.h"
#include "Mlp.h"
#include "core/LoggingChannels.h"
#include "core/training/evolution/GenomePolicy.h"
#include "core/training/evolution/PopulationTrainer.h"
#include "core/training/ppo/GaussianPolicy.h"
#include "core/training/ppo/PpoTrainer.h"

#include <chrono>
#include <ctime>
#include <fstream>

namespace SimPool {

StoredPolicy PolicyStore::fromPpo(const Ppo::GaussianPolicy& policy, int updates, double meanReward)
{
    StoredPolicy stored;
    stored.kind = "ppo";
    stored.layerSizes = policy.network().layerSizes();
    stored.parameters = policy.network().parameters();
    stored.logStd = policy.logStd();
    stored.generation = updates;
    stored.fitness = meanReward;
    return stored;
}

StoredPolicy PolicyStore::fromChampion(const Champion& champion, const std::vector<int>& layerSizes)
{
    StoredPolicy stored;
    stored.kind = "genome";
    stored.layerSizes = layerSizes;
    stored.parameters = champion.genome.weights;
    stored.generation = champion.generation;
    stored.fitness = champion.fitness;
    return stored;
}

Result<std::monostate, std::string> PolicyStore::save(
    StoredPolicy policy, const std::filesystem::path& path)
{
    if (policy.savedAt.empty()) {
        policy.savedAt = timestamp();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<std::monostate, std::string>::error(
                "Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<std::monostate, std::string>::error(
            "Cannot open " + path.string() + " for writing");
    }
    file << toJson(policy).dump(2) << '\n';
    if (!file) {
        return Result<std::monostate, std::string>::error("Failed writing " + path.string());
    }

    SLOG_INFO(
        "Saved {} policy ({} parameters) to {}",
        policy.kind,
        policy.parameters.size(),
        path.string());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Result<StoredPolicy, std::string> PolicyStore::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<StoredPolicy, std::string>::error("Cannot open " + path.string());
    }

    nlohmann::json json;
    try {
        file >> json;
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<StoredPolicy, std::string>::error(
            "JSON parse error in " + path.string() + ": " + e.what());
    }
    return fromJson(json);
}

nlohmann::json PolicyStore::toJson(const StoredPolicy& policy)
{
    nlohmann::json json{ { "kind", policy.kind },
                         { "layerSizes", policy.layerSizes },
                         { "parameters", policy.parameters },
                         { "metadata",
                           { { "generation", policy.generation },
                             { "fitness", policy.fitness },
                             { "savedAt", policy.savedAt } } } };
    if (policy.kind == "ppo") {
        json["logStd"] = policy.logStd;
    }
    return json;
}

Result<StoredPolicy, std::string> PolicyStore::fromJson(const nlohmann::json& json)
{
    using LoadResult = Result<StoredPolicy, std::string>;

    StoredPolicy policy;
    try {
        policy.kind = json.at("kind").get<std::string>();
        policy.layerSizes = json.at("layerSizes").get<std::vector<int>>();
        policy.parameters = json.at("parameters").get<std::vector<double>>();
        policy.logStd = json.value("logStd", std::vector<double>{});
        if (json.contains("metadata")) {
            const auto& metadata = json.at("metadata");
            policy.generation = metadata.value("generation", 0);
            policy.fitness = metadata.value("fitness", 0.0);
            policy.savedAt = metadata.value("savedAt", std::string{});
        }
    }
    catch (const nlohmann::json::exception& e) {
        return LoadResult::error(std::string("Malformed policy file: ") + e.what());
    }

    if (policy.kind != "ppo" && policy.kind != "genome") {
        return LoadResult::error("Unknown policy kind '" + policy.kind + "'");
    }
    if (policy.layerSizes.size() < 2) {
        return LoadResult::error("layerSizes needs an input and an output layer");
    }
    for (int size : policy.layerSizes) {
        if (size <= 0) {
            return LoadResult::error("layerSizes must be positive");
        }
    }

    const size_t expected = Mlp::parameterCount(policy.layerSizes);
    if (policy.parameters.size() != expected) {
        return LoadResult::error(
            "Parameter count " + std::to_string(policy.parameters.size())
            + " does not match layer sizes (expected " + std::to_string(expected) + ")");
    }

    if (policy.kind == "ppo") {
        if (policy.layerSizes.size() != 4 || policy.layerSizes[1] != policy.layerSizes[2]) {
            return LoadResult::error("PPO policies have two hidden layers of equal width");
        }
        if (policy.logStd.size() != static_cast<size_t>(policy.layerSizes.back())) {
            return LoadResult::error("logStd size does not match the action size");
        }
    }

    return LoadResult::okay(std::move(policy));
}

Result<std::shared_ptr<const ActionPolicy>, std::string> PolicyStore::makePolicy(
    const StoredPolicy& policy)
{
    using PolicyResult = Result<std::shared_ptr<const ActionPolicy>, std::string>;

    try {
        if (policy.kind == "genome") {
            return PolicyResult::okay(std::make_shared<const GenomePolicy>(
                Genome(policy.parameters), policy.layerSizes));
        }

        Ppo::GaussianPolicy actor(
            static_cast<size_t>(policy.layerSizes.front()),
            static_cast<size_t>(policy.layerSizes.back()),
            policy.layerSizes[1],
            0.0,
            -5.0,
            2.0);
        actor.network().setParameters(policy.parameters);
        actor.setLogStd(policy.logStd);
        return PolicyResult::okay(std::make_shared<const Ppo::GaussianMeanPolicy>(
            std::move(actor), Ppo::StateExtractor(static_cast<size_t>(policy.layerSizes.front()))));
    }
    catch (const std::invalid_argument& e) {
        return PolicyResult::error(std::string("Cannot build policy: ") + e.what());
    }
}

std::string PolicyStore::timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

} // namespace SimPool

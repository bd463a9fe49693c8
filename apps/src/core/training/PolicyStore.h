#pragma once

#include "ActionPolicy.h"
#include "core/Result.h"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace SimPool {

struct Champion;

namespace Ppo {
class GaussianPolicy;
}

/**
 * A saved policy: network shape, flat parameters and provenance.
 */
struct StoredPolicy {
    std::string kind; // "ppo" or "genome".
    std::vector<int> layerSizes;
    std::vector<double> parameters;
    std::vector<double> logStd; // PPO only.

    int generation = 0;
    double fitness = 0.0;
    std::string savedAt;
};

/**
 * @brief JSON persistence for trained policies.
 *
 * Loading validates the kind, the layer sizes and that the parameter count
 * matches them, so a loaded policy can always be turned into an ActionPolicy.
 */
class PolicyStore {
public:
    static StoredPolicy fromPpo(const Ppo::GaussianPolicy& policy, int updates, double meanReward);
    static StoredPolicy fromChampion(const Champion& champion, const std::vector<int>& layerSizes);

    static Result<std::monostate, std::string> save(
        StoredPolicy policy, const std::filesystem::path& path);
    static Result<StoredPolicy, std::string> load(const std::filesystem::path& path);

    static nlohmann::json toJson(const StoredPolicy& policy);
    static Result<StoredPolicy, std::string> fromJson(const nlohmann::json& json);

    static Result<std::shared_ptr<const ActionPolicy>, std::string> makePolicy(
        const StoredPolicy& policy);

private:
    static std::string timestamp();
};

} // namespace SimPool

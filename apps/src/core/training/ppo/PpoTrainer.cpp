#include "PpoTrainer.h"
#include "PpoMath.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace SimPool::Ppo {

const char* Phase::toString(EnumType phase)
{
    switch (phase) {
        case EnumType::CollectingRollout:
            return "CollectingRollout";
        case EnumType::ComputingAdvantages:
            return "ComputingAdvantages";
        case EnumType::UpdatingPolicy:
            return "UpdatingPolicy";
    }
    return "Unknown";
}

PpoTrainer::PpoTrainer(PpoConfig config, size_t actionSize, RewardFunction rewardFunction)
    : config_(std::move(config)),
      extractor_(static_cast<size_t>(config_.stateSize)),
      rewardFunction_(std::move(rewardFunction)),
      rng_(config_.seed),
      actorOptimizer_(config_.learningRate),
      logStdOptimizer_(config_.learningRate),
      criticOptimizer_(config_.learningRate)
{
    if (auto problem = validate(config_)) {
        throw std::invalid_argument("Invalid PPO config: " + *problem);
    }
    if (actionSize == 0) {
        throw std::invalid_argument("PPO needs at least one actuator");
    }

    policy_ = GaussianPolicy(
        extractor_.size(),
        actionSize,
        config_.hiddenSize,
        config_.initialLogStd,
        config_.minLogStd,
        config_.maxLogStd);
    policy_.initialize(rng_);

    critic_ = Mlp(
        { config_.stateSize, config_.hiddenSize, config_.hiddenSize, 1 },
        Activation::Tanh,
        Activation::Linear);
    critic_.initialize(rng_);

    LOG_INFO(
        Ppo,
        "PPO trainer: state {}, actions {}, hidden {}x2, rollout {}, minibatch {}",
        extractor_.size(),
        actionSize,
        config_.hiddenSize,
        config_.rolloutSize,
        config_.minibatchSize);
}

void PpoTrainer::observe(const StepSample& sample, ActionSink& sink)
{
    const std::vector<double> state = extractor_.extract(sample.observation);

    double reward = std::isfinite(sample.envReward) ? sample.envReward : 0.0;
    bool done = sample.done;
    bool rewardRequestedReset = false;

    auto pendingIt = pending_.find(sample.envId);
    if (pendingIt != pending_.end()) {
        PendingStep previous = std::move(pendingIt->second);
        pending_.erase(pendingIt);

        if (rewardFunction_) {
            const auto evaluation = evaluateRewardSafely(
                rewardFunction_, makeRewardState(sample.observation), previous.action);
            if (evaluation.faulted) {
                rewardFaults_++;
                LOG_WARN(
                    Ppo, "Reward function fault for env {}, using 0: {}", sample.envId, evaluation.error);
            }
            reward = evaluation.reward;
            if (evaluation.done && !done) {
                done = true;
                rewardRequestedReset = true;
            }
        }

        episodeRewards_[sample.envId] += reward;

        if (!evaluationMode_) {
            Transition transition;
            transition.state = std::move(previous.state);
            transition.action = std::move(previous.action);
            transition.reward = reward;
            transition.nextState = state;
            transition.done = done;
            transition.logProb = previous.logProb;
            transition.value = previous.value;
            buffer_.add(sample.envId, std::move(transition));
        }
    }

    if (done) {
        completedEpisodes_++;
        lastEpisodeReward_ = episodeRewards_[sample.envId];
        episodeRewards_[sample.envId] = 0.0;
        LOG_DEBUG(
            Ppo,
            "Env {} episode done, reward {:.3f} ({} episodes)",
            sample.envId,
            lastEpisodeReward_,
            completedEpisodes_);

        // The orchestrator resets on an environment done; a reward-driven done is ours to request.
        if (rewardRequestedReset && !sink.requestReset(sample.envId)) {
            LOG_WARN(Ppo, "Reset request for env {} was not accepted", sample.envId);
        }
        maybeUpdate();
        return;
    }

    maybeUpdate();

    ensureFiniteActor();
    PendingStep next;
    next.state = state;
    if (evaluationMode_) {
        next.action = policy_.mean(state);
        for (double& a : next.action) {
            a = std::clamp(a, -GaussianPolicy::kActionLimit, GaussianPolicy::kActionLimit);
        }
    }
    else {
        auto drawn = policy_.sample(state, rng_);
        next.action = std::move(drawn.action);
        next.logProb = drawn.logProb;
    }
    next.value = value(state);

    if (!sink.setAction(sample.envId, next.action)) {
        LOG_WARN(Ppo, "Env {} rejected the next action", sample.envId);
        return;
    }
    pending_[sample.envId] = std::move(next);
}

void PpoTrainer::onStepFault(int envId, const Observation& lastObservation, ActionSink& sink)
{
    if (pending_.erase(envId) > 0) {
        LOG_DEBUG(Ppo, "Env {} step failed, dropping its pending action", envId);
    }
    observe(StepSample{ envId, lastObservation, 0.0, false }, sink);
}

std::optional<UpdateStats> PpoTrainer::maybeUpdate()
{
    if (evaluationMode_ || buffer_.size() < static_cast<size_t>(config_.rolloutSize)) {
        return std::nullopt;
    }
    return update();
}

std::optional<UpdateStats> PpoTrainer::update()
{
    if (buffer_.empty()) {
        return std::nullopt;
    }

    phase_ = Phase::EnumType::ComputingAdvantages;
    computeAdvantages();

    phase_ = Phase::EnumType::UpdatingPolicy;
    UpdateStats stats = optimize();

    buffer_.clear();
    phase_ = Phase::EnumType::CollectingRollout;

    LOG_INFO(
        Ppo,
        "Update {}: {} transitions, policy loss {:.4f}, value loss {:.4f}, entropy {:.3f}, "
        "mean reward {:.4f}, grad norm {:.3f}",
        stats.update,
        stats.transitions,
        stats.policyLoss,
        stats.valueLoss,
        stats.entropy,
        stats.meanReward,
        stats.gradNorm);
    return stats;
}

void PpoTrainer::setEvaluationMode(bool enabled)
{
    evaluationMode_ = enabled;
    pending_.clear();
}

double PpoTrainer::value(const std::vector<double>& state) const
{
    return critic_.forward(state)[0];
}

std::shared_ptr<const ActionPolicy> PpoTrainer::snapshotPolicy() const
{
    return std::make_shared<const GaussianMeanPolicy>(policy_, extractor_);
}

bool PpoTrainer::ensureFiniteActor()
{
    if (policy_.allFinite()) {
        return false;
    }
    LOG_ERROR(Ppo, "Actor parameters diverged (non-finite), reinitializing actor");
    resetActor();
    return true;
}

void PpoTrainer::computeAdvantages()
{
    for (auto& [envId, trajectory] : buffer_.trajectories()) {
        if (trajectory.empty()) {
            continue;
        }
        std::vector<double> rewards;
        std::vector<double> values;
        std::vector<bool> dones;
        rewards.reserve(trajectory.size());
        values.reserve(trajectory.size());
        dones.reserve(trajectory.size());
        for (const auto& transition : trajectory) {
            rewards.push_back(transition.reward);
            values.push_back(transition.value);
            dones.push_back(transition.done);
        }

        const auto& last = trajectory.back();
        const double lastValue = last.done ? 0.0 : value(last.nextState);
        const auto gae = computeGae(rewards, values, dones, lastValue, config_.gamma, config_.lambda);

        for (size_t t = 0; t < trajectory.size(); ++t) {
            trajectory[t].advantage = gae.advantages[t];
            trajectory[t].valueTarget = gae.returns[t];
        }
    }

    auto all = buffer_.flatten();
    std::vector<double> advantages;
    advantages.reserve(all.size());
    for (const auto* transition : all) {
        advantages.push_back(transition->advantage.value_or(0.0));
    }
    standardize(advantages, config_.advantageEpsilon);
    for (size_t i = 0; i < all.size(); ++i) {
        all[i]->advantage = advantages[i];
    }
}

UpdateStats PpoTrainer::optimize()
{
    auto all = buffer_.flatten();
    const size_t count = all.size();

    UpdateStats stats;
    stats.update = ++updateCount_;
    stats.transitions = count;
    for (const auto* transition : all) {
        stats.meanReward += transition->reward;
    }
    stats.meanReward /= static_cast<double>(count);

    std::vector<size_t> order(count);
    std::iota(order.begin(), order.end(), 0);

    const size_t actionSize = policy_.actionSize();
    const size_t minibatch = static_cast<size_t>(config_.minibatchSize);

    std::vector<double> actorGrad(policy_.network().parameters().size());
    std::vector<double> logStdGrad(actionSize);
    std::vector<double> criticGrad(critic_.parameters().size());

    double policyLossSum = 0.0;
    double valueLossSum = 0.0;
    double gradNormSum = 0.0;
    int batches = 0;

    for (int epoch = 0; epoch < config_.epochs; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng_);

        for (size_t start = 0; start < count; start += minibatch) {
            const size_t end = std::min(start + minibatch, count);
            const double scale = 1.0 / static_cast<double>(end - start);

            std::fill(actorGrad.begin(), actorGrad.end(), 0.0);
            std::fill(logStdGrad.begin(), logStdGrad.end(), 0.0);
            std::fill(criticGrad.begin(), criticGrad.end(), 0.0);

            const std::vector<double> logStd = policy_.logStd();
            double batchPolicyLoss = 0.0;
            double batchValueLoss = 0.0;

            for (size_t k = start; k < end; ++k) {
                const Transition& transition = *all[order[k]];
                const double advantage = transition.advantage.value_or(0.0);
                const double target = transition.valueTarget.value_or(transition.value);

                // Actor.
                Mlp::Trace actorTrace;
                const auto mean = policy_.mean(transition.state, actorTrace);
                const double newLogProb = policy_.logProb(transition.action, mean);
                const double ratio = std::exp(newLogProb - transition.logProb);

                batchPolicyLoss -= clippedSurrogate(ratio, advantage, config_.clipEpsilon);

                // dLoss/dlogProb = -dSurrogate/dRatio * ratio.
                const double dLogProb =
                    -clippedSurrogateGradient(ratio, advantage, config_.clipEpsilon) * ratio * scale;
                if (dLogProb != 0.0) {
                    std::vector<double> dMean(actionSize);
                    for (size_t j = 0; j < actionSize; ++j) {
                        const double variance = std::exp(2.0 * logStd[j]);
                        const double diff = transition.action[j] - mean[j];
                        dMean[j] = dLogProb * diff / variance;
                        logStdGrad[j] += dLogProb * (diff * diff / variance - 1.0);
                    }
                    policy_.network().backward(actorTrace, dMean, actorGrad);
                }

                // Critic.
                Mlp::Trace criticTrace;
                const double predicted = critic_.forward(transition.state, criticTrace)[0];
                const double error = predicted - target;
                batchValueLoss += config_.valueCoefficient * error * error;
                critic_.backward(
                    criticTrace, { 2.0 * config_.valueCoefficient * error * scale }, criticGrad);
            }

            // Entropy bonus: d(-c_ent * H)/d logStd_j = -c_ent.
            for (double& g : logStdGrad) {
                g -= config_.entropyCoefficient;
            }

            gradNormSum +=
                clipGradientNorm({ &actorGrad, &logStdGrad, &criticGrad }, config_.maxGradNorm);

            actorOptimizer_.step(policy_.network().parameters(), actorGrad);
            logStdOptimizer_.step(policy_.rawLogStd(), logStdGrad);
            policy_.clampLogStd();
            criticOptimizer_.step(critic_.parameters(), criticGrad);

            policyLossSum += batchPolicyLoss * scale;
            valueLossSum += batchValueLoss * scale;
            batches++;
        }
    }

    if (batches > 0) {
        stats.policyLoss = policyLossSum / batches;
        stats.valueLoss = valueLossSum / batches;
        stats.gradNorm = gradNormSum / batches;
    }
    stats.entropy = policy_.entropy();

    ensureFiniteActor();
    return stats;
}

void PpoTrainer::resetActor()
{
    policy_.initialize(rng_);
    actorOptimizer_.reset();
    logStdOptimizer_.reset();
    reinitializations_++;
}

GaussianMeanPolicy::GaussianMeanPolicy(GaussianPolicy policy, StateExtractor extractor)
    : policy_(std::move(policy)), extractor_(extractor)
{}

std::vector<double> GaussianMeanPolicy::act(const Observation& observation) const
{
    return policy_.mean(extractor_.extract(observation));
}

} // namespace SimPool::Ppo

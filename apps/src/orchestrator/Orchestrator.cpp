#include "Orchestrator.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace SimPool {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::string joinIds(const std::vector<int>& ids)
{
    std::string text;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += std::to_string(ids[i]);
    }
    return text;
}

OrchestratorConfig validated(OrchestratorConfig config)
{
    if (auto problem = validate(config)) {
        throw std::invalid_argument("Invalid orchestrator config: " + *problem);
    }
    return config;
}

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, EngineFactory engineFactory)
    : config_(validated(std::move(config))),
      router_(std::chrono::milliseconds(config_.requestTimeoutMs)),
      rng_(config_.seed)
{
    SimulationUnitConfig unitConfig;
    unitConfig.maxEpisodeSteps = config_.maxEpisodeSteps;
    unitConfig.engineFactory = std::move(engineFactory);

    for (int unitId = 0; unitId < config_.numUnits; ++unitId) {
        units_.push_back(std::make_unique<SimulationUnit>(
            unitId, unitConfig, [this, unitId](std::vector<std::byte> frame) {
                onUnitFrame(unitId, std::move(frame));
            }));
    }

    for (int envId = 0; envId < config_.numEnvironments; ++envId) {
        EnvironmentRecord record;
        record.state.id = envId;
        record.state.unitId =
            unitForEnvironment(envId, config_.numEnvironments, config_.numUnits);
        environments_.emplace(envId, std::move(record));
    }

    auto buffered = [this](const UnitProtocol::Reply& reply) { bufferReply(reply); };
    router_.setHandler(UnitProtocol::StepResult::kMessageType, buffered);
    router_.setHandler(UnitProtocol::ResetDone::kMessageType, buffered);
    router_.setHandler(UnitProtocol::Error::kMessageType, buffered);
    router_.setHandler(UnitProtocol::ForceApplied::kMessageType, [](const UnitProtocol::Reply& reply) {
        const auto& ack = std::get<UnitProtocol::ForceApplied>(reply);
        LOG_DEBUG(
            Orchestrator,
            "Env {} body {} force {}",
            ack.envId,
            ack.bodyId,
            ack.active ? "set" : "cleared");
    });
    router_.setHandler(UnitProtocol::StateReport::kMessageType, [](const UnitProtocol::Reply& reply) {
        const auto& report = std::get<UnitProtocol::StateReport>(reply);
        LOG_DEBUG(
            Orchestrator,
            "Env {} state: step {}, total reward {:.3f}",
            report.envId,
            report.info.stepCount,
            report.info.totalReward);
    });

    scheduler_ = std::make_unique<TickScheduler>(
        config_.physicsHz,
        config_.renderHz,
        [this]() { physicsTick(); },
        [this]() { consumptionTick(); });

    LOG_INFO(
        Orchestrator,
        "Created {} {} environments across {} units",
        config_.numEnvironments,
        Environment::toString(config_.environmentType),
        config_.numUnits);
}

Orchestrator::~Orchestrator()
{
    terminate();
}

int Orchestrator::unitForEnvironment(int envId, int numEnvironments, int numUnits)
{
    const int perUnit = (numEnvironments + numUnits - 1) / numUnits;
    return envId / perUnit;
}

Orchestrator::VoidResult Orchestrator::initialize()
{
    if (terminated_) {
        return VoidResult::error(
            RequestError{ RequestError::Kind::Terminated, "orchestrator terminated" });
    }

    if (!started_.exchange(true)) {
        router_.start();
        for (auto& unit : units_) {
            unit->start();
        }
    }

    const std::string envType = Environment::toString(config_.environmentType);
    std::vector<std::pair<int, MessageRouter::Ticket>> tickets;
    for (int envId : environmentIds()) {
        auto ticket = router_.open(envId, UnitProtocol::Init::kMessageType);
        const uint64_t id = ticket.id;
        tickets.emplace_back(envId, std::move(ticket));
        if (!send(envId, id, UnitProtocol::Init{ envType, envId })) {
            router_.cancel(
                id, RequestError{ RequestError::Kind::Terminated, "unit not accepting", envId });
        }
    }

    std::vector<int> failed;
    std::string firstFailure;
    std::vector<int> acknowledged;
    for (auto& [envId, ticket] : tickets) {
        const auto result = ticket.future.get();
        std::optional<std::string> problem;
        if (result.isError()) {
            problem = describe(result.errorValue());
        }
        else {
            const auto* ack = std::get_if<UnitProtocol::Initialized>(&result.value());
            if (ack == nullptr || ack->envId != envId) {
                problem = "unexpected '" + UnitProtocol::messageType(result.value())
                    + "' reply to init";
            }
        }

        if (problem.has_value()) {
            LOG_ERROR(Orchestrator, "Env {} failed to initialize: {}", envId, *problem);
            failed.push_back(envId);
            if (firstFailure.empty()) {
                firstFailure = *problem;
            }
            std::lock_guard<std::mutex> lock(envMutex_);
            environments_.at(envId).state.lastError = *problem;
            continue;
        }
        acknowledged.push_back(envId);
    }

    // Mark first so that queryState accepts the environments.
    {
        std::lock_guard<std::mutex> lock(envMutex_);
        for (int envId : acknowledged) {
            environments_.at(envId).state.initialized = true;
        }
    }

    for (int envId : acknowledged) {
        auto state = queryState(envId);
        if (state.isError()) {
            LOG_WARN(
                Orchestrator,
                "Env {} initialized but state query failed: {}",
                envId,
                describe(state.errorValue()));
            continue;
        }
        std::lock_guard<std::mutex> lock(envMutex_);
        auto& record = environments_.at(envId);
        record.state.lastObservation = std::move(state.value().observation);
        record.actuatorCount = record.state.lastObservation.actions.size();
    }

    if (!failed.empty()) {
        return VoidResult::error(RequestError{
            RequestError::Kind::InitializationFailure,
            "environments [" + joinIds(failed) + "] failed to initialize: " + firstFailure,
            failed.front() });
    }

    LOG_INFO(Orchestrator, "All {} environments initialized", acknowledged.size());
    return VoidResult::okay(std::monostate{});
}

size_t Orchestrator::physicsTick()
{
    if (terminated_) {
        return 0;
    }

    struct Pending {
        int envId;
        std::optional<std::vector<double>> action;
        Observation observation;
        size_t actuatorCount;
    };

    std::vector<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(envMutex_);
        pending.reserve(environments_.size());
        for (auto& [envId, record] : environments_) {
            if (!record.state.initialized || record.state.awaitingReset) {
                continue;
            }
            Pending entry{ envId, std::nullopt, {}, record.actuatorCount };
            if (record.queuedAction.has_value()) {
                entry.action = std::move(record.queuedAction);
                record.queuedAction.reset();
            }
            else {
                entry.observation = record.state.lastObservation;
            }
            pending.push_back(std::move(entry));
        }
    }

    const auto policy = currentPolicy();
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    size_t sent = 0;
    for (auto& entry : pending) {
        std::vector<double> action;
        if (entry.action.has_value()) {
            action = std::move(*entry.action);
        }
        else if (policy) {
            try {
                action = policy->act(entry.observation);
                for (double& value : action) {
                    value = std::clamp(
                        value + (uniform(rng_) - 0.5) * config_.policyNoise, -1.0, 1.0);
                }
            }
            catch (const std::exception& e) {
                LOG_WARN(
                    Orchestrator,
                    "Policy failed for env {}, using random action: {}",
                    entry.envId,
                    e.what());
                action = randomAction(entry.actuatorCount, config_.randomActionScale);
            }
        }
        else {
            action = randomAction(entry.actuatorCount, config_.randomActionScale);
        }

        if (send(entry.envId, 0, UnitProtocol::Step{ entry.envId, std::move(action) })) {
            sent++;
        }
    }
    return sent;
}

size_t Orchestrator::consumptionTick()
{
    std::vector<BufferedReply> drained;
    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        drained.swap(buffer_);
        stepRepliesBuffered_ = 0;
    }
    if (drained.empty()) {
        return 0;
    }

    std::vector<EnvironmentSnapshot> updates;
    std::vector<int> resets;
    size_t applied = 0;
    {
        std::lock_guard<std::mutex> lock(envMutex_);
        for (auto& entry : drained) {
            auto it = environments_.find(UnitProtocol::envIdOf(entry.reply));
            if (it == environments_.end()) {
                continue;
            }
            auto& record = it->second;
            auto& state = record.state;

            std::visit(
                Overloaded{
                    [&](UnitProtocol::StepResult& result) {
                        if (entry.generation != record.generation) {
                            LOG_TRACE(Orchestrator, "Dropping stale step result for env {}", state.id);
                            return;
                        }
                        double reward = result.reward;
                        if (!std::isfinite(reward)) {
                            LOG_WARN(Orchestrator, "Env {} reported non-finite reward, using 0", state.id);
                            reward = 0.0;
                        }
                        state.lastObservation = std::move(result.observation);
                        state.lastReward = reward;
                        state.done = result.done;
                        state.stepCount++;
                        state.episodeReward += reward;
                        state.lastError.reset();
                        if (record.actuatorCount == 0) {
                            record.actuatorCount = state.lastObservation.actions.size();
                        }
                        updates.push_back(state);
                        applied++;

                        if (result.done) {
                            state.completedEpisodes++;
                            state.lastEpisodeReward = state.episodeReward;
                            LOG_DEBUG(
                                Orchestrator,
                                "Env {} episode {} done after {} steps, reward {:.3f}",
                                state.id,
                                state.completedEpisodes,
                                state.stepCount,
                                state.episodeReward);
                            state.stepCount = 0;
                            state.episodeReward = 0.0;
                            state.awaitingReset = true;
                            record.queuedAction.reset();
                            record.generation++;
                            resets.push_back(state.id);
                        }
                    },
                    [&](UnitProtocol::ResetDone& result) {
                        if (entry.generation != record.generation) {
                            return;
                        }
                        state.lastObservation = std::move(result.observation);
                        state.lastReward = 0.0;
                        state.done = false;
                        state.stepCount = 0;
                        state.episodeReward = 0.0;
                        state.awaitingReset = false;
                        updates.push_back(state);
                        applied++;
                    },
                    [&](UnitProtocol::Error& error) {
                        state.lastError = error.error;
                        applied++;
                        if (error.command == UnitProtocol::Step::kMessageType) {
                            EnvironmentSnapshot faulted = state;
                            faulted.stepFaulted = true;
                            updates.push_back(std::move(faulted));
                        }
                    },
                    [&](auto&) {},
                },
                entry.reply);
        }
    }

    for (int envId : resets) {
        send(envId, 0, UnitProtocol::Reset{ envId });
    }

    if (!updates.empty()) {
        std::vector<UpdateCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callbacks = callbacks_;
        }
        for (const auto& snapshot : updates) {
            for (const auto& callback : callbacks) {
                try {
                    callback(snapshot);
                }
                catch (const std::exception& e) {
                    LOG_ERROR(
                        Orchestrator, "Update callback failed for env {}: {}", snapshot.id, e.what());
                }
            }
        }
    }

    return applied;
}

Result<Observation, RequestError> Orchestrator::reset(int envId)
{
    if (auto problem = checkEnvironment(envId)) {
        return Result<Observation, RequestError>::error(*problem);
    }

    {
        std::lock_guard<std::mutex> lock(envMutex_);
        auto& record = environments_.at(envId);
        record.state.awaitingReset = true;
        record.queuedAction.reset();
        record.generation++;
    }

    auto reply = request(envId, UnitProtocol::Reset{ envId });

    std::lock_guard<std::mutex> lock(envMutex_);
    auto& record = environments_.at(envId);

    if (reply.isError()) {
        record.state.lastError = describe(reply.errorValue());
        LOG_ERROR(Orchestrator, "Reset of env {} failed: {}", envId, *record.state.lastError);
        return Result<Observation, RequestError>::error(reply.errorValue());
    }

    auto* done = std::get_if<UnitProtocol::ResetDone>(&reply.value());
    if (done == nullptr) {
        return Result<Observation, RequestError>::error(RequestError{
            RequestError::Kind::UnitFault,
            "unexpected '" + UnitProtocol::messageType(reply.value()) + "' reply to reset",
            envId });
    }

    auto& state = record.state;
    state.awaitingReset = false;
    state.lastObservation = done->observation;
    state.lastReward = 0.0;
    state.done = false;
    state.stepCount = 0;
    state.episodeReward = 0.0;
    state.lastError.reset();
    record.generation++;

    return Result<Observation, RequestError>::okay(state.lastObservation);
}

Result<UnitProtocol::StateReport, RequestError> Orchestrator::queryState(int envId)
{
    using StateResult = Result<UnitProtocol::StateReport, RequestError>;
    if (auto problem = checkEnvironment(envId)) {
        return StateResult::error(*problem);
    }

    auto reply = request(envId, UnitProtocol::GetState{ envId });
    if (reply.isError()) {
        return StateResult::error(reply.errorValue());
    }
    auto* report = std::get_if<UnitProtocol::StateReport>(&reply.value());
    if (report == nullptr) {
        return StateResult::error(RequestError{
            RequestError::Kind::UnitFault,
            "unexpected '" + UnitProtocol::messageType(reply.value()) + "' reply to getState",
            envId });
    }
    return StateResult::okay(std::move(*report));
}

Orchestrator::VoidResult Orchestrator::requestReset(int envId)
{
    if (auto problem = checkEnvironment(envId)) {
        return VoidResult::error(*problem);
    }
    {
        std::lock_guard<std::mutex> lock(envMutex_);
        auto& record = environments_.at(envId);
        record.state.awaitingReset = true;
        record.state.stepCount = 0;
        record.state.episodeReward = 0.0;
        record.queuedAction.reset();
        record.generation++;
    }
    send(envId, 0, UnitProtocol::Reset{ envId });
    return VoidResult::okay(std::monostate{});
}

Orchestrator::VoidResult Orchestrator::applyForce(
    int envId, int bodyId, std::vector<double> force, std::vector<double> point)
{
    if (auto problem = checkEnvironment(envId)) {
        return VoidResult::error(*problem);
    }
    UnitProtocol::Command command =
        UnitProtocol::ApplyForce{ envId, bodyId, std::move(force), std::move(point) };
    if (auto problem = UnitProtocol::validate(command)) {
        return VoidResult::error(
            RequestError{ RequestError::Kind::InvalidArgument, *problem, envId });
    }
    send(envId, 0, command);
    return VoidResult::okay(std::monostate{});
}

Orchestrator::VoidResult Orchestrator::clearActuators(int envId)
{
    if (auto problem = checkEnvironment(envId)) {
        return VoidResult::error(*problem);
    }
    send(envId, 0, UnitProtocol::ClearActuators{ envId });
    return VoidResult::okay(std::monostate{});
}

std::optional<EnvironmentSnapshot> Orchestrator::getEnvironmentState(int envId) const
{
    std::lock_guard<std::mutex> lock(envMutex_);
    auto it = environments_.find(envId);
    if (it == environments_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

bool Orchestrator::setAction(int envId, std::vector<double> action)
{
    std::lock_guard<std::mutex> lock(envMutex_);
    auto it = environments_.find(envId);
    if (it == environments_.end()) {
        return false;
    }
    it->second.queuedAction = std::move(action);
    return true;
}

void Orchestrator::setPolicy(std::shared_ptr<const ActionPolicy> policy)
{
    std::lock_guard<std::mutex> lock(policyMutex_);
    policy_ = std::move(policy);
}

void Orchestrator::onUpdate(UpdateCallback callback)
{
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.push_back(std::move(callback));
}

bool Orchestrator::waitForStepResults(size_t count, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(bufferMutex_);
    return bufferCv_.wait_for(lock, timeout, [this, count]() {
        return terminated_.load() || stepRepliesBuffered_ >= count;
    }) && !terminated_.load();
}

std::vector<int> Orchestrator::environmentIds() const
{
    std::lock_guard<std::mutex> lock(envMutex_);
    std::vector<int> ids;
    ids.reserve(environments_.size());
    for (const auto& [envId, record] : environments_) {
        ids.push_back(envId);
    }
    return ids;
}

size_t Orchestrator::actuatorCount(int envId) const
{
    std::lock_guard<std::mutex> lock(envMutex_);
    auto it = environments_.find(envId);
    return it == environments_.end() ? 0 : it->second.actuatorCount;
}

size_t Orchestrator::bufferedCount() const
{
    std::lock_guard<std::mutex> lock(bufferMutex_);
    return buffer_.size();
}

void Orchestrator::startLoops()
{
    if (terminated_) {
        return;
    }
    scheduler_->start();
}

void Orchestrator::stopLoops()
{
    scheduler_->stop();
}

void Orchestrator::terminate()
{
    if (terminated_.exchange(true)) {
        return;
    }

    scheduler_->stop();
    for (auto& unit : units_) {
        unit->terminate();
    }
    router_.rejectAll(RequestError{ RequestError::Kind::Terminated, "orchestrator terminated" });
    router_.stop();

    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        buffer_.clear();
        stepRepliesBuffered_ = 0;
    }
    bufferCv_.notify_all();

    LOG_INFO(Orchestrator, "Terminated {} units", units_.size());
}

void Orchestrator::onUnitFrame(int unitId, std::vector<std::byte> frame)
{
    auto decoded = UnitProtocol::decodeReply(frame);
    if (decoded.isError()) {
        LOG_WARN(Network, "Unit {} sent a malformed reply: {}", unitId, decoded.errorValue());
        return;
    }
    router_.dispatch(decoded.value().id, std::move(decoded.value().reply));
}

void Orchestrator::bufferReply(const UnitProtocol::Reply& reply)
{
    const int envId = UnitProtocol::envIdOf(reply);
    bool isStepReply = std::holds_alternative<UnitProtocol::StepResult>(reply);

    if (const auto* error = std::get_if<UnitProtocol::Error>(&reply)) {
        LOG_ERROR(Orchestrator, "Unit error for env {}: {} [{}]", envId, error->error, error->stack);
        isStepReply = error->command == UnitProtocol::Step::kMessageType;
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(envMutex_);
        auto it = environments_.find(envId);
        if (it == environments_.end()) {
            LOG_WARN(
                Orchestrator,
                "Dropping '{}' reply for unknown env {}",
                UnitProtocol::messageType(reply),
                envId);
            return;
        }
        if (isStepReply && it->second.state.awaitingReset) {
            LOG_TRACE(Orchestrator, "Dropping step reply for env {} awaiting reset", envId);
            return;
        }
        generation = it->second.generation;
    }

    {
        std::lock_guard<std::mutex> lock(bufferMutex_);
        buffer_.push_back(BufferedReply{ generation, reply });
        if (isStepReply) {
            stepRepliesBuffered_++;
        }
    }
    bufferCv_.notify_all();
}

bool Orchestrator::send(int envId, uint64_t id, const UnitProtocol::Command& command)
{
    const int unitId = unitForEnvironment(envId, config_.numEnvironments, config_.numUnits);
    SIMPOOL_ASSERT(
        unitId >= 0 && static_cast<size_t>(unitId) < units_.size(),
        "Partition produced an out-of-range unit");
    if (!units_[unitId]->post(UnitProtocol::encodeCommand(id, command))) {
        LOG_DEBUG(
            Orchestrator,
            "Unit {} rejected '{}' for env {}",
            unitId,
            UnitProtocol::messageType(command),
            envId);
        return false;
    }
    return true;
}

std::optional<RequestError> Orchestrator::checkEnvironment(int envId) const
{
    if (terminated_) {
        return RequestError{ RequestError::Kind::Terminated, "orchestrator terminated", envId };
    }
    std::lock_guard<std::mutex> lock(envMutex_);
    auto it = environments_.find(envId);
    if (it == environments_.end()) {
        return RequestError{ RequestError::Kind::InvalidArgument, "unknown environment", envId };
    }
    if (!it->second.state.initialized) {
        return RequestError{ RequestError::Kind::InvalidArgument, "environment not initialized", envId };
    }
    return std::nullopt;
}

Result<UnitProtocol::Reply, RequestError> Orchestrator::request(
    int envId, const UnitProtocol::Command& command)
{
    auto ticket = router_.open(envId, UnitProtocol::messageType(command));
    if (!send(envId, ticket.id, command)) {
        router_.cancel(
            ticket.id, RequestError{ RequestError::Kind::Terminated, "unit not accepting", envId });
    }
    return ticket.future.get();
}

std::vector<double> Orchestrator::randomAction(size_t count, double scale)
{
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> action(count);
    for (double& value : action) {
        value = (uniform(rng_) - 0.5) * scale;
    }
    return action;
}

std::shared_ptr<const ActionPolicy> Orchestrator::currentPolicy() const
{
    std::lock_guard<std::mutex> lock(policyMutex_);
    return policy_;
}

} // namespace SimPool

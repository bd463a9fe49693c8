#include "SimulationUnit.h"
#include "core/LoggingChannels.h"
#include "core/network/BinaryProtocol.h"
#include "core/physics/EnvironmentType.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace SimPool {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

// Best effort: recover the correlation id of a frame that failed to decode.
uint64_t peekCorrelationId(const std::vector<std::byte>& frame)
{
    try {
        return Network::deserialize_envelope(frame).id;
    }
    catch (const std::exception&) {
        return 0;
    }
}

} // namespace

SimulationUnit::SimulationUnit(int unitId, SimulationUnitConfig config, ReplySink replySink)
    : unitId_(unitId), config_(config), replySink_(std::move(replySink))
{}

SimulationUnit::~SimulationUnit()
{
    terminate();
}

void SimulationUnit::start()
{
    if (running_.load() || stopRequested_.load()) {
        return;
    }

    running_ = true;
    worker_ = std::thread([this]() { run(); });
    LOG_DEBUG(Unit, "Unit {} started", unitId_);
}

bool SimulationUnit::post(std::vector<std::byte> frame)
{
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        if (stopRequested_) {
            return false;
        }
        inbox_.push_back(std::move(frame));
    }
    inboxCv_.notify_one();
    return true;
}

void SimulationUnit::terminate()
{
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        stopRequested_ = true;
        discarded = inbox_.size();
        inbox_.clear();
    }
    inboxCv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        LOG_DEBUG(Unit, "Unit {} terminated ({} queued frames discarded)", unitId_, discarded);
    }
    running_ = false;
}

void SimulationUnit::run()
{
    while (true) {
        std::vector<std::byte> frame;
        {
            std::unique_lock<std::mutex> lock(inboxMutex_);
            inboxCv_.wait(lock, [this]() { return stopRequested_ || !inbox_.empty(); });
            if (stopRequested_) {
                return;
            }
            frame = std::move(inbox_.front());
            inbox_.pop_front();
        }

        handleFrame(frame);
    }
}

void SimulationUnit::handleFrame(const std::vector<std::byte>& frame)
{
    auto decoded = UnitProtocol::decodeCommand(frame);
    if (decoded.isError()) {
        LOG_WARN(Unit, "Unit {} rejected frame: {}", unitId_, decoded.errorValue());
        sendReply(
            peekCorrelationId(frame),
            UnitProtocol::Error{ .envId = -1,
                                 .error = decoded.errorValue(),
                                 .stack = "unit " + std::to_string(unitId_) + " decode" });
        return;
    }

    const auto& [id, command] = decoded.value();
    const int envId = UnitProtocol::envIdOf(command);

    try {
        if (auto reply = handleCommand(command)) {
            sendReply(id, reply.value());
        }
    }
    catch (const std::exception& e) {
        const std::string type = UnitProtocol::messageType(command);
        LOG_ERROR(Unit, "Unit {} env {} failed handling '{}': {}", unitId_, envId, type, e.what());
        sendReply(
            id,
            UnitProtocol::Error{
                .envId = envId,
                .error = e.what(),
                .stack = "unit " + std::to_string(unitId_) + " handling '" + type + "'",
                .command = type,
            });
    }
}

std::optional<UnitProtocol::Reply> SimulationUnit::handleCommand(
    const UnitProtocol::Command& command)
{
    using namespace UnitProtocol;

    return std::visit(
        Overloaded{
            [this](const Init& msg) -> std::optional<Reply> {
                // Validated at decode, so the type is known.
                const auto type = Environment::fromString(msg.envType).value();
                auto engine = config_.engineFactory ? config_.engineFactory(type, msg.envId)
                                                    : createPhysicsEngine(type);
                if (!engine) {
                    throw std::runtime_error(
                        "No physics engine for env " + std::to_string(msg.envId));
                }
                environments_[msg.envId] = std::make_unique<UnitEnvironment>(
                    msg.envId, type, config_.maxEpisodeSteps, std::move(engine));
                LOG_DEBUG(Unit, "Unit {} hosts env {} ({})", unitId_, msg.envId, msg.envType);
                return Initialized{ .envId = msg.envId };
            },
            [this](const Step& msg) -> std::optional<Reply> {
                return environment(msg.envId).step(msg.actions);
            },
            [this](const Reset& msg) -> std::optional<Reply> {
                return ResetDone{ .envId = msg.envId,
                                  .observation = environment(msg.envId).reset() };
            },
            [this](const ApplyForce& msg) -> std::optional<Reply> {
                return environment(msg.envId).applyForce(msg.bodyId, msg.force, msg.point);
            },
            [this](const ClearActuators& msg) -> std::optional<Reply> {
                environment(msg.envId).clearActuators();
                return std::nullopt;
            },
            [this](const GetState& msg) -> std::optional<Reply> {
                return environment(msg.envId).state();
            },
        },
        command);
}

UnitEnvironment& SimulationUnit::environment(int envId)
{
    auto it = environments_.find(envId);
    if (it == environments_.end()) {
        throw std::runtime_error(
            "Environment " + std::to_string(envId) + " is not initialized on unit "
            + std::to_string(unitId_));
    }
    return *it->second;
}

void SimulationUnit::sendReply(uint64_t id, const UnitProtocol::Reply& reply)
{
    try {
        replySink_(UnitProtocol::encodeReply(id, reply));
    }
    catch (const std::exception& e) {
        LOG_ERROR(Unit, "Unit {} failed to deliver reply: {}", unitId_, e.what());
    }
}

} // namespace SimPool

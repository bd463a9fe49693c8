#include "MessageRouter.h"
#include "core/LoggingChannels.h"

#include <utility>
#include <vector>

namespace SimPool {

MessageRouter::MessageRouter(
    std::chrono::milliseconds defaultTimeout, std::chrono::milliseconds sweepInterval)
    : defaultTimeout_(defaultTimeout), sweepInterval_(sweepInterval)
{}

MessageRouter::~MessageRouter()
{
    stop();
}

void MessageRouter::start()
{
    std::lock_guard<std::mutex> lock(sweepMutex_);
    if (sweeper_.joinable()) {
        return;
    }
    sweepStop_ = false;
    sweeper_ = std::thread([this]() { sweepLoop(); });
}

void MessageRouter::stop()
{
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        sweepStop_ = true;
    }
    sweepCv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

MessageRouter::Ticket MessageRouter::open(
    int envId, const std::string& messageType, std::optional<std::chrono::milliseconds> timeout)
{
    const uint64_t id = nextId_.fetch_add(1, std::memory_order_relaxed);

    PendingRequest request;
    request.envId = envId;
    request.messageType = messageType;
    request.deadline = Clock::now() + timeout.value_or(defaultTimeout_);

    Ticket ticket;
    ticket.id = id;
    ticket.future = request.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.emplace(id, std::move(request));
    }

    LOG_TRACE(Router, "Opened request {} '{}' for env {}", id, messageType, envId);
    return ticket;
}

void MessageRouter::dispatch(uint64_t id, UnitProtocol::Reply reply)
{
    std::optional<PendingRequest> request;
    if (id != 0) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            request = std::move(it->second);
            pending_.erase(it);
        }
    }

    if (!request.has_value()) {
        if (id != 0) {
            LOG_DEBUG(Router, "Reply {} has no pending request (already completed)", id);
        }
        routeUnmatched(id, reply);
        return;
    }

    if (const auto* error = std::get_if<UnitProtocol::Error>(&reply)) {
        const int envId = error->envId >= 0 ? error->envId : request->envId;
        request->promise.set_value(ReplyResult::error(RequestError{
            .kind = RequestError::Kind::UnitFault, .message = error->error, .envId = envId }));
        return;
    }

    request->promise.set_value(ReplyResult::okay(std::move(reply)));
}

bool MessageRouter::cancel(uint64_t id, RequestError error)
{
    std::optional<PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }

    request->promise.set_value(ReplyResult::error(std::move(error)));
    return true;
}

void MessageRouter::setHandler(const std::string& messageType, Handler handler)
{
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_[messageType] = std::move(handler);
}

size_t MessageRouter::expireOverdue(Clock::time_point now)
{
    std::vector<PendingRequest> expired;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                LOG_WARN(
                    Router,
                    "Request {} '{}' for env {} timed out",
                    it->first,
                    it->second.messageType,
                    it->second.envId);
                expired.push_back(std::move(it->second));
                it = pending_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    for (auto& request : expired) {
        request.promise.set_value(ReplyResult::error(RequestError{
            .kind = RequestError::Kind::Timeout,
            .message = "No '" + request.messageType + "' reply before deadline",
            .envId = request.envId }));
    }
    return expired.size();
}

void MessageRouter::rejectAll(const RequestError& error)
{
    std::map<uint64_t, PendingRequest> rejected;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        rejected.swap(pending_);
    }

    for (auto& [id, request] : rejected) {
        RequestError perRequest = error;
        if (perRequest.envId < 0) {
            perRequest.envId = request.envId;
        }
        request.promise.set_value(ReplyResult::error(std::move(perRequest)));
    }

    if (!rejected.empty()) {
        LOG_INFO(Router, "Rejected {} pending requests: {}", rejected.size(), error.message);
    }
}

size_t MessageRouter::pendingCount() const
{
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

void MessageRouter::routeUnmatched(uint64_t id, const UnitProtocol::Reply& reply)
{
    const std::string type = UnitProtocol::messageType(reply);

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        auto it = handlers_.find(type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        LOG_DEBUG(Router, "No handler for unmatched '{}' reply (id {})", type, id);
        return;
    }
    handler(reply);
}

void MessageRouter::sweepLoop()
{
    std::unique_lock<std::mutex> lock(sweepMutex_);
    while (!sweepStop_) {
        sweepCv_.wait_for(lock, sweepInterval_, [this]() { return sweepStop_; });
        if (sweepStop_) {
            break;
        }
        lock.unlock();
        expireOverdue(Clock::now());
        lock.lock();
    }
}

} // namespace SimPool

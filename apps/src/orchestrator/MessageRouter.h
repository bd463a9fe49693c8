#pragma once

#include "RequestError.h"
#include "core/Result.h"
#include "core/network/UnitProtocol.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace SimPool {

/**
 * @brief Correlates unit replies with the requests awaiting them.
 *
 * open() hands out a fresh correlation id and a future. The future completes
 * exactly once: with the reply, with a UnitFault if the reply is `error`, with
 * Timeout when the deadline passes, or with the error given to cancel() or
 * rejectAll(). The record is removed when it completes.
 *
 * Replies whose id has no record (id 0 or already completed) go to the handler
 * registered for their message type.
 */
class MessageRouter {
public:
    using ReplyResult = Result<UnitProtocol::Reply, RequestError>;
    using Handler = std::function<void(const UnitProtocol::Reply&)>;
    using Clock = std::chrono::steady_clock;

    struct Ticket {
        uint64_t id = 0;
        std::future<ReplyResult> future;
    };

    explicit MessageRouter(
        std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds(5000),
        std::chrono::milliseconds sweepInterval = std::chrono::milliseconds(20));
    ~MessageRouter();

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    // Starts the background deadline sweep.
    void start();
    void stop();

    Ticket open(
        int envId,
        const std::string& messageType,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void dispatch(uint64_t id, UnitProtocol::Reply reply);

    // Returns false if the request had already completed.
    bool cancel(uint64_t id, RequestError error);

    void setHandler(const std::string& messageType, Handler handler);

    /**
     * @brief Reject every record whose deadline is at or before now.
     * @return Number of records expired.
     */
    size_t expireOverdue(Clock::time_point now);

    void rejectAll(const RequestError& error);

    size_t pendingCount() const;
    std::chrono::milliseconds defaultTimeout() const { return defaultTimeout_; }

private:
    struct PendingRequest {
        int envId = -1;
        std::string messageType;
        std::promise<ReplyResult> promise;
        Clock::time_point deadline;
    };

    void routeUnmatched(uint64_t id, const UnitProtocol::Reply& reply);
    void sweepLoop();

    std::chrono::milliseconds defaultTimeout_;
    std::chrono::milliseconds sweepInterval_;

    std::atomic<uint64_t> nextId_{ 1 };

    mutable std::mutex pendingMutex_;
    std::map<uint64_t, PendingRequest> pending_;

    std::mutex handlerMutex_;
    std::unordered_map<std::string, Handler> handlers_;

    std::mutex sweepMutex_;
    std::condition_variable sweepCv_;
    bool sweepStop_ = false;
    std::thread sweeper_;
};

} // namespace SimPool

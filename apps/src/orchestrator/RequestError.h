#pragma once

#include <string>

namespace SimPool {

/**
 * Failure of an orchestrator request or command.
 */
struct RequestError {
    enum class Kind {
        Timeout,               // No reply before the deadline.
        UnitFault,             // The unit replied with `error`.
        Terminated,            // Orchestrator shut down while the request was pending.
        InvalidArgument,       // Rejected before anything was sent.
        InitializationFailure, // One or more environments never acknowledged init.
    };

    Kind kind = Kind::UnitFault;
    std::string message;
    int envId = -1;
};

inline const char* toString(RequestError::Kind kind)
{
    switch (kind) {
        case RequestError::Kind::Timeout:
            return "Timeout";
        case RequestError::Kind::UnitFault:
            return "UnitFault";
        case RequestError::Kind::Terminated:
            return "Terminated";
        case RequestError::Kind::InvalidArgument:
            return "InvalidArgument";
        case RequestError::Kind::InitializationFailure:
            return "InitializationFailure";
    }
    return "Unknown";
}

inline std::string describe(const RequestError& error)
{
    std::string text = std::string(toString(error.kind)) + ": " + error.message;
    if (error.envId >= 0) {
        text += " (env " + std::to_string(error.envId) + ")";
    }
    return text;
}

} // namespace SimPool

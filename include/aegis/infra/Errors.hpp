#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aegis {

enum class ErrorKind : uint8_t {
    NONE = 0,
    INSUFFICIENT_CAPITAL,
    VALIDATION_FAILED,
    DEPLOYMENT_FAILURE,
    CIRCUIT_BREAKER_TRIPPED,
    NUDGE_ENGINE_DEGRADED,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INVALID_STATE,
    LIMIT_EXCEEDED,
    STORE_FAILURE
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                    return "None";
        case ErrorKind::INSUFFICIENT_CAPITAL:    return "InsufficientCapital";
        case ErrorKind::VALIDATION_FAILED:       return "ValidationFailed";
        case ErrorKind::DEPLOYMENT_FAILURE:      return "DeploymentFailure";
        case ErrorKind::CIRCUIT_BREAKER_TRIPPED: return "CircuitBreakerTripped";
        case ErrorKind::NUDGE_ENGINE_DEGRADED:   return "NudgeEngineDegraded";
        case ErrorKind::NOT_FOUND:               return "NotFound";
        case ErrorKind::INVALID_ARGUMENT:        return "InvalidArgument";
        case ErrorKind::INVALID_STATE:           return "InvalidState";
        case ErrorKind::LIMIT_EXCEEDED:          return "LimitExceeded";
        case ErrorKind::STORE_FAILURE:           return "StoreFailure";
        default:                                 return "Unknown";
    }
}

// ---------------------------------------------------------------------------
// Base of every exception thrown by the control plane. The kind lets callers
// (operator API, pipeline deployment step) map failures without string
// matching. Faults that must not propagate (nudge engine, validation
// scoring) are caught inside their component and never reach callers.
// ---------------------------------------------------------------------------
class AegisError : public std::runtime_error {
public:
    AegisError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InsufficientCapital : public AegisError {
public:
    explicit InsufficientCapital(const std::string& what)
        : AegisError(ErrorKind::INSUFFICIENT_CAPITAL, what) {}
};

class DeploymentFailure : public AegisError {
public:
    explicit DeploymentFailure(const std::string& what)
        : AegisError(ErrorKind::DEPLOYMENT_FAILURE, what) {}
};

class NudgeEngineDegraded : public AegisError {
public:
    explicit NudgeEngineDegraded(const std::string& what)
        : AegisError(ErrorKind::NUDGE_ENGINE_DEGRADED, what) {}
};

class NotFound : public AegisError {
public:
    explicit NotFound(const std::string& what)
        : AegisError(ErrorKind::NOT_FOUND, what) {}
};

class InvalidArgument : public AegisError {
public:
    explicit InvalidArgument(const std::string& what)
        : AegisError(ErrorKind::INVALID_ARGUMENT, what) {}
};

class InvalidState : public AegisError {
public:
    explicit InvalidState(const std::string& what)
        : AegisError(ErrorKind::INVALID_STATE, what) {}
};

class LimitExceeded : public AegisError {
public:
    explicit LimitExceeded(const std::string& what)
        : AegisError(ErrorKind::LIMIT_EXCEEDED, what) {}
};

class StoreFailure : public AegisError {
public:
    explicit StoreFailure(const std::string& what)
        : AegisError(ErrorKind::STORE_FAILURE, what) {}
};

} // namespace aegis

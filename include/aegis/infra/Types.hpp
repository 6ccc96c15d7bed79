#pragma once

#include <cstdint>
#include <string>

#include "aegis/infra/Errors.hpp"

namespace aegis {

enum class RiskLevel : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

inline const char* risk_level_to_string(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW:    return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH:   return "high";
        default:                return "unknown";
    }
}

inline RiskLevel risk_level_from_string(const std::string& s) {
    if (s == "low")    return RiskLevel::LOW;
    if (s == "medium") return RiskLevel::MEDIUM;
    if (s == "high")   return RiskLevel::HIGH;
    throw InvalidArgument("unknown risk level '" + s + "'");
}

enum class ExecutionStatus : uint8_t {
    PENDING = 0,
    LIVE,
    FILLED,
    REJECTED,
    CANCELLED,
    BLOCKED
};

inline const char* execution_status_to_string(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::PENDING:   return "pending";
        case ExecutionStatus::LIVE:      return "live";
        case ExecutionStatus::FILLED:    return "filled";
        case ExecutionStatus::REJECTED:  return "rejected";
        case ExecutionStatus::CANCELLED: return "cancelled";
        case ExecutionStatus::BLOCKED:   return "blocked";
        default:                         return "unknown";
    }
}

inline ExecutionStatus execution_status_from_string(const std::string& s) {
    if (s == "pending")   return ExecutionStatus::PENDING;
    if (s == "live")      return ExecutionStatus::LIVE;
    if (s == "filled")    return ExecutionStatus::FILLED;
    if (s == "rejected")  return ExecutionStatus::REJECTED;
    if (s == "cancelled") return ExecutionStatus::CANCELLED;
    if (s == "blocked")   return ExecutionStatus::BLOCKED;
    throw InvalidArgument("unknown execution status '" + s + "'");
}

} // namespace aegis

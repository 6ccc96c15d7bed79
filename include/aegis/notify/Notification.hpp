#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace aegis {

enum class NotificationType : uint8_t {
    CIRCUIT_BREAKER_TRIPPED = 1,
    CIRCUIT_BREAKER_RESET,
    EMERGENCY_STOP_CHANGED,
    TRADING_MODE_CHANGED,
    COOLDOWN_STARTED,
    STRATEGY_PROMOTED,
    STRATEGY_REJECTED,
    DEPLOYMENT_FAILED,
    CAPITAL_ALLOCATION_CHANGED,
    POOL_EMERGENCY_STOP,
    NUDGE_BREAKER_TRIPPED,
    NUDGE_BREAKER_RESET
};

inline const char* notification_type_to_string(NotificationType t) {
    switch (t) {
        case NotificationType::CIRCUIT_BREAKER_TRIPPED:    return "circuit_breaker_tripped";
        case NotificationType::CIRCUIT_BREAKER_RESET:      return "circuit_breaker_reset";
        case NotificationType::EMERGENCY_STOP_CHANGED:     return "emergency_stop_changed";
        case NotificationType::TRADING_MODE_CHANGED:       return "trading_mode_changed";
        case NotificationType::COOLDOWN_STARTED:           return "cooldown_started";
        case NotificationType::STRATEGY_PROMOTED:          return "strategy_promoted";
        case NotificationType::STRATEGY_REJECTED:          return "strategy_rejected";
        case NotificationType::DEPLOYMENT_FAILED:          return "deployment_failed";
        case NotificationType::CAPITAL_ALLOCATION_CHANGED: return "capital_allocation_changed";
        case NotificationType::POOL_EMERGENCY_STOP:        return "pool_emergency_stop";
        case NotificationType::NUDGE_BREAKER_TRIPPED:      return "nudge_breaker_tripped";
        case NotificationType::NUDGE_BREAKER_RESET:        return "nudge_breaker_reset";
        default:                                           return "unknown";
    }
}

// One push message. payload carries the typed details (pool id, candidate
// id, breaker reason...) so subscribers never reach into component state.
struct Notification {
    NotificationType type;
    uint64_t ts_ns = 0;
    std::string source;
    std::string message;
    nlohmann::json payload = nlohmann::json::object();
};

inline nlohmann::json to_json_record(const Notification& n) {
    return nlohmann::json{
        {"type", notification_type_to_string(n.type)},
        {"ts_ns", n.ts_ns},
        {"source", n.source},
        {"message", n.message},
        {"payload", n.payload}
    };
}

} // namespace aegis

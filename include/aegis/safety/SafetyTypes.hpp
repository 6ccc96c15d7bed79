#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "aegis/infra/Errors.hpp"

namespace aegis {

enum class TradingMode : uint8_t {
    PAPER = 0,
    LIVE
};

inline const char* trading_mode_to_string(TradingMode m) {
    return m == TradingMode::LIVE ? "live" : "paper";
}

inline TradingMode trading_mode_from_string(const std::string& s) {
    if (s == "live")  return TradingMode::LIVE;
    if (s == "paper") return TradingMode::PAPER;
    throw InvalidArgument("invalid trading mode '" + s + "'");
}

enum class BlockedBy : uint8_t {
    NONE = 0,
    EMERGENCY_STOP,
    CIRCUIT_BREAKER,
    COOLDOWN
};

inline const char* blocked_by_to_string(BlockedBy b) {
    switch (b) {
        case BlockedBy::NONE:            return "none";
        case BlockedBy::EMERGENCY_STOP:  return "emergency_stop";
        case BlockedBy::CIRCUIT_BREAKER: return "circuit_breaker";
        case BlockedBy::COOLDOWN:        return "cooldown";
        default:                         return "unknown";
    }
}

struct SafetyLimits {
    double max_daily_loss = 1000.0;
    int    max_trades_per_day = 100;

    double   error_rate_threshold = 0.5;
    size_t   error_window = 50;
    size_t   error_min_samples = 10;

    double   latency_p95_ms = 8.0;
    size_t   latency_window = 200;
    size_t   latency_min_samples = 10;

    uint64_t breaker_reset_sec = 300;
    uint64_t cooldown_sec = 120;
};

struct CircuitBreakerState {
    bool active = false;
    std::string reason;
    uint64_t triggered_at_ns = 0;
    double max_daily_loss = 0.0;
    double current_daily_loss = 0.0;
    int max_trades_per_day = 0;
    int current_trade_count = 0;
};

struct CooldownState {
    bool active = false;
    uint64_t ends_at_ns = 0;
    std::string reason;
};

struct SafetyStatus {
    TradingMode trading_mode = TradingMode::PAPER;

    bool emergency_stop_active = false;
    std::string emergency_stop_reason;
    uint64_t emergency_stop_changed_ns = 0;

    CircuitBreakerState circuit_breaker;
    CooldownState cooldown;

    std::string trading_day;     // UTC, YYYY-MM-DD
    double daily_pnl = 0.0;

    // Derived, not persisted
    double error_rate = 0.0;
    double latency_p95_ms = 0.0;
    uint64_t as_of_ns = 0;
};

struct OrderIntent {
    std::string client_order_id;
    std::string strategy_id;
    std::string symbol;
    int side = 1;                 // +1 buy, -1 sell
    double qty = 0.0;
    std::string order_type = "market";
    double limit_price = 0.0;
    bool is_entry = true;         // exits are never blocked by cooldown
};

struct GateDecision {
    bool allowed = true;
    BlockedBy blocked_by = BlockedBy::NONE;
    ErrorKind kind = ErrorKind::NONE;
    std::string reason;
};

void to_json(nlohmann::json& j, const SafetyStatus& s);
void from_json(const nlohmann::json& j, SafetyStatus& s);

void to_json(nlohmann::json& j, const GateDecision& d);

void from_json(const nlohmann::json& j, OrderIntent& o);

} // namespace aegis

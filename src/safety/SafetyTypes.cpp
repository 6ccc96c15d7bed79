#include "aegis/safety/SafetyTypes.hpp"

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const SafetyStatus& s) {
    const auto& cb = s.circuit_breaker;
    j = json{
        {"tradingMode", trading_mode_to_string(s.trading_mode)},
        {"emergencyStopActive", s.emergency_stop_active},
        {"emergencyStopReason", s.emergency_stop_reason},
        {"emergencyStopChangedAt", s.emergency_stop_changed_ns},
        {"circuitBreaker", {
            {"active", cb.active},
            {"reason", cb.reason},
            {"triggeredAt", cb.triggered_at_ns},
            {"maxDailyLoss", cb.max_daily_loss},
            {"currentDailyLoss", cb.current_daily_loss},
            {"maxTradesPerDay", cb.max_trades_per_day},
            {"currentTradeCount", cb.current_trade_count}
        }},
        {"cooldown", {
            {"active", s.cooldown.active},
            {"endsAt", s.cooldown.ends_at_ns},
            {"reason", s.cooldown.reason}
        }},
        {"tradingDay", s.trading_day},
        {"dailyPnl", s.daily_pnl},
        {"errorRate", s.error_rate},
        {"latencyP95Ms", s.latency_p95_ms},
        {"asOf", s.as_of_ns}
    };
}

void from_json(const json& j, SafetyStatus& s) {
    s.trading_mode = trading_mode_from_string(j.value("tradingMode", "paper"));
    s.emergency_stop_active = j.value("emergencyStopActive", false);
    s.emergency_stop_reason = j.value("emergencyStopReason", "");
    s.emergency_stop_changed_ns = j.value("emergencyStopChangedAt", uint64_t{0});

    if (j.contains("circuitBreaker")) {
        const auto& cb = j.at("circuitBreaker");
        s.circuit_breaker.active = cb.value("active", false);
        s.circuit_breaker.reason = cb.value("reason", "");
        s.circuit_breaker.triggered_at_ns = cb.value("triggeredAt", uint64_t{0});
        s.circuit_breaker.max_daily_loss = cb.value("maxDailyLoss", 0.0);
        s.circuit_breaker.current_daily_loss = cb.value("currentDailyLoss", 0.0);
        s.circuit_breaker.max_trades_per_day = cb.value("maxTradesPerDay", 0);
        s.circuit_breaker.current_trade_count = cb.value("currentTradeCount", 0);
    }
    if (j.contains("cooldown")) {
        const auto& cd = j.at("cooldown");
        s.cooldown.active = cd.value("active", false);
        s.cooldown.ends_at_ns = cd.value("endsAt", uint64_t{0});
        s.cooldown.reason = cd.value("reason", "");
    }
    s.trading_day = j.value("tradingDay", "");
    s.daily_pnl = j.value("dailyPnl", 0.0);
}

void to_json(json& j, const GateDecision& d) {
    j = json{
        {"allowed", d.allowed},
        {"blockedBy", blocked_by_to_string(d.blocked_by)},
        {"kind", error_kind_to_string(d.kind)},
        {"reason", d.reason}
    };
}

void from_json(const json& j, OrderIntent& o) {
    o.client_order_id = j.value("clientOrderId", "");
    o.strategy_id = j.value("strategyId", "");
    o.symbol = j.at("symbol").get<std::string>();
    o.side = j.value("side", 1);
    o.qty = j.at("qty").get<double>();
    o.order_type = j.value("orderType", "market");
    o.limit_price = j.value("limitPrice", 0.0);
    o.is_entry = j.value("isEntry", true);
}

} // namespace aegis

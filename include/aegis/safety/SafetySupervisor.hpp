#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/notify/NotificationBus.hpp"
#include "aegis/safety/SafetyTypes.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

struct RiskMetrics {
    double daily_loss = 0.0;
    int trade_count = 0;
};

// External account-level P&L / trade count (broker account, risk server).
// A throw or a non-finite value is treated as "unknown" and trips the breaker.
class RiskMetricsSource {
public:
    virtual ~RiskMetricsSource() = default;
    virtual RiskMetrics read() = 0;
};

// ---------------------------------------------------------------------------
// Single authority for whether orders may go out.
//
//   emergency stop   manual only, survives restart
//   circuit breaker  error rate / latency p95 / daily loss / trade count;
//                    auto-resets breaker_reset_sec after triggering
//   cooldown         after a realized loss; blocks entries only
//   trading mode     always PAPER after restart, LIVE needs an explicit call
//
// Time-based transitions are evaluated lazily on every check/status call and
// by tick(), so they happen on time even with no order flow.
// ---------------------------------------------------------------------------
class SafetySupervisor {
public:
    static constexpr const char* STATUS_KEY = "safety.status";

    SafetySupervisor(StateStore& store, NotificationBus& bus, const Clock& clock,
                     SafetyLimits limits = {});

    void restore();

    // Not owned. nullptr detaches.
    void set_risk_source(RiskMetricsSource* source);

    GateDecision check_order(const OrderIntent& intent);

    void record_order_result(bool success, double latency_ms);
    void record_fill(double realized_pnl);

    void set_emergency_stop(bool active, const std::string& reason);
    void set_trading_mode(TradingMode mode);
    void reset_circuit_breaker(const std::string& reason = "manual reset");

    void tick();

    SafetyStatus status();
    TradingMode trading_mode() const;
    SafetyLimits limits() const;

private:
    using Pending = std::vector<Notification>;

    void poll_risk_source(Pending& out);
    void maintain_locked(uint64_t now, Pending& out);
    void evaluate_locked(uint64_t now, Pending& out);
    void trip_locked(uint64_t now, const std::string& reason, Pending& out);
    void clear_breaker_locked(const std::string& reason, Pending& out);
    void persist_locked();

    double error_rate_locked() const;
    double latency_p95_locked() const;

    void emit(Pending& out, NotificationType type, const std::string& message,
              nlohmann::json payload = nlohmann::json::object());
    void publish(Pending& out);

    std::string day_key(uint64_t wall_ns) const;

    StateStore& store_;
    NotificationBus& bus_;
    const Clock& clock_;

    mutable std::mutex mtx_;
    SafetyLimits limits_;
    SafetyStatus st_;
    std::deque<bool> outcomes_;
    std::deque<double> latencies_;

    RiskMetricsSource* risk_source_ = nullptr;
    bool external_valid_ = false;
    RiskMetrics external_;
};

} // namespace aegis

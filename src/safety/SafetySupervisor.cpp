#include "aegis/safety/SafetySupervisor.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

SafetySupervisor::SafetySupervisor(StateStore& store, NotificationBus& bus, const Clock& clock,
                                   SafetyLimits limits)
    : store_(store), bus_(bus), clock_(clock), limits_(limits) {
    st_.circuit_breaker.max_daily_loss = limits_.max_daily_loss;
    st_.circuit_breaker.max_trades_per_day = limits_.max_trades_per_day;
    st_.trading_day = day_key(clock_.wall_ns());
}

std::string SafetySupervisor::day_key(uint64_t wall_ns) const {
    std::time_t secs = static_cast<std::time_t>(wall_ns / NS_PER_SEC);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

// ---------------------------------------------------------------------------
// Restore
// ---------------------------------------------------------------------------

void SafetySupervisor::restore() {
    auto doc = store_.get(STATUS_KEY);

    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (doc) {
            SafetyStatus saved = doc->get<SafetyStatus>();
            st_.emergency_stop_active = saved.emergency_stop_active;
            st_.emergency_stop_reason = saved.emergency_stop_reason;
            st_.emergency_stop_changed_ns = saved.emergency_stop_changed_ns;
            st_.circuit_breaker = saved.circuit_breaker;
            st_.cooldown = saved.cooldown;
            st_.trading_day = saved.trading_day;
            st_.daily_pnl = saved.daily_pnl;

            if (saved.trading_mode == TradingMode::LIVE) {
                std::cout << "[SAFETY] Restored from LIVE. Mode forced to PAPER, re-arm REQUIRED.\n";
            }
        }

        // Limits come from config, not from the snapshot.
        st_.trading_mode = TradingMode::PAPER;
        st_.circuit_breaker.max_daily_loss = limits_.max_daily_loss;
        st_.circuit_breaker.max_trades_per_day = limits_.max_trades_per_day;

        maintain_locked(clock_.wall_ns(), out);
        persist_locked();

        std::cout << "[SAFETY] Restored: estop=" << (st_.emergency_stop_active ? "ACTIVE" : "off")
                  << " breaker=" << (st_.circuit_breaker.active ? "TRIGGERED" : "NORMAL")
                  << " day=" << st_.trading_day << "\n";
    }
    publish(out);
}

void SafetySupervisor::set_risk_source(RiskMetricsSource* source) {
    std::lock_guard<std::mutex> lock(mtx_);
    risk_source_ = source;
    external_valid_ = false;
}

// ---------------------------------------------------------------------------
// Order gate
// ---------------------------------------------------------------------------

GateDecision SafetySupervisor::check_order(const OrderIntent& intent) {
    Pending out;
    poll_risk_source(out);

    GateDecision d;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);
        evaluate_locked(now, out);

        if (st_.emergency_stop_active) {
            d.allowed = false;
            d.blocked_by = BlockedBy::EMERGENCY_STOP;
            d.kind = ErrorKind::INVALID_STATE;
            d.reason = "Emergency stop active" +
                       (st_.emergency_stop_reason.empty() ? "" : ": " + st_.emergency_stop_reason);
        } else if (st_.circuit_breaker.active) {
            d.allowed = false;
            d.blocked_by = BlockedBy::CIRCUIT_BREAKER;
            d.kind = ErrorKind::CIRCUIT_BREAKER_TRIPPED;
            d.reason = "CircuitBreakerTripped: " + st_.circuit_breaker.reason;
        } else if (st_.cooldown.active && intent.is_entry) {
            uint64_t left_ns = st_.cooldown.ends_at_ns > now ? st_.cooldown.ends_at_ns - now : 0;
            d.allowed = false;
            d.blocked_by = BlockedBy::COOLDOWN;
            d.kind = ErrorKind::INVALID_STATE;
            d.reason = "Cooldown active (" + std::to_string(left_ns / NS_PER_SEC) + "s left): " +
                       st_.cooldown.reason;
        }
    }
    publish(out);

    if (!d.allowed) {
        std::cout << "[SAFETY] BLOCKED " << intent.symbol
                  << (intent.strategy_id.empty() ? "" : " (" + intent.strategy_id + ")")
                  << " -> " << d.reason << "\n";
    }
    return d;
}

// ---------------------------------------------------------------------------
// Outcome feeds
// ---------------------------------------------------------------------------

void SafetySupervisor::record_order_result(bool success, double latency_ms) {
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        outcomes_.push_back(success);
        while (outcomes_.size() > limits_.error_window) outcomes_.pop_front();

        if (std::isfinite(latency_ms) && latency_ms >= 0.0) {
            latencies_.push_back(latency_ms);
            while (latencies_.size() > limits_.latency_window) latencies_.pop_front();
        }

        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);
        evaluate_locked(now, out);
    }
    publish(out);
}

void SafetySupervisor::record_fill(double realized_pnl) {
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);

        auto& cb = st_.circuit_breaker;
        cb.current_trade_count++;
        if (std::isfinite(realized_pnl)) {
            st_.daily_pnl += realized_pnl;
            cb.current_daily_loss = std::max(0.0, -st_.daily_pnl);
        }

        if (realized_pnl < 0.0 && limits_.cooldown_sec > 0) {
            st_.cooldown.active = true;
            st_.cooldown.ends_at_ns = now + limits_.cooldown_sec * NS_PER_SEC;
            st_.cooldown.reason = "realized loss " + std::to_string(realized_pnl);
            std::cout << "[SAFETY] Cooldown started for " << limits_.cooldown_sec
                      << "s after loss " << realized_pnl << "\n";
            emit(out, NotificationType::COOLDOWN_STARTED, "cooldown after realized loss",
                 json{{"endsAt", st_.cooldown.ends_at_ns}, {"pnl", realized_pnl}});
        }

        evaluate_locked(now, out);
        persist_locked();
    }
    publish(out);
}

// ---------------------------------------------------------------------------
// Operator controls
// ---------------------------------------------------------------------------

void SafetySupervisor::set_emergency_stop(bool active, const std::string& reason) {
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (st_.emergency_stop_active == active) return;

        st_.emergency_stop_active = active;
        st_.emergency_stop_reason = reason;
        st_.emergency_stop_changed_ns = clock_.wall_ns();
        persist_locked();

        if (active) {
            std::cerr << "[SAFETY] EMERGENCY STOP ACTIVATED: " << reason << "\n";
        } else {
            std::cout << "[SAFETY] Emergency stop cleared: " << reason << "\n";
        }
        emit(out, NotificationType::EMERGENCY_STOP_CHANGED,
             active ? "Emergency stop activated" : "Emergency stop deactivated",
             json{{"active", active}, {"reason", reason}});
    }
    publish(out);
}

void SafetySupervisor::set_trading_mode(TradingMode mode) {
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (st_.trading_mode == mode) return;

        TradingMode prev = st_.trading_mode;
        st_.trading_mode = mode;
        persist_locked();

        std::cout << "[SAFETY] Trading mode " << trading_mode_to_string(prev)
                  << " -> " << trading_mode_to_string(mode) << "\n";
        emit(out, NotificationType::TRADING_MODE_CHANGED,
             std::string("Trading mode set to ") + trading_mode_to_string(mode),
             json{{"from", trading_mode_to_string(prev)}, {"to", trading_mode_to_string(mode)}});
    }
    publish(out);
}

void SafetySupervisor::reset_circuit_breaker(const std::string& reason) {
    Pending out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!st_.circuit_breaker.active) return;
        clear_breaker_locked(reason, out);
        persist_locked();
    }
    publish(out);
}

void SafetySupervisor::tick() {
    Pending out;
    poll_risk_source(out);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);
        evaluate_locked(now, out);
    }
    publish(out);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

SafetyStatus SafetySupervisor::status() {
    Pending out;
    SafetyStatus s;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);
        s = st_;
        s.error_rate = error_rate_locked();
        s.latency_p95_ms = latency_p95_locked();
        s.as_of_ns = now;
    }
    publish(out);
    return s;
}

TradingMode SafetySupervisor::trading_mode() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return st_.trading_mode;
}

SafetyLimits SafetySupervisor::limits() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return limits_;
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

// Runs the external source outside the lock; folds the result in under it.
void SafetySupervisor::poll_risk_source(Pending& out) {
    RiskMetricsSource* src;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        src = risk_source_;
    }
    if (!src) return;

    std::string fault;
    RiskMetrics m;
    try {
        m = src->read();
        if (!std::isfinite(m.daily_loss)) fault = "non-finite daily loss";
        else if (m.trade_count < 0) fault = "negative trade count";
    } catch (const std::exception& e) {
        fault = e.what();
    }

    std::lock_guard<std::mutex> lock(mtx_);
    uint64_t now = clock_.wall_ns();
    if (!fault.empty()) {
        external_valid_ = false;
        if (!st_.circuit_breaker.active) {
            trip_locked(now, "risk metric unavailable: " + fault, out);
        }
        return;
    }
    external_valid_ = true;
    external_ = m;
}

void SafetySupervisor::maintain_locked(uint64_t now, Pending& out) {
    bool changed = false;

    std::string today = day_key(now);
    if (today != st_.trading_day) {
        std::cout << "[SAFETY] Day rollover " << st_.trading_day << " -> " << today
                  << " (pnl=" << st_.daily_pnl
                  << " trades=" << st_.circuit_breaker.current_trade_count << ")\n";
        st_.trading_day = today;
        st_.daily_pnl = 0.0;
        st_.circuit_breaker.current_daily_loss = 0.0;
        st_.circuit_breaker.current_trade_count = 0;
        changed = true;
    }

    auto& cb = st_.circuit_breaker;
    if (cb.active && now >= cb.triggered_at_ns + limits_.breaker_reset_sec * NS_PER_SEC) {
        clear_breaker_locked("auto reset after " + std::to_string(limits_.breaker_reset_sec) + "s", out);
        changed = true;
    }

    if (st_.cooldown.active && now >= st_.cooldown.ends_at_ns) {
        st_.cooldown = CooldownState{};
        std::cout << "[SAFETY] Cooldown expired\n";
        changed = true;
    }

    if (changed) persist_locked();
}

void SafetySupervisor::evaluate_locked(uint64_t now, Pending& out) {
    auto& cb = st_.circuit_breaker;
    if (cb.active) return;

    if (external_valid_) {
        cb.current_daily_loss = std::max(cb.current_daily_loss, external_.daily_loss);
        cb.current_trade_count = std::max(cb.current_trade_count, external_.trade_count);
    }

    std::string reason;
    double err = error_rate_locked();
    double p95 = latency_p95_locked();

    if (outcomes_.size() >= limits_.error_min_samples && err > limits_.error_rate_threshold) {
        reason = "error rate " + std::to_string(err) + " > " + std::to_string(limits_.error_rate_threshold);
    } else if (latencies_.size() >= limits_.latency_min_samples && p95 > limits_.latency_p95_ms) {
        reason = "latency p95 " + std::to_string(p95) + "ms > " + std::to_string(limits_.latency_p95_ms) + "ms";
    } else if (cb.current_daily_loss > limits_.max_daily_loss) {
        reason = "daily loss " + std::to_string(cb.current_daily_loss) + " > " +
                 std::to_string(limits_.max_daily_loss);
    } else if (cb.current_trade_count > limits_.max_trades_per_day) {
        reason = "trade count " + std::to_string(cb.current_trade_count) + " > " +
                 std::to_string(limits_.max_trades_per_day);
    }

    if (!reason.empty()) trip_locked(now, reason, out);
}

void SafetySupervisor::trip_locked(uint64_t now, const std::string& reason, Pending& out) {
    auto& cb = st_.circuit_breaker;
    cb.active = true;
    cb.reason = reason;
    cb.triggered_at_ns = now;
    persist_locked();

    std::cerr << "[SAFETY] CIRCUIT BREAKER TRIPPED: " << reason << "\n";
    emit(out, NotificationType::CIRCUIT_BREAKER_TRIPPED, reason,
         json{{"reason", reason}, {"triggeredAt", now},
              {"resetAfterSec", limits_.breaker_reset_sec}});
}

void SafetySupervisor::clear_breaker_locked(const std::string& reason, Pending& out) {
    auto& cb = st_.circuit_breaker;
    std::string was = cb.reason;
    cb.active = false;
    cb.reason.clear();
    cb.triggered_at_ns = 0;

    // Fresh windows, otherwise the same samples re-trip immediately.
    outcomes_.clear();
    latencies_.clear();

    std::cout << "[SAFETY] Circuit breaker reset (" << reason << "), was: " << was << "\n";
    emit(out, NotificationType::CIRCUIT_BREAKER_RESET, reason,
         json{{"reason", reason}, {"previousReason", was}});
}

void SafetySupervisor::persist_locked() {
    WriteBatch batch;
    batch.put(STATUS_KEY, json(st_));
    try {
        store_.commit(batch);
    } catch (const StoreFailure& e) {
        // In-memory state stays authoritative; the next change retries.
        std::cerr << "[SAFETY] Persist failed: " << e.what() << "\n";
    }
}

double SafetySupervisor::error_rate_locked() const {
    if (outcomes_.empty()) return 0.0;
    size_t errors = std::count(outcomes_.begin(), outcomes_.end(), false);
    return static_cast<double>(errors) / static_cast<double>(outcomes_.size());
}

double SafetySupervisor::latency_p95_locked() const {
    if (latencies_.empty()) return 0.0;
    std::vector<double> v(latencies_.begin(), latencies_.end());
    size_t idx = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(v.size()))) - 1;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(idx), v.end());
    return v[idx];
}

void SafetySupervisor::emit(Pending& out, NotificationType type, const std::string& message,
                            json payload) {
    Notification n;
    n.type = type;
    n.ts_ns = clock_.wall_ns();
    n.source = "safety";
    n.message = message;
    n.payload = std::move(payload);
    out.push_back(std::move(n));
}

void SafetySupervisor::publish(Pending& out) {
    for (auto& n : out) bus_.publish(std::move(n));
    out.clear();
}

} // namespace aegis

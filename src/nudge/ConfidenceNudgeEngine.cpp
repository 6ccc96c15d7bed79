#include "aegis/nudge/ConfidenceNudgeEngine.hpp"
#include "aegis/infra/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const NudgeBreakerStatus& b) {
    j = json{
        {"active", b.active},
        {"reason", b.reason},
        {"lastTrigger", b.triggered_at_ns},
        {"timeRemainingMs", b.time_remaining_ns / NS_PER_MS}
    };
}

void to_json(json& j, const NudgeStats& s) {
    j = json{
        {"nudgesApplied", s.nudges_applied},
        {"avgLatencyMs", s.avg_latency_ms},
        {"circuitBreakerTriggers", s.breaker_triggers},
        {"validationFailures", s.validation_failures},
        {"errors", s.errors},
        {"validatedEventTypes", s.validated_event_types},
        {"circuitBreaker", s.breaker}
    };
}

ConfidenceNudgeEngine::ConfidenceNudgeEngine(const ReactionStatsProvider& stats,
                                             NotificationBus& bus,
                                             const Clock& clock,
                                             NudgeParams params)
    : stats_(stats), bus_(bus), clock_(clock), params_(params) {}

// ---------------------------------------------------------------------------
// Nudge
// ---------------------------------------------------------------------------

double ConfidenceNudgeEngine::calculate_nudge(const std::vector<EventSignal>& events,
                                              const MarketContext& ctx,
                                              const std::string& sector,
                                              const std::string& symbol) {
    {
        std::vector<Notification> out;
        bool active;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            maintain_locked(clock_.wall_ns(), out);
            active = breaker_.active;
        }
        publish(out);
        if (active) return 0.0;
    }

    const uint64_t t0 = clock_.mono_ns();
    double nudge = 0.0;
    uint64_t skipped = 0;

    try {
        double total_effect = 0.0;
        double total_conf = 0.0;

        for (const auto& ev : events) {
            if (!ev.validated || !ev.effect_z) continue;

            auto st = stats_.get(ev.type, sector);
            if (!st || !passes_gates(*st)) {
                skipped++;
                continue;
            }

            double z = *ev.effect_z;
            if (!std::isfinite(z) || !std::isfinite(ev.confidence)) {
                throw NudgeEngineDegraded("non-finite input on " + ev.type + " for " + symbol);
            }

            double capped = std::max(-params_.effect_size_cap, std::min(params_.effect_size_cap, z));
            total_effect += capped * ev.confidence;
            total_conf += ev.confidence;
        }

        if (total_conf > 0.0) {
            double avg = total_effect / total_conf;
            nudge = avg * regime_shrink(ctx);
            nudge = std::max(-params_.confidence_cap, std::min(params_.confidence_cap, nudge));
        }
    } catch (const std::exception& e) {
        record_error(e.what());
        return 0.0;
    }

    const double latency_ms = ns_to_ms(clock_.mono_ns() - t0);

    std::vector<Notification> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        consecutive_errors_ = 0;
        perf_.validation_failures += skipped;
        if (nudge != 0.0) perf_.nudges_applied++;

        const double a = params_.latency_ema_alpha;
        perf_.avg_latency_ms = (1.0 - a) * perf_.avg_latency_ms + a * latency_ms;

        if (perf_.avg_latency_ms > params_.latency_threshold_ms && !breaker_.active) {
            trip_locked(clock_.wall_ns(),
                        "high latency: " + std::to_string(perf_.avg_latency_ms) + "ms", out);
        }
    }
    publish(out);
    return nudge;
}

double ConfidenceNudgeEngine::regime_shrink(const MarketContext& ctx) const {
    double shrink = 1.0;

    if (ctx.vix > params_.vix_threshold) {
        double excess = ctx.vix - params_.vix_threshold;
        shrink *= std::max(params_.min_regime_shrink, 1.0 - excess * params_.vix_shrink_per_point);
    }
    if (ctx.spread_percent > params_.spread_threshold) {
        shrink *= params_.spread_shrink;
    }
    if (ctx.trend_strength > params_.trend_threshold) {
        shrink *= params_.trend_shrink;
    }

    return std::max(params_.min_regime_shrink, shrink);
}

bool ConfidenceNudgeEngine::passes_gates(const ReactionStats& s) const {
    return s.passes_validation &&
           s.sample_size_5m >= params_.min_sample_size &&
           s.last_12m_threshold &&
           std::abs(s.effect_size_5m) >= params_.min_abs_effect &&
           (!s.orthogonality_score || std::abs(*s.orthogonality_score) <= params_.max_abs_orthogonality);
}

bool ConfidenceNudgeEngine::validate_event(EventSignal& event, const std::string& sector) {
    std::optional<ReactionStats> st;
    try {
        st = stats_.get(event.type, sector);
    } catch (const std::exception& e) {
        std::cerr << "[NUDGE] Event validation error (" << event.type << "): " << e.what() << "\n";
        std::lock_guard<std::mutex> lock(mtx_);
        perf_.errors++;
        perf_.validation_failures++;
        return false;
    }

    if (!st || !passes_gates(*st)) {
        std::lock_guard<std::mutex> lock(mtx_);
        perf_.validation_failures++;
        return false;
    }

    event.effect_z = st->effect_size_5m;
    event.validated = true;
    event.expected_return_5m = st->avg_return_5m;
    event.hit_rate = st->hit_rate_5m;
    return true;
}

// ---------------------------------------------------------------------------
// Explanation
// ---------------------------------------------------------------------------

NudgeExplanation ConfidenceNudgeEngine::explain(double nudge,
                                                const std::vector<EventSignal>& events,
                                                const MarketContext& ctx) {
    NudgeExplanation x;
    x.as_of_ns = clock_.wall_ns();
    x.vix = ctx.vix;
    x.breaker_active = breaker_status().active;

    if (std::abs(nudge) < 0.001) {
        x.reason = "No validated news events";
        return x;
    }

    x.nudge = nudge;
    x.nudge_bps = std::round(nudge * 10000.0 * 100.0) / 100.0;
    x.reason = nudge > 0 ? "Positive news reaction expected" : "Negative news reaction expected";
    x.confidence = std::abs(nudge) / params_.confidence_cap;
    x.regime_shrink = regime_shrink(ctx);

    for (const auto& ev : events) {
        if (!ev.validated) continue;
        NudgeFactor f;
        f.event_type = ev.type;
        f.direction = ev.direction > 0 ? "positive" : "negative";
        f.confidence = ev.confidence;
        f.effect_size = ev.effect_z.value_or(0.0);
        f.expected_return = ev.expected_return_5m;
        f.hit_rate = ev.hit_rate;
        x.factors.push_back(f);
    }
    return x;
}

// ---------------------------------------------------------------------------
// Breaker
// ---------------------------------------------------------------------------

void ConfidenceNudgeEngine::tick() {
    std::vector<Notification> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        maintain_locked(clock_.wall_ns(), out);
    }
    publish(out);
}

void ConfidenceNudgeEngine::reset_breaker(const std::string& reason) {
    std::vector<Notification> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!breaker_.active) return;
        breaker_ = NudgeBreakerStatus{};
        consecutive_errors_ = 0;
        perf_.avg_latency_ms = 0.0;
        std::cout << "[NUDGE] Circuit breaker reset (" << reason << ")\n";
        out.push_back(Notification{NotificationType::NUDGE_BREAKER_RESET, clock_.wall_ns(),
                                   "nudge", reason, json{{"reason", reason}}});
    }
    publish(out);
}

NudgeBreakerStatus ConfidenceNudgeEngine::breaker_status() {
    std::vector<Notification> out;
    NudgeBreakerStatus b;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        maintain_locked(now, out);
        b = breaker_;
        if (b.active) {
            uint64_t ends = b.triggered_at_ns + params_.breaker_reset_sec * NS_PER_SEC;
            b.time_remaining_ns = ends > now ? ends - now : 0;
        }
    }
    publish(out);
    return b;
}

NudgeStats ConfidenceNudgeEngine::stats() {
    NudgeBreakerStatus b = breaker_status();
    size_t validated = stats_.validated().size();

    std::lock_guard<std::mutex> lock(mtx_);
    NudgeStats s = perf_;
    s.breaker = b;
    s.validated_event_types = validated;
    return s;
}

void ConfidenceNudgeEngine::maintain_locked(uint64_t now, std::vector<Notification>& out) {
    if (!breaker_.active) return;
    if (now < breaker_.triggered_at_ns + params_.breaker_reset_sec * NS_PER_SEC) return;

    breaker_ = NudgeBreakerStatus{};
    consecutive_errors_ = 0;
    perf_.avg_latency_ms = 0.0;
    std::cout << "[NUDGE] Circuit breaker auto-reset\n";
    out.push_back(Notification{NotificationType::NUDGE_BREAKER_RESET, now, "nudge",
                               "auto reset", json{{"reason", "auto reset"}}});
}

void ConfidenceNudgeEngine::trip_locked(uint64_t now, const std::string& reason,
                                        std::vector<Notification>& out) {
    breaker_.active = true;
    breaker_.reason = reason;
    breaker_.triggered_at_ns = now;
    perf_.breaker_triggers++;

    std::cerr << "[NUDGE] Circuit breaker triggered: " << reason << "\n";
    out.push_back(Notification{NotificationType::NUDGE_BREAKER_TRIPPED, now, "nudge", reason,
                               json{{"reason", reason}}});
}

void ConfidenceNudgeEngine::record_error(const std::string& what) {
    std::cerr << "[NUDGE] Error: " << what << "\n";

    std::vector<Notification> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        perf_.errors++;
        consecutive_errors_++;
        if (consecutive_errors_ >= params_.max_consecutive_errors && !breaker_.active) {
            trip_locked(clock_.wall_ns(),
                        std::to_string(consecutive_errors_) + " consecutive errors, last: " + what, out);
        }
    }
    publish(out);
}

void ConfidenceNudgeEngine::publish(std::vector<Notification>& out) {
    for (auto& n : out) bus_.publish(std::move(n));
    out.clear();
}

} // namespace aegis

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/notify/NotificationBus.hpp"
#include "aegis/nudge/EventTypes.hpp"
#include "aegis/nudge/ReactionStats.hpp"

namespace aegis {

struct NudgeParams {
    double confidence_cap = 0.05;          // |nudge| never exceeds this
    double effect_size_cap = 0.6;

    double vix_threshold = 20.0;
    double vix_shrink_per_point = 0.04;
    double min_regime_shrink = 0.5;
    double spread_threshold = 0.5;
    double spread_shrink = 0.8;
    double trend_threshold = 2.0;
    double trend_shrink = 0.7;

    int    min_sample_size = 100;
    double min_abs_effect = 0.2;
    double max_abs_orthogonality = 0.3;

    double   latency_ema_alpha = 0.1;
    double   latency_threshold_ms = 8.0;
    int      max_consecutive_errors = 3;
    uint64_t breaker_reset_sec = 300;
};

struct NudgeBreakerStatus {
    bool active = false;
    std::string reason;
    uint64_t triggered_at_ns = 0;
    uint64_t time_remaining_ns = 0;
};

struct NudgeStats {
    uint64_t nudges_applied = 0;
    double avg_latency_ms = 0.0;
    uint64_t breaker_triggers = 0;
    uint64_t validation_failures = 0;
    uint64_t errors = 0;
    size_t validated_event_types = 0;
    NudgeBreakerStatus breaker;
};

void to_json(nlohmann::json& j, const NudgeBreakerStatus& b);
void to_json(nlohmann::json& j, const NudgeStats& s);

// ---------------------------------------------------------------------------
// Bounded confidence adjustment from validated events.
//
// Output is always within [-confidence_cap, +confidence_cap]. Internal faults
// return 0 and count toward the engine's own breaker; they never reach the
// caller. While the breaker is active every call returns 0.
// ---------------------------------------------------------------------------
class ConfidenceNudgeEngine {
public:
    ConfidenceNudgeEngine(const ReactionStatsProvider& stats, NotificationBus& bus,
                          const Clock& clock, NudgeParams params = {});

    double calculate_nudge(const std::vector<EventSignal>& events,
                           const MarketContext& ctx,
                           const std::string& sector,
                           const std::string& symbol);

    // Admission gate; on pass fills effect_z / reaction fields and sets validated.
    bool validate_event(EventSignal& event, const std::string& sector);

    double regime_shrink(const MarketContext& ctx) const;

    NudgeExplanation explain(double nudge, const std::vector<EventSignal>& events,
                             const MarketContext& ctx);

    void tick();
    void reset_breaker(const std::string& reason = "manual reset");

    NudgeBreakerStatus breaker_status();
    NudgeStats stats();

    const NudgeParams& params() const { return params_; }

private:
    bool passes_gates(const ReactionStats& s) const;

    void maintain_locked(uint64_t now, std::vector<Notification>& out);
    void trip_locked(uint64_t now, const std::string& reason, std::vector<Notification>& out);
    void record_error(const std::string& what);
    void publish(std::vector<Notification>& out);

    const ReactionStatsProvider& stats_;
    NotificationBus& bus_;
    const Clock& clock_;
    const NudgeParams params_;

    std::mutex mtx_;
    NudgeBreakerStatus breaker_;
    NudgeStats perf_;
    int consecutive_errors_ = 0;
};

} // namespace aegis

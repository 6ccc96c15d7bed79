#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace aegis {

// A classified news/catalyst event for one symbol. effect_z and the
// reaction fields are only meaningful once validate_event() admitted it.
struct EventSignal {
    std::string type;
    std::string sector;
    std::string symbol;
    int direction = 1;                 // +1 / -1
    std::optional<double> effect_z;
    double confidence = 0.0;           // [0,1]
    bool validated = false;
    double expected_return_5m = 0.0;
    double hit_rate = 0.0;
};

struct MarketContext {
    double vix = 0.0;
    double spread_percent = 0.0;
    double trend_strength = 0.0;
    std::string regime;
    std::string volatility;
};

struct NudgeFactor {
    std::string event_type;
    std::string direction;             // "positive" / "negative"
    double confidence = 0.0;
    double effect_size = 0.0;
    double expected_return = 0.0;
    double hit_rate = 0.0;
};

struct NudgeExplanation {
    double nudge = 0.0;
    double nudge_bps = 0.0;
    std::string reason;
    double confidence = 0.0;           // |nudge| / cap
    std::vector<NudgeFactor> factors;
    double regime_shrink = 1.0;
    double vix = 0.0;
    bool breaker_active = false;
    uint64_t as_of_ns = 0;
};

void to_json(nlohmann::json& j, const EventSignal& e);
void from_json(const nlohmann::json& j, EventSignal& e);

void to_json(nlohmann::json& j, const MarketContext& m);
void from_json(const nlohmann::json& j, MarketContext& m);

void to_json(nlohmann::json& j, const NudgeFactor& f);
void from_json(const nlohmann::json& j, NudgeFactor& f);

void to_json(nlohmann::json& j, const NudgeExplanation& x);
void from_json(const nlohmann::json& j, NudgeExplanation& x);

} // namespace aegis

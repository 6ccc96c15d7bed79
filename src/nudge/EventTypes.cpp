#include "aegis/nudge/EventTypes.hpp"

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const EventSignal& e) {
    j = json{
        {"type", e.type},
        {"sector", e.sector},
        {"symbol", e.symbol},
        {"direction", e.direction},
        {"confidence", e.confidence},
        {"validated", e.validated},
        {"expectedReturn5m", e.expected_return_5m},
        {"hitRate", e.hit_rate}
    };
    j["effectZ"] = e.effect_z ? json(*e.effect_z) : json(nullptr);
}

void from_json(const json& j, EventSignal& e) {
    e.type = j.at("type").get<std::string>();
    e.sector = j.value("sector", "");
    e.symbol = j.value("symbol", "");
    e.direction = j.value("direction", 1);
    if (j.contains("effectZ") && j.at("effectZ").is_number()) {
        e.effect_z = j.at("effectZ").get<double>();
    } else {
        e.effect_z.reset();
    }
    e.confidence = j.value("confidence", 0.0);
    e.validated = j.value("validated", false);
    e.expected_return_5m = j.value("expectedReturn5m", 0.0);
    e.hit_rate = j.value("hitRate", 0.0);
}

void to_json(json& j, const MarketContext& m) {
    j = json{
        {"vix", m.vix},
        {"spreadPercent", m.spread_percent},
        {"trendStrength", m.trend_strength},
        {"regime", m.regime},
        {"volatility", m.volatility}
    };
}

void from_json(const json& j, MarketContext& m) {
    m.vix = j.value("vix", 0.0);
    m.spread_percent = j.value("spreadPercent", 0.0);
    m.trend_strength = j.value("trendStrength", 0.0);
    m.regime = j.value("regime", "");
    m.volatility = j.value("volatility", "");
}

void to_json(json& j, const NudgeFactor& f) {
    j = json{
        {"eventType", f.event_type},
        {"direction", f.direction},
        {"confidence", f.confidence},
        {"effectSize", f.effect_size},
        {"expectedReturn", f.expected_return},
        {"hitRate", f.hit_rate}
    };
}

void from_json(const json& j, NudgeFactor& f) {
    f.event_type = j.value("eventType", "");
    f.direction = j.value("direction", "");
    f.confidence = j.value("confidence", 0.0);
    f.effect_size = j.value("effectSize", 0.0);
    f.expected_return = j.value("expectedReturn", 0.0);
    f.hit_rate = j.value("hitRate", 0.0);
}

void to_json(json& j, const NudgeExplanation& x) {
    j = json{
        {"nudge", x.nudge},
        {"nudgeBps", x.nudge_bps},
        {"reason", x.reason},
        {"confidence", x.confidence},
        {"factors", x.factors},
        {"regimeShrink", x.regime_shrink},
        {"vixLevel", x.vix},
        {"circuitBreakerActive", x.breaker_active},
        {"asOf", x.as_of_ns}
    };
}

void from_json(const json& j, NudgeExplanation& x) {
    x.nudge = j.value("nudge", 0.0);
    x.nudge_bps = j.value("nudgeBps", 0.0);
    x.reason = j.value("reason", "");
    x.confidence = j.value("confidence", 0.0);
    x.factors = j.value("factors", std::vector<NudgeFactor>{});
    x.regime_shrink = j.value("regimeShrink", 1.0);
    x.vix = j.value("vixLevel", 0.0);
    x.breaker_active = j.value("circuitBreakerActive", false);
    x.as_of_ns = j.value("asOf", uint64_t{0});
}

} // namespace aegis

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aegis/infra/Types.hpp"
#include "aegis/nudge/EventTypes.hpp"

namespace aegis {

struct TradePlan {
    std::string action;                 // buy / sell / hold
    std::string order_type = "market";
    double qty = 0.0;
    std::string sizing;
    std::vector<std::string> exits;
};

struct RiskGate {
    bool position_limits_ok = false;
    bool portfolio_heat_ok = false;
    bool drawdown_ok = false;
    std::vector<std::string> notes;

    int passed_count() const {
        return static_cast<int>(position_limits_ok) +
               static_cast<int>(portfolio_heat_ok) +
               static_cast<int>(drawdown_ok);
    }
};

struct GateOutcome {
    std::string name;
    bool passed = false;
    std::string detail;
};

struct NewsEvidence {
    std::string headline;
    std::string source;
    std::string url;
    double sentiment = 0.0;             // [-1,1]
    double credibility = 0.0;           // [0,1]
    std::string detail;
};

struct ExecutionInfo {
    ExecutionStatus status = ExecutionStatus::PENDING;
    std::vector<std::string> broker_order_ids;
    std::string reason;
    uint64_t updated_at_ns = 0;
};

// Everything except execution and digest is fixed once recorded; the digest
// covers exactly that fixed part.
struct DecisionTrace {
    std::string trace_id;
    std::string symbol;
    uint64_t as_of_ns = 0;

    TradePlan plan;
    RiskGate risk_gate;
    std::vector<GateOutcome> gates;
    std::optional<MarketContext> market_context;
    std::vector<NewsEvidence> news_evidence;
    std::optional<NudgeExplanation> nudge;

    ExecutionInfo execution;
    std::string digest;
};

enum class ProofStrength : uint8_t {
    WEAK = 0,
    MEDIUM,
    STRONG
};

inline const char* proof_strength_to_string(ProofStrength p) {
    switch (p) {
        case ProofStrength::STRONG: return "Strong";
        case ProofStrength::MEDIUM: return "Medium";
        default:                    return "Weak";
    }
}

void to_json(nlohmann::json& j, const TradePlan& p);
void from_json(const nlohmann::json& j, TradePlan& p);

void to_json(nlohmann::json& j, const RiskGate& r);
void from_json(const nlohmann::json& j, RiskGate& r);

void to_json(nlohmann::json& j, const GateOutcome& g);
void from_json(const nlohmann::json& j, GateOutcome& g);

void to_json(nlohmann::json& j, const NewsEvidence& e);
void from_json(const nlohmann::json& j, NewsEvidence& e);

void to_json(nlohmann::json& j, const ExecutionInfo& x);
void from_json(const nlohmann::json& j, ExecutionInfo& x);

void to_json(nlohmann::json& j, const DecisionTrace& t);
void from_json(const nlohmann::json& j, DecisionTrace& t);

// The digested part of a trace, as JSON with sorted keys.
std::string canonical_body(const DecisionTrace& t);

// Lowercase hex SHA-256 of canonical_body().
std::string trace_digest(const DecisionTrace& t);

} // namespace aegis

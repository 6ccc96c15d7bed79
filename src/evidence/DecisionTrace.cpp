#include "aegis/evidence/DecisionTrace.hpp"
#include "aegis/infra/Errors.hpp"

#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const TradePlan& p) {
    j = json{
        {"action", p.action},
        {"orderType", p.order_type},
        {"qty", p.qty},
        {"sizing", p.sizing},
        {"exits", p.exits}
    };
}

void from_json(const json& j, TradePlan& p) {
    p.action = j.value("action", "");
    p.order_type = j.value("orderType", "market");
    p.qty = j.value("qty", 0.0);
    p.sizing = j.value("sizing", "");
    p.exits = j.value("exits", std::vector<std::string>{});
}

void to_json(json& j, const RiskGate& r) {
    j = json{
        {"position_limits_ok", r.position_limits_ok},
        {"portfolio_heat_ok", r.portfolio_heat_ok},
        {"drawdown_ok", r.drawdown_ok},
        {"notes", r.notes}
    };
}

void from_json(const json& j, RiskGate& r) {
    r.position_limits_ok = j.value("position_limits_ok", false);
    r.portfolio_heat_ok = j.value("portfolio_heat_ok", false);
    r.drawdown_ok = j.value("drawdown_ok", false);
    r.notes = j.value("notes", std::vector<std::string>{});
}

void to_json(json& j, const GateOutcome& g) {
    j = json{{"name", g.name}, {"passed", g.passed}, {"detail", g.detail}};
}

void from_json(const json& j, GateOutcome& g) {
    g.name = j.at("name").get<std::string>();
    g.passed = j.at("passed").get<bool>();
    g.detail = j.value("detail", "");
}

void to_json(json& j, const NewsEvidence& e) {
    j = json{
        {"headline", e.headline},
        {"source", e.source},
        {"url", e.url},
        {"sentiment", e.sentiment},
        {"credibility", e.credibility},
        {"detail", e.detail}
    };
}

void from_json(const json& j, NewsEvidence& e) {
    e.headline = j.value("headline", "");
    e.source = j.value("source", "");
    e.url = j.value("url", "");
    e.sentiment = j.value("sentiment", 0.0);
    e.credibility = j.value("credibility", 0.0);
    e.detail = j.value("detail", "");
}

void to_json(json& j, const ExecutionInfo& x) {
    j = json{
        {"status", execution_status_to_string(x.status)},
        {"brokerOrderIds", x.broker_order_ids},
        {"reason", x.reason},
        {"updatedAt", x.updated_at_ns}
    };
}

void from_json(const json& j, ExecutionInfo& x) {
    x.status = execution_status_from_string(j.value("status", "pending"));
    x.broker_order_ids = j.value("brokerOrderIds", std::vector<std::string>{});
    x.reason = j.value("reason", "");
    x.updated_at_ns = j.value("updatedAt", uint64_t{0});
}

static json body_json(const DecisionTrace& t) {
    json j{
        {"trace_id", t.trace_id},
        {"symbol", t.symbol},
        {"as_of", t.as_of_ns},
        {"plan", t.plan},
        {"risk_gate", t.risk_gate},
        {"gates", t.gates},
        {"news_evidence", t.news_evidence}
    };
    j["market_context"] = t.market_context ? json(*t.market_context) : json(nullptr);
    j["nudge"] = t.nudge ? json(*t.nudge) : json(nullptr);
    return j;
}

void to_json(json& j, const DecisionTrace& t) {
    j = body_json(t);
    j["execution"] = t.execution;
    j["digest"] = t.digest;
}

void from_json(const json& j, DecisionTrace& t) {
    t.trace_id = j.value("trace_id", "");
    t.symbol = j.at("symbol").get<std::string>();
    t.as_of_ns = j.value("as_of", uint64_t{0});
    t.plan = j.value("plan", TradePlan{});
    t.risk_gate = j.value("risk_gate", RiskGate{});
    t.gates = j.value("gates", std::vector<GateOutcome>{});
    t.news_evidence = j.value("news_evidence", std::vector<NewsEvidence>{});

    if (j.contains("market_context") && j.at("market_context").is_object()) {
        t.market_context = j.at("market_context").get<MarketContext>();
    } else {
        t.market_context.reset();
    }
    if (j.contains("nudge") && j.at("nudge").is_object()) {
        t.nudge = j.at("nudge").get<NudgeExplanation>();
    } else {
        t.nudge.reset();
    }
    if (j.contains("execution")) {
        t.execution = j.at("execution").get<ExecutionInfo>();
    }
    t.digest = j.value("digest", "");
}

std::string canonical_body(const DecisionTrace& t) {
    // nlohmann's default object type is an ordered std::map, so dump() is
    // key-sorted and stable.
    return body_json(t).dump();
}

std::string trace_digest(const DecisionTrace& t) {
    const std::string body = canonical_body(t);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw AegisError(ErrorKind::STORE_FAILURE, "EVP_MD_CTX_new failed");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), body.data(), body.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw AegisError(ErrorKind::STORE_FAILURE, "SHA-256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace aegis

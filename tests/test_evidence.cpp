#include <gtest/gtest.h>

#include "aegis/evidence/DecisionRecorder.hpp"
#include "aegis/infra/Errors.hpp"
#include "aegis/store/MemoryStateStore.hpp"

using namespace aegis;

namespace {

DecisionTrace buy(const std::string& symbol = "AAPL") {
    DecisionTrace t;
    t.symbol = symbol;
    t.plan.action = "buy";
    t.plan.qty = 10;
    t.plan.sizing = "fixed_fraction";
    t.risk_gate.position_limits_ok = true;
    t.risk_gate.portfolio_heat_ok = true;
    t.risk_gate.drawdown_ok = true;
    t.gates.push_back({"position_limits", true, ""});
    return t;
}

NewsEvidence article(double credibility) {
    NewsEvidence e;
    e.headline = "Supplier confirms expanded order";
    e.source = "wire";
    e.sentiment = 0.6;
    e.credibility = credibility;
    return e;
}

} // namespace

// --- Proof strength ---

TEST(DecisionRecorder, ProofStrengthLevels) {
    auto t = buy();
    EXPECT_EQ(DecisionRecorder::proof_strength(t), ProofStrength::WEAK);

    t.news_evidence.push_back(article(0.5));
    EXPECT_EQ(DecisionRecorder::proof_strength(t), ProofStrength::MEDIUM);

    // Strong needs context plus either two articles or one credible one.
    t.market_context = MarketContext{};
    EXPECT_EQ(DecisionRecorder::proof_strength(t), ProofStrength::MEDIUM);
    t.news_evidence.push_back(article(0.3));
    EXPECT_EQ(DecisionRecorder::proof_strength(t), ProofStrength::STRONG);

    auto credible = buy();
    credible.market_context = MarketContext{};
    credible.news_evidence.push_back(article(0.8));
    EXPECT_EQ(DecisionRecorder::proof_strength(credible), ProofStrength::STRONG);

    // A failed gate caps it at medium.
    credible.gates.push_back({"safety", false, "cooldown"});
    EXPECT_EQ(DecisionRecorder::proof_strength(credible), ProofStrength::MEDIUM);

    credible.risk_gate.drawdown_ok = false;
    credible.risk_gate.portfolio_heat_ok = false;
    EXPECT_EQ(DecisionRecorder::proof_strength(credible), ProofStrength::WEAK);
}

// --- Recording ---

TEST(DecisionRecorder, RecordAssignsIdAndDigest) {
    ManualClock clock;
    MemoryStateStore store;
    DecisionRecorder rec(store, clock);

    auto t = rec.record(buy());
    EXPECT_EQ(t.trace_id.rfind("trace_", 0), 0u);
    EXPECT_EQ(t.as_of_ns, clock.wall_ns());
    EXPECT_EQ(t.execution.status, ExecutionStatus::PENDING);
    EXPECT_EQ(t.digest.size(), 64u);
    EXPECT_TRUE(DecisionRecorder::verify(t));

    auto tampered = t;
    tampered.plan.qty = 1000;
    EXPECT_FALSE(DecisionRecorder::verify(tampered));

    // Execution is outside the digested body.
    auto executed = rec.update_execution(t.trace_id, ExecutionStatus::FILLED, {"paper-1"}, "");
    EXPECT_TRUE(DecisionRecorder::verify(executed));

    EXPECT_THROW(rec.record(DecisionTrace{}), InvalidArgument);
}

TEST(DecisionRecorder, ExecutionMovesForwardOnly) {
    ManualClock clock;
    MemoryStateStore store;
    DecisionRecorder rec(store, clock);
    auto t = rec.record(buy());

    auto live = rec.update_execution(t.trace_id, ExecutionStatus::LIVE, {"ext-1"}, "");
    EXPECT_EQ(live.execution.status, ExecutionStatus::LIVE);
    EXPECT_THROW(rec.update_execution(t.trace_id, ExecutionStatus::BLOCKED, {}, ""), InvalidState);

    auto filled = rec.update_execution(t.trace_id, ExecutionStatus::FILLED, {}, "done");
    EXPECT_EQ(filled.execution.broker_order_ids, std::vector<std::string>{"ext-1"});
    EXPECT_THROW(rec.update_execution(t.trace_id, ExecutionStatus::CANCELLED, {}, ""), InvalidState);

    EXPECT_THROW(rec.update_execution("trace_missing", ExecutionStatus::FILLED, {}, ""), NotFound);

    EXPECT_TRUE(DecisionRecorder::transition_allowed(ExecutionStatus::PENDING, ExecutionStatus::BLOCKED));
    EXPECT_FALSE(DecisionRecorder::transition_allowed(ExecutionStatus::REJECTED, ExecutionStatus::FILLED));
}

TEST(DecisionRecorder, BySymbolIsMostRecentFirst) {
    ManualClock clock;
    MemoryStateStore store;
    DecisionRecorder rec(store, clock);

    auto a = rec.record(buy("AAPL"));
    clock.advance_ms(5);
    rec.record(buy("MSFT"));
    clock.advance_ms(5);
    auto c = rec.record(buy("AAPL"));

    auto aapl = rec.by_symbol("AAPL", 20);
    ASSERT_EQ(aapl.size(), 2u);
    EXPECT_EQ(aapl[0].trace_id, c.trace_id);
    EXPECT_EQ(aapl[1].trace_id, a.trace_id);

    EXPECT_EQ(rec.by_symbol("AAPL", 1).size(), 1u);
    EXPECT_TRUE(rec.by_symbol("TSLA", 20).empty());
    EXPECT_EQ(rec.recent(10).size(), 3u);
}

TEST(DecisionRecorder, ReplayRestoresTracesAndStatus) {
    ManualClock clock;
    MemoryStateStore store;
    std::string id;
    {
        DecisionRecorder rec(store, clock);
        auto t = buy();
        t.news_evidence.push_back(article(0.9));
        t.market_context = MarketContext{};
        t.market_context->vix = 18.5;
        id = rec.record(t).trace_id;
        rec.update_execution(id, ExecutionStatus::LIVE, {"ext-9"}, "");
        rec.update_execution(id, ExecutionStatus::FILLED, {}, "");
    }
    // A stray update for an unknown trace is skipped on replay.
    store.append(DecisionRecorder::STATUS_LOG,
                 nlohmann::json{{"traceId", "trace_gone"}, {"status", "filled"}});

    DecisionRecorder rec(store, clock);
    rec.load();
    auto t = rec.get(id);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->execution.status, ExecutionStatus::FILLED);
    EXPECT_EQ(t->execution.broker_order_ids, std::vector<std::string>{"ext-9"});
    ASSERT_TRUE(t->market_context.has_value());
    EXPECT_DOUBLE_EQ(t->market_context->vix, 18.5);
    EXPECT_TRUE(DecisionRecorder::verify(*t));

    // New ids do not collide with replayed ones.
    auto next = rec.record(buy());
    EXPECT_NE(next.trace_id, id);
    EXPECT_EQ(rec.size(), 2u);
}

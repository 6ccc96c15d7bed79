#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <stdexcept>

#include "aegis/infra/Errors.hpp"
#include "aegis/ledger/CapitalLedger.hpp"
#include "aegis/pipeline/PaperTradeValidator.hpp"
#include "aegis/pipeline/PromotionPipeline.hpp"
#include "aegis/store/MemoryStateStore.hpp"
#include "TestSupport.hpp"

using namespace aegis;

namespace {

// Returns a fixed verdict, or throws when fault is set.
class ScriptedValidator : public CandidateValidator {
public:
    ValidationPerformance next;
    bool fault = false;
    int calls = 0;
    ValidationWindow last_window;

    ValidationPerformance evaluate(const StrategyCandidate&, const PromotionCriteria&,
                                   const ValidationWindow& window) override {
        calls++;
        last_window = window;
        if (fault) throw std::runtime_error("market data gap");
        return next;
    }
};

// Seeded random verdicts, for exercising the sweep over many candidates.
class RandomValidator : public CandidateValidator {
public:
    explicit RandomValidator(unsigned seed) : rng_(seed) {}

    ValidationPerformance evaluate(const StrategyCandidate&, const PromotionCriteria&,
                                   const ValidationWindow&) override {
        std::uniform_real_distribution<double> pnl(-500.0, 1500.0);
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        ValidationPerformance p;
        p.pnl = pnl(rng_);
        p.win_rate = 0.4 + unit(rng_) * 0.4;
        p.drawdown = unit(rng_) * 0.2;
        p.trades = 30;
        return p;
    }

private:
    std::mt19937 rng_;
};

class FailingDeployer : public StrategyDeployer {
public:
    DeployedStrategy deploy(const StrategyCandidate&, const std::string&,
                            const std::string&, double) override {
        throw std::runtime_error("execution host unreachable");
    }

    std::optional<DeployedStrategy> find_deployment(const std::string&,
                                                    const std::string&) const override {
        return std::nullopt;
    }

    void withdraw(const std::string&) override {}
};

// Memory store whose next commit touching a watched key prefix fails once.
// fail_erase_once only watches erased keys.
class FlakyStore : public StateStore {
public:
    MemoryStateStore inner;
    std::vector<std::string> fail_once;
    std::vector<std::string> fail_erase_once;

    std::optional<nlohmann::json> get(const std::string& key) const override { return inner.get(key); }

    std::vector<std::pair<std::string, nlohmann::json>>
    scan(const std::string& prefix) const override { return inner.scan(prefix); }

    void commit(const WriteBatch& batch) override {
        for (auto it = fail_once.begin(); it != fail_once.end(); ++it) {
            if (touches(batch.puts, *it) || touches(batch.erases, *it)) {
                fail_once.erase(it);
                throw StoreFailure("disk full");
            }
        }
        for (auto it = fail_erase_once.begin(); it != fail_erase_once.end(); ++it) {
            if (touches(batch.erases, *it)) {
                fail_erase_once.erase(it);
                throw StoreFailure("disk full");
            }
        }
        inner.commit(batch);
    }

    void append(const std::string& log, const nlohmann::json& record) override {
        inner.append(log, record);
    }

    std::vector<nlohmann::json> read_log(const std::string& log) const override {
        return inner.read_log(log);
    }

private:
    static bool touches(const std::vector<std::pair<std::string, nlohmann::json>>& puts,
                        const std::string& prefix) {
        for (const auto& kv : puts) {
            if (kv.first.rfind(prefix, 0) == 0) return true;
        }
        return false;
    }

    static bool touches(const std::vector<std::string>& keys, const std::string& prefix) {
        for (const auto& k : keys) {
            if (k.rfind(prefix, 0) == 0) return true;
        }
        return false;
    }
};

PromotionCriteria conservative() {
    PromotionCriteria c;
    c.min_generations = 10;
    c.min_fitness = 2.0;
    c.min_win_rate = 0.55;
    c.max_drawdown = 0.15;
    c.min_trades = 100;
    c.consistency_score = 0.7;
    c.validation_period_days = 7;
    return c;
}

PromotionCriteria high_freq() {
    PromotionCriteria c;
    c.min_generations = 3;
    c.min_fitness = 1.2;
    c.min_win_rate = 0.65;
    c.max_drawdown = 0.10;
    c.min_trades = 200;
    c.consistency_score = 0.8;
    c.validation_period_days = 1;
    return c;
}

// consistency = 0.4*0.65 + 0.3*min(1.8/2,1) + 0.3*min(1.82/3,1) = 0.712
StrategyCandidate good_candidate(const std::string& id = "cand_1") {
    StrategyCandidate c;
    c.id = id;
    c.name = "momentum " + id;
    c.fitness = 2.4;
    c.generation = 12;
    c.experiment_id = "exp_" + id;
    c.performance.total_trades = 150;
    c.performance.win_rate = 0.65;
    c.performance.profit_factor = 1.8;
    c.performance.max_drawdown = 0.12;
    c.performance.sharpe_ratio = 1.82;
    c.metadata.risk_level = RiskLevel::LOW;
    c.metadata.strategy_type = "momentum";
    return c;
}

ValidationPerformance winning() {
    ValidationPerformance p;
    p.pnl = 600;
    p.win_rate = 0.72;
    p.drawdown = 0.04;
    p.trades = 40;
    return p;
}

struct PipelineFixture : ::testing::Test {
    ManualClock clock;
    MemoryStateStore store;
    NotificationBus bus{clock};
    test::Recorder notes{bus};
    CapitalLedger ledger{store, bus, clock};
    ScriptedValidator validator;
    StrategyRegistry registry{store, clock};
    PromotionPipeline pipeline{store, bus, clock, ledger, validator, registry};

    void SetUp() override {
        ledger.create_pool("competition_pool", "Competition Pool", PoolPurpose::COMPETITION,
                           RiskLevel::MEDIUM, 50000);
        pipeline.create_pipeline("conservative", "Conservative", conservative(), true);
        pipeline.create_pipeline("high_freq", "High Frequency", high_freq(), false);
    }
};

} // namespace

// --- Qualification ---

TEST_F(PipelineFixture, ConsistencyScoreBlendsNormalizedMetrics) {
    auto c = good_candidate();
    EXPECT_NEAR(pipeline.consistency_score(c.performance), 0.712, 1e-9);
    EXPECT_TRUE(pipeline.evaluate_candidate(c, conservative()));

    c.performance.max_drawdown = 0.20;
    EXPECT_FALSE(pipeline.evaluate_candidate(c, conservative()));
}

TEST_F(PipelineFixture, AnySingleFailingCriterionDisqualifies) {
    const auto criteria = conservative();
    ASSERT_TRUE(pipeline.evaluate_candidate(good_candidate(), criteria));

    auto c = good_candidate();
    c.generation = 9;
    EXPECT_FALSE(pipeline.evaluate_candidate(c, criteria));

    c = good_candidate();
    c.fitness = 1.99;
    EXPECT_FALSE(pipeline.evaluate_candidate(c, criteria));

    c = good_candidate();
    c.performance.win_rate = 0.54;
    EXPECT_FALSE(pipeline.evaluate_candidate(c, criteria));

    c = good_candidate();
    c.performance.total_trades = 99;
    EXPECT_FALSE(pipeline.evaluate_candidate(c, criteria));

    // 0.4*0.65 + 0.3*min(1.2/2,1) + 0.3*min(1.82/3,1) = 0.622, everything else passes.
    c = good_candidate();
    c.performance.profit_factor = 1.2;
    EXPECT_LT(pipeline.consistency_score(c.performance), 0.7);
    EXPECT_FALSE(pipeline.evaluate_candidate(c, criteria));
}

TEST_F(PipelineFixture, CandidateJoinsOnlyActiveQualifyingPipelines) {
    auto joined = pipeline.add_candidate(good_candidate());
    ASSERT_EQ(joined.size(), 1u);
    EXPECT_EQ(joined[0], "conservative");

    // Already a member: not added twice.
    EXPECT_TRUE(pipeline.add_candidate(good_candidate()).empty());
    EXPECT_EQ(pipeline.pipeline("conservative")->candidates.size(), 1u);
    EXPECT_TRUE(pipeline.pipeline("high_freq")->candidates.empty());
}

TEST_F(PipelineFixture, MalformedCandidateRejected) {
    auto c = good_candidate();
    c.performance.win_rate = 1.4;
    EXPECT_THROW(pipeline.add_candidate(c), InvalidArgument);

    c = good_candidate();
    c.id.clear();
    EXPECT_THROW(pipeline.add_candidate(c), InvalidArgument);
}

TEST_F(PipelineFixture, DuplicatePipelineIdIsInvalidState) {
    EXPECT_THROW(pipeline.create_pipeline("conservative", "again", conservative(), true),
                 InvalidState);
    EXPECT_THROW(pipeline.set_pipeline_active("missing", true), NotFound);
}

// --- Promotion ---

TEST_F(PipelineFixture, PassingValidationDeploysWithCapital) {
    pipeline.add_candidate(good_candidate());
    validator.next = winning();

    auto r = pipeline.promote_candidate("cand_1", "conservative");
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.feedback.front(), "Passed all validation criteria");

    auto p = *pipeline.pipeline("conservative");
    EXPECT_TRUE(p.candidates.empty());
    ASSERT_EQ(p.promoted.size(), 1u);
    EXPECT_EQ(p.promoted[0].id, "cand_1");

    auto deployed = registry.find("strat_cand_1@conservative");
    ASSERT_TRUE(deployed.has_value());
    EXPECT_DOUBLE_EQ(deployed->capital, 1000.0);

    auto allocs = ledger.allocations(true);
    ASSERT_EQ(allocs.size(), 1u);
    EXPECT_EQ(allocs[0].id, deployed->allocation_id);
    EXPECT_EQ(allocs[0].experiment_id, "exp_cand_1");
    EXPECT_EQ(notes.count(NotificationType::STRATEGY_PROMOTED), 1u);
    EXPECT_EQ(pipeline.validation_results("cand_1").size(), 1u);
}

TEST_F(PipelineFixture, FailingValidationRejectsWithoutCapital) {
    pipeline.add_candidate(good_candidate());
    validator.next = winning();
    validator.next.pnl = -80;
    validator.next.drawdown = 0.2;

    auto r = pipeline.promote_candidate("cand_1", "conservative");
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.feedback[0], "Failed validation criteria");
    EXPECT_EQ(r.feedback[1], "Negative P&L during validation");
    EXPECT_EQ(r.feedback[2], "Excessive drawdown");

    auto p = *pipeline.pipeline("conservative");
    EXPECT_EQ(p.rejected.size(), 1u);
    EXPECT_TRUE(ledger.allocations(true).empty());
    EXPECT_TRUE(registry.all().empty());
    EXPECT_EQ(notes.count(NotificationType::STRATEGY_REJECTED), 1u);

    auto stats = pipeline.stats();
    EXPECT_EQ(stats.total_rejected, 1u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.0);
}

TEST_F(PipelineFixture, ValidatorFaultLeavesCandidatePending) {
    pipeline.add_candidate(good_candidate());
    validator.fault = true;

    try {
        pipeline.promote_candidate("cand_1", "conservative");
        FAIL() << "expected a validation failure";
    } catch (const AegisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION_FAILED);
    }
    EXPECT_EQ(pipeline.pipeline("conservative")->candidates.size(), 1u);
    EXPECT_TRUE(pipeline.validation_results("cand_1").empty());

    // The pair is not stuck in flight.
    validator.fault = false;
    validator.next = winning();
    EXPECT_TRUE(pipeline.promote_candidate("cand_1", "conservative").passed);
}

TEST_F(PipelineFixture, UnknownOrSettledPairsAreRefused) {
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "conservative"), NotFound);

    pipeline.add_candidate(good_candidate());
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "nope"), NotFound);
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "high_freq"), InvalidState);

    validator.next = winning();
    pipeline.promote_candidate("cand_1", "conservative");
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "conservative"), InvalidState);
    EXPECT_EQ(validator.calls, 1);
}

TEST(PromotionDeployment, FailedDeploymentReleasesCapital) {
    ManualClock clock;
    MemoryStateStore store;
    NotificationBus bus(clock);
    test::Recorder notes(bus);
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("competition_pool", "Competition Pool", PoolPurpose::COMPETITION,
                       RiskLevel::MEDIUM, 50000);
    ScriptedValidator validator;
    validator.next = winning();
    FailingDeployer deployer;
    PromotionPipeline pipeline(store, bus, clock, ledger, validator, deployer);
    pipeline.create_pipeline("conservative", "Conservative", conservative(), true);
    pipeline.add_candidate(good_candidate());

    EXPECT_THROW(pipeline.promote_candidate("cand_1", "conservative"), DeploymentFailure);

    EXPECT_EQ(pipeline.pipeline("conservative")->candidates.size(), 1u);
    EXPECT_TRUE(pipeline.pipeline("conservative")->promoted.empty());
    EXPECT_TRUE(ledger.allocations(true).empty());
    EXPECT_DOUBLE_EQ(ledger.pool("competition_pool")->allocated_capital, 0.0);
    EXPECT_EQ(notes.count(NotificationType::DEPLOYMENT_FAILED), 1u);
    EXPECT_EQ(notes.count(NotificationType::STRATEGY_PROMOTED), 0u);
}

TEST(PromotionRecovery, UnrecordedPromotionIsUndoneAndRetried) {
    ManualClock clock;
    FlakyStore store;
    NotificationBus bus(clock);
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("competition_pool", "Competition Pool", PoolPurpose::COMPETITION,
                       RiskLevel::MEDIUM, 50000);
    ScriptedValidator validator;
    validator.next = winning();
    StrategyRegistry registry(store, clock);
    PromotionPipeline pipeline(store, bus, clock, ledger, validator, registry);
    pipeline.create_pipeline("conservative", "Conservative", conservative(), true);
    pipeline.add_candidate(good_candidate());

    store.fail_once = {"pipeline."};
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "conservative"), StoreFailure);

    // Deployment and capital were taken back; the candidate is still pending.
    EXPECT_TRUE(registry.all().empty());
    EXPECT_TRUE(ledger.allocations(true).empty());
    EXPECT_EQ(pipeline.pipeline("conservative")->candidates.size(), 1u);

    clock.advance_sec(7 * 86400);
    EXPECT_EQ(pipeline.check_for_promotions(), 1u);
    auto p = *pipeline.pipeline("conservative");
    EXPECT_TRUE(p.candidates.empty());
    EXPECT_EQ(p.promoted.size(), 1u);
    EXPECT_EQ(registry.all().size(), 1u);
    EXPECT_EQ(ledger.allocations(true).size(), 1u);
}

TEST(PromotionRecovery, LeftoverDeploymentIsAdoptedNotRedeployed) {
    ManualClock clock;
    FlakyStore store;
    NotificationBus bus(clock);
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("competition_pool", "Competition Pool", PoolPurpose::COMPETITION,
                       RiskLevel::MEDIUM, 50000);
    ScriptedValidator validator;
    validator.next = winning();
    StrategyRegistry registry(store, clock);
    PromotionPipeline pipeline(store, bus, clock, ledger, validator, registry);
    pipeline.create_pipeline("conservative", "Conservative", conservative(), true);
    pipeline.add_candidate(good_candidate());

    // Neither the membership move nor the withdrawal can be written.
    store.fail_once = {"pipeline."};
    store.fail_erase_once = {"strategy."};
    EXPECT_THROW(pipeline.promote_candidate("cand_1", "conservative"), StoreFailure);
    ASSERT_EQ(registry.all().size(), 1u);
    ASSERT_EQ(ledger.allocations(true).size(), 1u);

    // The next sweep finishes the move from the recorded pass.
    validator.fault = true;
    clock.advance_sec(7 * 86400);
    EXPECT_EQ(pipeline.check_for_promotions(), 1u);
    EXPECT_EQ(validator.calls, 1);
    EXPECT_EQ(pipeline.pipeline("conservative")->promoted.size(), 1u);
    EXPECT_EQ(registry.all().size(), 1u);
    EXPECT_EQ(ledger.allocations(true).size(), 1u);
    EXPECT_EQ(pipeline.validation_results("cand_1").size(), 1u);
}

TEST_F(PipelineFixture, OrphanDeploymentWithdrawnWhenValidationFails) {
    pipeline.add_candidate(good_candidate());
    auto a = ledger.allocate_capital("competition_pool", "exp_cand_1", 1000, RiskLevel::LOW);
    registry.deploy(good_candidate(), "conservative", a.id, 1000);

    validator.next = winning();
    validator.next.pnl = -50;
    auto r = pipeline.promote_candidate("cand_1", "conservative");
    EXPECT_FALSE(r.passed);
    EXPECT_TRUE(registry.all().empty());
    EXPECT_TRUE(ledger.allocations(true).empty());
    EXPECT_EQ(pipeline.pipeline("conservative")->rejected.size(), 1u);
}

TEST_F(PipelineFixture, OrphanDeploymentKeptWhenValidationPasses) {
    pipeline.add_candidate(good_candidate());
    auto a = ledger.allocate_capital("competition_pool", "exp_cand_1", 1000, RiskLevel::LOW);
    registry.deploy(good_candidate(), "conservative", a.id, 1000);

    validator.next = winning();
    EXPECT_TRUE(pipeline.promote_candidate("cand_1", "conservative").passed);
    ASSERT_EQ(registry.all().size(), 1u);
    EXPECT_EQ(registry.all()[0].allocation_id, a.id);
    EXPECT_EQ(ledger.allocations(true).size(), 1u);
}

TEST_F(PipelineFixture, HugeValidationPeriodCapsWindowAtNow) {
    auto c = conservative();
    c.validation_period_days = 1e300;
    pipeline.create_pipeline("forever", "Forever", c, true);
    pipeline.add_candidate(good_candidate());
    validator.next = winning();

    clock.advance_sec(86400);
    pipeline.promote_candidate("cand_1", "forever");
    EXPECT_EQ(validator.last_window.end_ns - validator.last_window.start_ns, NS_PER_DAY);

    c.validation_period_days = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(pipeline.create_pipeline("nan", "NaN", c, true), InvalidArgument);
}

// --- Sweep ---

TEST_F(PipelineFixture, SweepWaitsForValidationPeriod) {
    pipeline.add_candidate(good_candidate("a"));
    pipeline.add_candidate(good_candidate("b"));
    validator.next = winning();

    clock.advance_sec(6 * 86400);
    EXPECT_EQ(pipeline.check_for_promotions(), 0u);
    EXPECT_EQ(validator.calls, 0);

    clock.advance_sec(86400);
    EXPECT_EQ(pipeline.check_for_promotions(), 2u);
    EXPECT_EQ(pipeline.pipeline("conservative")->promoted.size(), 2u);
    EXPECT_EQ(validator.last_window.end_ns - validator.last_window.start_ns, 7 * NS_PER_DAY);
}

TEST_F(PipelineFixture, SweepLeavesFaultedCandidatesPending) {
    pipeline.add_candidate(good_candidate());
    validator.fault = true;
    clock.advance_sec(8 * 86400);

    EXPECT_EQ(pipeline.check_for_promotions(), 0u);
    EXPECT_EQ(pipeline.stats().total_pending, 1u);
}

TEST_F(PipelineFixture, StateSurvivesReload) {
    pipeline.add_candidate(good_candidate("a"));
    pipeline.add_candidate(good_candidate("b"));
    validator.next = winning();
    pipeline.promote_candidate("a", "conservative");

    ScriptedValidator v2;
    StrategyRegistry r2(store, clock);
    r2.load();
    PromotionPipeline reloaded(store, bus, clock, ledger, v2, r2);
    reloaded.load();

    auto p = *reloaded.pipeline("conservative");
    EXPECT_EQ(p.promoted.size(), 1u);
    EXPECT_EQ(p.candidates.size(), 1u);
    EXPECT_FALSE(reloaded.pipeline("high_freq")->active);
    EXPECT_TRUE(reloaded.candidate("b").has_value());
    EXPECT_EQ(reloaded.validation_results("a").size(), 1u);
    EXPECT_EQ(r2.all().size(), 1u);
}

TEST(PromotionSweep, EveryCandidateEndsInExactlyOneSet) {
    ManualClock clock;
    MemoryStateStore store;
    NotificationBus bus(clock);
    CapitalLimits wide;
    wide.max_concurrent_experiments = 100;
    CapitalLedger ledger(store, bus, clock, wide);
    ledger.create_pool("competition_pool", "Competition Pool", PoolPurpose::COMPETITION,
                       RiskLevel::MEDIUM, 1000000);
    RandomValidator validator(42);
    StrategyRegistry registry(store, clock);
    PromotionPipeline pipeline(store, bus, clock, ledger, validator, registry);
    pipeline.create_pipeline("conservative", "Conservative", conservative(), true);

    for (int i = 0; i < 40; ++i) pipeline.add_candidate(good_candidate("c" + std::to_string(i)));
    clock.advance_sec(7 * 86400);
    EXPECT_EQ(pipeline.check_for_promotions(), 40u);

    auto p = *pipeline.pipeline("conservative");
    EXPECT_TRUE(p.candidates.empty());
    EXPECT_EQ(p.promoted.size() + p.rejected.size(), 40u);
    for (int i = 0; i < 40; ++i) {
        std::string id = "c" + std::to_string(i);
        int seen = 0;
        for (const auto& c : p.promoted) seen += c.id == id;
        for (const auto& c : p.rejected) seen += c.id == id;
        EXPECT_EQ(seen, 1) << id;
    }
    EXPECT_EQ(registry.all().size(), p.promoted.size());
    EXPECT_EQ(ledger.allocations(true).size(), p.promoted.size());
}

// --- PaperTradeValidator ---

TEST(PaperTradeValidator, ScoresTradesInsideWindow) {
    MemoryStateStore store;
    PaperTradeValidator v(store, 10000);
    const uint64_t t0 = 1'000 * NS_PER_SEC;

    v.record_trade("c", 100, t0 + 1);
    v.record_trade("c", -300, t0 + 2);
    v.record_trade("c", 50, t0 + 3);
    v.record_trade("c", 999, t0 + 10 * NS_PER_SEC);   // after the window
    v.record_trade("other", 5, t0 + 1);

    ValidationWindow w;
    w.start_ns = t0;
    w.end_ns = t0 + NS_PER_SEC;
    auto perf = v.evaluate(good_candidate("c"), PromotionCriteria{}, w);

    EXPECT_EQ(perf.trades, 3);
    EXPECT_DOUBLE_EQ(perf.pnl, -150);
    EXPECT_NEAR(perf.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(perf.drawdown, 300.0 / 10100.0, 1e-12);
}

TEST(PaperTradeValidator, NoTradesIsAFailingVerdict) {
    MemoryStateStore store;
    PaperTradeValidator v(store, 10000);
    auto perf = v.evaluate(good_candidate(), conservative(), ValidationWindow{0, 100, 7});
    auto r = PromotionPipeline::build_result(perf, conservative(), ScoreWeights{});
    EXPECT_FALSE(r.passed);
}

TEST(PaperTradeValidator, TradesSurviveReload) {
    MemoryStateStore store;
    {
        PaperTradeValidator v(store, 10000);
        v.record_trade("c", 10, 1);
        v.record_trade("c", -5, 2);
    }
    PaperTradeValidator v(store, 10000);
    v.load();
    EXPECT_EQ(v.trade_count("c"), 2u);
    EXPECT_THROW(v.record_trade("c", std::numeric_limits<double>::quiet_NaN(), 3), InvalidArgument);
    EXPECT_THROW(PaperTradeValidator(store, 0), InvalidArgument);
}

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

#include "aegis/ledger/CapitalLedger.hpp"
#include "aegis/store/MemoryStateStore.hpp"
#include "TestSupport.hpp"

using namespace aegis;

namespace {

CapitalLimits wide_limits() {
    CapitalLimits l;
    l.max_per_experiment_low = 100000.0;
    l.max_per_experiment_medium = 100000.0;
    l.max_per_experiment_high = 100000.0;
    l.max_concurrent_experiments = 1000;
    return l;
}

struct LedgerFixture : ::testing::Test {
    ManualClock clock;
    MemoryStateStore store;
    NotificationBus bus{clock};
    test::Recorder notes{bus};
};

} // namespace

// --- Pools / allocation ---

TEST_F(LedgerFixture, AllocateMovesCapitalAndLogsTransaction) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("research_pool", "Research", PoolPurpose::RESEARCH, RiskLevel::LOW, 10000);

    auto a = ledger.allocate_capital("research_pool", "exp-1", 800, RiskLevel::LOW);
    EXPECT_TRUE(a.active());
    EXPECT_EQ(a.pool_id, "research_pool");

    auto p = *ledger.pool("research_pool");
    EXPECT_DOUBLE_EQ(p.allocated_capital, 800);
    EXPECT_DOUBLE_EQ(p.available(), 9200);

    auto txns = ledger.transactions("research_pool");
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns[0].type, TransactionType::POOL_CREATED);
    EXPECT_EQ(txns[1].type, TransactionType::ALLOCATION);
    EXPECT_EQ(txns[1].allocation_id, a.id);
    EXPECT_EQ(notes.count(NotificationType::CAPITAL_ALLOCATION_CHANGED), 1u);
}

TEST_F(LedgerFixture, InsufficientCapitalLeavesPoolUntouched) {
    CapitalLedger ledger(store, bus, clock, wide_limits());
    ledger.create_pool("big", "Big", PoolPurpose::COMPETITION, RiskLevel::MEDIUM, 100000);
    ledger.allocate_capital("big", "exp-1", 90000, RiskLevel::MEDIUM);

    const auto commits = store.commit_count();
    EXPECT_THROW(ledger.allocate_capital("big", "exp-2", 20000, RiskLevel::MEDIUM),
                 InsufficientCapital);

    EXPECT_DOUBLE_EQ(ledger.pool("big")->allocated_capital, 90000);
    EXPECT_EQ(ledger.allocations(true).size(), 1u);
    EXPECT_EQ(store.commit_count(), commits);
}

TEST_F(LedgerFixture, PerRiskAndConcurrencyLimits) {
    CapitalLimits limits;
    limits.max_concurrent_experiments = 2;
    CapitalLedger ledger(store, bus, clock, limits);
    ledger.create_pool("p", "P", PoolPurpose::RESEARCH, RiskLevel::LOW, 50000);

    EXPECT_THROW(ledger.allocate_capital("p", "e0", 1500, RiskLevel::LOW), LimitExceeded);
    ledger.allocate_capital("p", "e1", 2500, RiskLevel::MEDIUM);
    ledger.allocate_capital("p", "e2", 5000, RiskLevel::HIGH);
    EXPECT_THROW(ledger.allocate_capital("p", "e3", 100, RiskLevel::LOW), LimitExceeded);
}

TEST_F(LedgerFixture, RejectsBadInput) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("p", "P", PoolPurpose::RESEARCH, RiskLevel::LOW, 1000);

    EXPECT_THROW(ledger.allocate_capital("p", "e", 0, RiskLevel::LOW), InvalidArgument);
    EXPECT_THROW(ledger.allocate_capital("p", "e", -5, RiskLevel::LOW), InvalidArgument);
    EXPECT_THROW(ledger.allocate_capital("p", "e", NAN, RiskLevel::LOW), InvalidArgument);
    EXPECT_THROW(ledger.allocate_capital("missing", "e", 10, RiskLevel::LOW), NotFound);
    EXPECT_THROW(ledger.create_pool("p", "dup", PoolPurpose::RESEARCH, RiskLevel::LOW, 1), InvalidState);
    EXPECT_THROW(ledger.release_capital("nope", 0), NotFound);
}

// --- Release ---

TEST_F(LedgerFixture, ReleaseReturnsExactlyTheAllocatedAmount) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("p", "P", PoolPurpose::VALIDATION, RiskLevel::MEDIUM, 10000);
    auto a1 = ledger.allocate_capital("p", "e1", 1000, RiskLevel::LOW);
    ledger.allocate_capital("p", "e2", 2000, RiskLevel::MEDIUM);

    auto r = ledger.release_capital(a1.id, -250);
    EXPECT_FALSE(r.active());
    EXPECT_DOUBLE_EQ(r.realized_pnl, -250);

    auto p = *ledger.pool("p");
    EXPECT_DOUBLE_EQ(p.allocated_capital, 2000);
    EXPECT_DOUBLE_EQ(p.realized_pnl, -250);
    EXPECT_DOUBLE_EQ(p.current_drawdown, 0.025);
    EXPECT_DOUBLE_EQ(p.max_drawdown, 0.025);

    EXPECT_THROW(ledger.release_capital(a1.id, 0), InvalidState);
}

TEST_F(LedgerFixture, AnalyticsOverCompletedExperiments) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("p", "P", PoolPurpose::RESEARCH, RiskLevel::LOW, 10000);
    auto a1 = ledger.allocate_capital("p", "e1", 1000, RiskLevel::LOW);
    auto a2 = ledger.allocate_capital("p", "e2", 1000, RiskLevel::LOW);
    ledger.allocate_capital("p", "e3", 1000, RiskLevel::LOW);
    ledger.release_capital(a1.id, 300);
    ledger.release_capital(a2.id, -100);

    auto an = ledger.analytics("p");
    EXPECT_EQ(an.active_experiments, 1);
    EXPECT_EQ(an.completed_experiments, 2);
    EXPECT_DOUBLE_EQ(an.total_pnl, 200);
    EXPECT_DOUBLE_EQ(an.avg_pnl, 100);
    EXPECT_DOUBLE_EQ(an.win_rate, 0.5);
    EXPECT_DOUBLE_EQ(an.utilization, 0.1);

    EXPECT_THROW(ledger.analytics("missing"), NotFound);
}

// --- Transfer ---

TEST_F(LedgerFixture, TransferMovesTotalCapital) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("a", "A", PoolPurpose::RESEARCH, RiskLevel::LOW, 5000);
    ledger.create_pool("b", "B", PoolPurpose::COMPETITION, RiskLevel::MEDIUM, 1000);
    ledger.allocate_capital("a", "e1", 1000, RiskLevel::LOW);

    EXPECT_THROW(ledger.transfer_capital("a", "b", 4500, "too much"), InsufficientCapital);
    EXPECT_THROW(ledger.transfer_capital("a", "a", 10, "self"), InvalidArgument);

    ledger.transfer_capital("a", "b", 4000, "rebalance");
    EXPECT_DOUBLE_EQ(ledger.pool("a")->total_capital, 1000);
    EXPECT_DOUBLE_EQ(ledger.pool("a")->allocated_capital, 1000);
    EXPECT_DOUBLE_EQ(ledger.pool("b")->total_capital, 5000);

    auto txns = ledger.transactions("b");
    EXPECT_EQ(txns.back().type, TransactionType::TRANSFER);
    EXPECT_DOUBLE_EQ(txns.back().amount, 4000);
}

// --- Mark-to-market / emergency stop ---

TEST_F(LedgerFixture, EmergencyStopReleasesWholePoolBook) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("p", "P", PoolPurpose::COMPETITION, RiskLevel::MEDIUM, 10000);
    auto a1 = ledger.allocate_capital("p", "e1", 1000, RiskLevel::LOW);
    auto a2 = ledger.allocate_capital("p", "e2", 1000, RiskLevel::LOW);

    auto u = ledger.update_pnl(a1.id, -1500);      // 15% of the pool
    EXPECT_TRUE(u.active());
    EXPECT_EQ(notes.count(NotificationType::POOL_EMERGENCY_STOP), 0u);

    auto u2 = ledger.update_pnl(a2.id, -600);      // 21%
    EXPECT_FALSE(u2.active());
    EXPECT_DOUBLE_EQ(u2.realized_pnl, -600);

    EXPECT_TRUE(ledger.allocations(true).empty());
    auto p = *ledger.pool("p");
    EXPECT_DOUBLE_EQ(p.allocated_capital, 0);
    EXPECT_DOUBLE_EQ(p.realized_pnl, -2100);
    EXPECT_EQ(notes.count(NotificationType::POOL_EMERGENCY_STOP), 1u);
}

TEST_F(LedgerFixture, ProfitsNeverTriggerEmergencyStop) {
    CapitalLedger ledger(store, bus, clock);
    ledger.create_pool("p", "P", PoolPurpose::COMPETITION, RiskLevel::MEDIUM, 1000);
    auto a = ledger.allocate_capital("p", "e1", 500, RiskLevel::LOW);
    auto u = ledger.update_pnl(a.id, 900);
    EXPECT_TRUE(u.active());
    EXPECT_DOUBLE_EQ(u.running_pnl, 900);
}

// --- Persistence ---

TEST_F(LedgerFixture, StateSurvivesReload) {
    std::string alloc_id;
    {
        CapitalLedger ledger(store, bus, clock);
        ledger.create_pool("p", "P", PoolPurpose::RESEARCH, RiskLevel::LOW, 10000);
        alloc_id = ledger.allocate_capital("p", "e1", 700, RiskLevel::LOW).id;
        ledger.update_pnl(alloc_id, 42);
    }
    CapitalLedger restored(store, bus, clock);
    restored.load();

    ASSERT_TRUE(restored.has_pool("p"));
    EXPECT_DOUBLE_EQ(restored.pool("p")->allocated_capital, 700);
    auto a = restored.allocation(alloc_id);
    ASSERT_TRUE(a.has_value());
    EXPECT_DOUBLE_EQ(a->running_pnl, 42);
    EXPECT_EQ(restored.transactions("").size(), 3u);

    restored.release_capital(alloc_id, 42);
    EXPECT_DOUBLE_EQ(restored.pool("p")->allocated_capital, 0);
}

// --- Concurrency ---

TEST_F(LedgerFixture, ConcurrentAllocationsNeverOverdrawPool) {
    CapitalLedger ledger(store, bus, clock, wide_limits());
    ledger.create_pool("p", "P", PoolPurpose::RESEARCH, RiskLevel::LOW, 10000);

    std::atomic<int> ok{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) {
                try {
                    ledger.allocate_capital("p", "e" + std::to_string(t) + "_" + std::to_string(i),
                                            700, RiskLevel::LOW);
                    ok++;
                } catch (const InsufficientCapital&) {
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    auto p = *ledger.pool("p");
    EXPECT_EQ(ok.load(), 14);
    EXPECT_LE(p.allocated_capital, p.total_capital);
    EXPECT_DOUBLE_EQ(p.allocated_capital, 700.0 * ok.load());
}

TEST_F(LedgerFixture, ConcurrentTransfersConserveCapital) {
    CapitalLedger ledger(store, bus, clock, wide_limits());
    ledger.create_pool("a", "A", PoolPurpose::RESEARCH, RiskLevel::LOW, 5000);
    ledger.create_pool("b", "B", PoolPurpose::RESEARCH, RiskLevel::LOW, 5000);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                try {
                    if ((t + i) % 2 == 0) ledger.transfer_capital("a", "b", 150, "x");
                    else ledger.transfer_capital("b", "a", 150, "y");
                } catch (const InsufficientCapital&) {
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    auto a = *ledger.pool("a");
    auto b = *ledger.pool("b");
    EXPECT_DOUBLE_EQ(a.total_capital + b.total_capital, 10000);
    EXPECT_GE(a.total_capital, 0);
    EXPECT_GE(b.total_capital, 0);
}

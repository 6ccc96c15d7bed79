#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/ledger/CapitalTypes.hpp"
#include "aegis/notify/NotificationBus.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

// ---------------------------------------------------------------------------
// Segregated capital book. The only code allowed to change pool balances.
//
// Locking:
//   registry_mtx_  shared for every operation, exclusive only to add a pool
//   slot->mtx      one per pool; multi-pool operations lock in id order
//   book_mtx_      allocations + transaction history, always taken last
//
// Each mutation is persisted inside its critical section, before memory is
// updated. A failed store commit therefore leaves both untouched.
// Notifications go out after every lock is released.
// ---------------------------------------------------------------------------
class CapitalLedger {
public:
    static constexpr const char* TXN_LOG = "capital.transactions";

    CapitalLedger(StateStore& store, NotificationBus& bus, const Clock& clock,
                  CapitalLimits limits = {});

    // Rebuild pools, allocations and history from the store.
    void load();

    CapitalPool create_pool(const std::string& id, const std::string& name,
                            PoolPurpose purpose, RiskLevel risk, double total);

    CapitalAllocation allocate_capital(const std::string& pool_id,
                                       const std::string& experiment_id,
                                       double amount, RiskLevel risk);

    CapitalAllocation release_capital(const std::string& allocation_id, double final_pnl);

    void transfer_capital(const std::string& from_pool_id, const std::string& to_pool_id,
                          double amount, const std::string& reason);

    CapitalAllocation update_pnl(const std::string& allocation_id, double delta);

    // --- Queries -----------------------------------------------------------
    bool has_pool(const std::string& id) const;
    std::optional<CapitalPool> pool(const std::string& id) const;
    std::vector<CapitalPool> pools() const;

    std::optional<CapitalAllocation> allocation(const std::string& id) const;
    std::vector<CapitalAllocation> allocations(bool active_only = false) const;
    std::vector<CapitalAllocation> allocations_for_pool(const std::string& pool_id) const;

    // Most recent last; limit 0 = all.
    std::vector<CapitalTransaction> transactions(const std::string& pool_id, size_t limit = 0) const;

    PoolAnalytics analytics(const std::string& pool_id) const;

    CapitalLimits limits() const;
    void set_limits(const CapitalLimits& limits);

private:
    struct PoolSlot {
        std::mutex mtx;
        CapitalPool pool;
    };

    PoolSlot& slot_for(const std::string& pool_id) const;

    // Caller holds the pool slot and book locks.
    CapitalAllocation release_locked(PoolSlot& slot, CapitalAllocation alloc,
                                     double final_pnl, const std::string& why,
                                     WriteBatch& batch,
                                     std::vector<CapitalTransaction>& txns);

    CapitalTransaction make_txn(TransactionType type, const std::string& pool_id,
                                const std::string& experiment_id,
                                const std::string& allocation_id,
                                double amount, std::string description);

    void record_txns(const std::vector<CapitalTransaction>& txns);

    std::string next_id(const char* prefix);

    static std::string pool_key(const std::string& id)  { return "pool." + id; }
    static std::string alloc_key(const std::string& id) { return "alloc." + id; }

    StateStore& store_;
    NotificationBus& bus_;
    const Clock& clock_;

    mutable std::shared_mutex registry_mtx_;
    std::map<std::string, std::unique_ptr<PoolSlot>> pools_;

    mutable std::mutex book_mtx_;
    std::map<std::string, CapitalAllocation> allocations_;
    std::vector<CapitalTransaction> history_;
    CapitalLimits limits_;

    std::atomic<uint64_t> seq_{0};
};

} // namespace aegis

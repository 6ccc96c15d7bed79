#include "aegis/ledger/CapitalLedger.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

CapitalLedger::CapitalLedger(StateStore& store, NotificationBus& bus, const Clock& clock,
                             CapitalLimits limits)
    : store_(store), bus_(bus), clock_(clock), limits_(limits) {}

// ---------------------------------------------------------------------------
// Restore
// ---------------------------------------------------------------------------

void CapitalLedger::load() {
    std::unique_lock<std::shared_mutex> reg(registry_mtx_);
    std::lock_guard<std::mutex> book(book_mtx_);

    pools_.clear();
    allocations_.clear();
    history_.clear();

    for (const auto& kv : store_.scan("pool.")) {
        auto slot = std::make_unique<PoolSlot>();
        slot->pool = kv.second.get<CapitalPool>();
        pools_[slot->pool.id] = std::move(slot);
    }
    for (const auto& kv : store_.scan("alloc.")) {
        CapitalAllocation a = kv.second.get<CapitalAllocation>();
        allocations_[a.id] = a;
    }
    for (const auto& rec : store_.read_log(TXN_LOG)) {
        history_.push_back(rec.get<CapitalTransaction>());
    }

    size_t active = std::count_if(allocations_.begin(), allocations_.end(),
                                  [](const auto& kv) { return kv.second.active(); });
    std::cout << "[LEDGER] Restored " << pools_.size() << " pools, "
              << allocations_.size() << " allocations (" << active << " active), "
              << history_.size() << " transactions\n";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string CapitalLedger::next_id(const char* prefix) {
    return std::string(prefix) + "_" + std::to_string(clock_.wall_ns()) + "_" +
           std::to_string(seq_.fetch_add(1) + 1);
}

CapitalLedger::PoolSlot& CapitalLedger::slot_for(const std::string& pool_id) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) throw NotFound("pool '" + pool_id + "' not found");
    return *it->second;
}

CapitalTransaction CapitalLedger::make_txn(TransactionType type, const std::string& pool_id,
                                           const std::string& experiment_id,
                                           const std::string& allocation_id,
                                           double amount, std::string description) {
    CapitalTransaction t;
    t.id = next_id(transaction_type_to_string(type));
    t.type = type;
    t.pool_id = pool_id;
    t.experiment_id = experiment_id;
    t.allocation_id = allocation_id;
    t.amount = amount;
    t.ts_ns = clock_.wall_ns();
    t.description = std::move(description);
    return t;
}

void CapitalLedger::record_txns(const std::vector<CapitalTransaction>& txns) {
    for (const auto& t : txns) {
        store_.append(TXN_LOG, json(t));
        history_.push_back(t);
    }
}

static void require_amount(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        throw InvalidArgument("amount must be a positive finite number");
    }
}

// ---------------------------------------------------------------------------
// Pools
// ---------------------------------------------------------------------------

CapitalPool CapitalLedger::create_pool(const std::string& id, const std::string& name,
                                       PoolPurpose purpose, RiskLevel risk, double total) {
    if (id.empty()) throw InvalidArgument("pool id is empty");
    if (!std::isfinite(total) || total < 0.0) {
        throw InvalidArgument("pool capital must be a non-negative finite number");
    }

    std::unique_lock<std::shared_mutex> reg(registry_mtx_);
    std::lock_guard<std::mutex> book(book_mtx_);

    if (pools_.count(id)) throw InvalidState("pool '" + id + "' already exists");

    auto slot = std::make_unique<PoolSlot>();
    CapitalPool& p = slot->pool;
    p.id = id;
    p.name = name.empty() ? id : name;
    p.purpose = purpose;
    p.risk_level = risk;
    p.total_capital = total;
    p.last_updated_ns = clock_.wall_ns();

    WriteBatch batch;
    batch.put(pool_key(id), json(p));
    store_.commit(batch);

    CapitalPool out = p;
    pools_[id] = std::move(slot);

    record_txns({ make_txn(TransactionType::POOL_CREATED, id, "", "", total,
                           "Created pool " + out.name) });

    std::cout << "[LEDGER] Pool " << id << " created (" << pool_purpose_to_string(purpose)
              << ", " << risk_level_to_string(risk) << ", total=" << total << ")\n";
    return out;
}

// ---------------------------------------------------------------------------
// Allocate
// ---------------------------------------------------------------------------

CapitalAllocation CapitalLedger::allocate_capital(const std::string& pool_id,
                                                  const std::string& experiment_id,
                                                  double amount, RiskLevel risk) {
    require_amount(amount);

    CapitalAllocation alloc;
    {
        std::shared_lock<std::shared_mutex> reg(registry_mtx_);
        PoolSlot& slot = slot_for(pool_id);
        std::lock_guard<std::mutex> pool_lock(slot.mtx);
        std::lock_guard<std::mutex> book(book_mtx_);

        CapitalPool next = slot.pool;
        if (amount > next.available()) {
            throw InsufficientCapital("insufficient capital in " + pool_id +
                                      ": requested " + std::to_string(amount) +
                                      ", available " + std::to_string(next.available()));
        }

        double cap = limits_.max_for(risk);
        if (amount > cap) {
            throw LimitExceeded("amount " + std::to_string(amount) + " exceeds " +
                                risk_level_to_string(risk) + "-risk limit " +
                                std::to_string(cap));
        }

        int active = 0;
        for (const auto& kv : allocations_) {
            if (kv.second.pool_id == pool_id && kv.second.active()) active++;
        }
        if (active >= limits_.max_concurrent_experiments) {
            throw LimitExceeded("pool " + pool_id + " already has " + std::to_string(active) +
                                " active experiments");
        }

        uint64_t now = clock_.wall_ns();
        next.allocated_capital += amount;
        next.last_updated_ns = now;

        alloc.id = next_id("alloc");
        alloc.pool_id = pool_id;
        alloc.experiment_id = experiment_id;
        alloc.amount = amount;
        alloc.risk_level = risk;
        alloc.allocated_at_ns = now;

        WriteBatch batch;
        batch.put(pool_key(pool_id), json(next));
        batch.put(alloc_key(alloc.id), json(alloc));
        store_.commit(batch);

        slot.pool = next;
        allocations_[alloc.id] = alloc;

        record_txns({ make_txn(TransactionType::ALLOCATION, pool_id, experiment_id, alloc.id,
                               amount, "Allocated " + std::to_string(amount) +
                                       " to experiment " + experiment_id) });
    }

    std::cout << "[LEDGER] Allocated " << amount << " from " << pool_id
              << " to " << experiment_id << " (" << alloc.id << ")\n";

    bus_.publish(NotificationType::CAPITAL_ALLOCATION_CHANGED, "ledger",
                 "allocated " + std::to_string(amount) + " to " + experiment_id,
                 json{{"action", "allocate"}, {"allocation", alloc}});
    return alloc;
}

// ---------------------------------------------------------------------------
// Release
// ---------------------------------------------------------------------------

CapitalAllocation CapitalLedger::release_locked(PoolSlot& slot, CapitalAllocation alloc,
                                                double final_pnl, const std::string& why,
                                                WriteBatch& batch,
                                                std::vector<CapitalTransaction>& txns) {
    uint64_t now = clock_.wall_ns();
    CapitalPool& p = slot.pool;

    p.allocated_capital = std::max(0.0, p.allocated_capital - alloc.amount);
    p.realized_pnl += final_pnl;
    p.last_updated_ns = now;
    if (final_pnl < 0.0 && p.total_capital > 0.0) {
        p.current_drawdown = std::abs(final_pnl) / p.total_capital;
        p.max_drawdown = std::max(p.max_drawdown, p.current_drawdown);
    }

    alloc.status = AllocationStatus::RELEASED;
    alloc.realized_pnl = final_pnl;
    alloc.running_pnl = final_pnl;
    alloc.released_at_ns = now;

    batch.put(alloc_key(alloc.id), json(alloc));
    txns.push_back(make_txn(TransactionType::RELEASE, p.id, alloc.experiment_id, alloc.id,
                            alloc.amount + final_pnl,
                            "Released " + std::to_string(alloc.amount) + " from experiment " +
                                alloc.experiment_id + " with P&L " + std::to_string(final_pnl) +
                                (why.empty() ? "" : " (" + why + ")")));
    return alloc;
}

CapitalAllocation CapitalLedger::release_capital(const std::string& allocation_id, double final_pnl) {
    if (!std::isfinite(final_pnl)) throw InvalidArgument("final P&L must be finite");

    std::string pool_id;
    {
        std::lock_guard<std::mutex> book(book_mtx_);
        auto it = allocations_.find(allocation_id);
        if (it == allocations_.end()) throw NotFound("allocation '" + allocation_id + "' not found");
        pool_id = it->second.pool_id;
    }

    CapitalAllocation released;
    {
        std::shared_lock<std::shared_mutex> reg(registry_mtx_);
        PoolSlot& slot = slot_for(pool_id);
        std::lock_guard<std::mutex> pool_lock(slot.mtx);
        std::lock_guard<std::mutex> book(book_mtx_);

        // Re-check under the pool lock: a concurrent release may have won.
        const CapitalAllocation& current = allocations_.at(allocation_id);
        if (!current.active()) {
            throw InvalidState("allocation '" + allocation_id + "' is not active");
        }

        CapitalPool saved = slot.pool;
        WriteBatch batch;
        std::vector<CapitalTransaction> txns;
        released = release_locked(slot, current, final_pnl, "", batch, txns);
        batch.put(pool_key(pool_id), json(slot.pool));

        try {
            store_.commit(batch);
        } catch (const StoreFailure&) {
            slot.pool = saved;
            throw;
        }

        allocations_[allocation_id] = released;
        record_txns(txns);
    }

    std::cout << "[LEDGER] Released " << allocation_id << " (" << released.amount
              << ") pnl=" << final_pnl << "\n";

    bus_.publish(NotificationType::CAPITAL_ALLOCATION_CHANGED, "ledger",
                 "released " + allocation_id,
                 json{{"action", "release"}, {"allocation", released}});
    return released;
}

// ---------------------------------------------------------------------------
// Transfer
// ---------------------------------------------------------------------------

void CapitalLedger::transfer_capital(const std::string& from_pool_id, const std::string& to_pool_id,
                                     double amount, const std::string& reason) {
    require_amount(amount);
    if (from_pool_id == to_pool_id) throw InvalidArgument("cannot transfer a pool to itself");

    {
        std::shared_lock<std::shared_mutex> reg(registry_mtx_);
        PoolSlot& from = slot_for(from_pool_id);
        PoolSlot& to = slot_for(to_pool_id);

        PoolSlot& first  = from_pool_id < to_pool_id ? from : to;
        PoolSlot& second = from_pool_id < to_pool_id ? to : from;
        std::lock_guard<std::mutex> l1(first.mtx);
        std::lock_guard<std::mutex> l2(second.mtx);
        std::lock_guard<std::mutex> book(book_mtx_);

        if (amount > from.pool.available()) {
            throw InsufficientCapital("insufficient available capital in " + from_pool_id +
                                      ": requested " + std::to_string(amount) +
                                      ", available " + std::to_string(from.pool.available()));
        }

        uint64_t now = clock_.wall_ns();
        CapitalPool next_from = from.pool;
        CapitalPool next_to = to.pool;
        next_from.total_capital -= amount;
        next_from.last_updated_ns = now;
        next_to.total_capital += amount;
        next_to.last_updated_ns = now;

        WriteBatch batch;
        batch.put(pool_key(from_pool_id), json(next_from));
        batch.put(pool_key(to_pool_id), json(next_to));
        store_.commit(batch);

        from.pool = next_from;
        to.pool = next_to;

        std::string desc = "Transfer " + std::to_string(amount) + " from " + from_pool_id +
                           " to " + to_pool_id + ": " + reason;
        record_txns({ make_txn(TransactionType::TRANSFER, from_pool_id, "", "", -amount, desc),
                      make_txn(TransactionType::TRANSFER, to_pool_id, "", "", amount, desc) });
    }

    std::cout << "[LEDGER] Transferred " << amount << " " << from_pool_id
              << " -> " << to_pool_id << " (" << reason << ")\n";

    bus_.publish(NotificationType::CAPITAL_ALLOCATION_CHANGED, "ledger",
                 "transferred " + std::to_string(amount) + " from " + from_pool_id + " to " + to_pool_id,
                 json{{"action", "transfer"}, {"from", from_pool_id}, {"to", to_pool_id},
                      {"amount", amount}, {"reason", reason}});
}

// ---------------------------------------------------------------------------
// Mark-to-market
// ---------------------------------------------------------------------------

CapitalAllocation CapitalLedger::update_pnl(const std::string& allocation_id, double delta) {
    if (!std::isfinite(delta)) throw InvalidArgument("P&L delta must be finite");

    std::string pool_id;
    {
        std::lock_guard<std::mutex> book(book_mtx_);
        auto it = allocations_.find(allocation_id);
        if (it == allocations_.end()) throw NotFound("allocation '" + allocation_id + "' not found");
        pool_id = it->second.pool_id;
    }

    CapitalAllocation updated;
    std::vector<CapitalAllocation> stopped;
    double pool_loss = 0.0;
    {
        std::shared_lock<std::shared_mutex> reg(registry_mtx_);
        PoolSlot& slot = slot_for(pool_id);
        std::lock_guard<std::mutex> pool_lock(slot.mtx);
        std::lock_guard<std::mutex> book(book_mtx_);

        updated = allocations_.at(allocation_id);
        if (!updated.active()) {
            throw InvalidState("allocation '" + allocation_id + "' is not active");
        }
        updated.running_pnl += delta;

        // Aggregate running P&L across the pool's active book, with the update applied.
        double running = 0.0;
        for (const auto& kv : allocations_) {
            const CapitalAllocation& a = kv.first == allocation_id ? updated : kv.second;
            if (a.pool_id == pool_id && a.active()) running += a.running_pnl;
        }

        CapitalPool saved = slot.pool;
        WriteBatch batch;
        std::vector<CapitalTransaction> txns;
        batch.put(alloc_key(updated.id), json(updated));
        txns.push_back(make_txn(TransactionType::PNL_UPDATE, pool_id, updated.experiment_id,
                                updated.id, delta,
                                "P&L update for experiment " + updated.experiment_id + ": " +
                                    std::to_string(delta)));

        const double total = slot.pool.total_capital;
        const bool emergency = running < 0.0 && total > 0.0 &&
                               (-running / total) > limits_.emergency_stop_loss;

        std::map<std::string, CapitalAllocation> next_allocs;
        next_allocs[updated.id] = updated;

        if (emergency) {
            pool_loss = -running;
            for (const auto& kv : allocations_) {
                const CapitalAllocation& a = kv.first == allocation_id ? updated : kv.second;
                if (a.pool_id != pool_id || !a.active()) continue;
                CapitalAllocation r = release_locked(slot, a, a.running_pnl,
                                                     "emergency stop loss", batch, txns);
                next_allocs[r.id] = r;
                stopped.push_back(r);
            }
            batch.put(pool_key(pool_id), json(slot.pool));
        } else {
            slot.pool.last_updated_ns = clock_.wall_ns();
        }

        try {
            store_.commit(batch);
        } catch (const StoreFailure&) {
            slot.pool = saved;
            throw;
        }

        for (auto& kv : next_allocs) allocations_[kv.first] = kv.second;
        updated = allocations_.at(allocation_id);
        record_txns(txns);
    }

    if (!stopped.empty()) {
        std::cerr << "[LEDGER] EMERGENCY STOP LOSS on pool " << pool_id
                  << ": running loss " << pool_loss << ", released "
                  << stopped.size() << " allocations\n";

        json released = json::array();
        for (const auto& a : stopped) released.push_back(a.id);

        bus_.publish(NotificationType::POOL_EMERGENCY_STOP, "ledger",
                     "emergency stop loss on pool " + pool_id,
                     json{{"poolId", pool_id}, {"runningLoss", pool_loss},
                          {"threshold", limits_.emergency_stop_loss},
                          {"releasedAllocations", released}});
        bus_.publish(NotificationType::CAPITAL_ALLOCATION_CHANGED, "ledger",
                     "emergency release on " + pool_id,
                     json{{"action", "emergency_release"}, {"poolId", pool_id},
                          {"releasedAllocations", released}});
    }

    return updated;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool CapitalLedger::has_pool(const std::string& id) const {
    std::shared_lock<std::shared_mutex> reg(registry_mtx_);
    return pools_.count(id) > 0;
}

std::optional<CapitalPool> CapitalLedger::pool(const std::string& id) const {
    std::shared_lock<std::shared_mutex> reg(registry_mtx_);
    auto it = pools_.find(id);
    if (it == pools_.end()) return std::nullopt;
    std::lock_guard<std::mutex> lock(it->second->mtx);
    return it->second->pool;
}

std::vector<CapitalPool> CapitalLedger::pools() const {
    std::shared_lock<std::shared_mutex> reg(registry_mtx_);
    std::vector<CapitalPool> out;
    out.reserve(pools_.size());
    for (const auto& kv : pools_) {
        std::lock_guard<std::mutex> lock(kv.second->mtx);
        out.push_back(kv.second->pool);
    }
    return out;
}

std::optional<CapitalAllocation> CapitalLedger::allocation(const std::string& id) const {
    std::lock_guard<std::mutex> book(book_mtx_);
    auto it = allocations_.find(id);
    if (it == allocations_.end()) return std::nullopt;
    return it->second;
}

std::vector<CapitalAllocation> CapitalLedger::allocations(bool active_only) const {
    std::lock_guard<std::mutex> book(book_mtx_);
    std::vector<CapitalAllocation> out;
    for (const auto& kv : allocations_) {
        if (!active_only || kv.second.active()) out.push_back(kv.second);
    }
    return out;
}

std::vector<CapitalAllocation> CapitalLedger::allocations_for_pool(const std::string& pool_id) const {
    std::lock_guard<std::mutex> book(book_mtx_);
    std::vector<CapitalAllocation> out;
    for (const auto& kv : allocations_) {
        if (kv.second.pool_id == pool_id) out.push_back(kv.second);
    }
    return out;
}

std::vector<CapitalTransaction> CapitalLedger::transactions(const std::string& pool_id, size_t limit) const {
    std::lock_guard<std::mutex> book(book_mtx_);
    std::vector<CapitalTransaction> out;
    for (const auto& t : history_) {
        if (pool_id.empty() || t.pool_id == pool_id) out.push_back(t);
    }
    if (limit > 0 && out.size() > limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return out;
}

PoolAnalytics CapitalLedger::analytics(const std::string& pool_id) const {
    auto p = pool(pool_id);
    if (!p) throw NotFound("pool '" + pool_id + "' not found");

    PoolAnalytics a;
    a.pool_id = pool_id;

    int wins = 0;
    for (const auto& alloc : allocations_for_pool(pool_id)) {
        if (alloc.active()) {
            a.active_experiments++;
        } else {
            a.completed_experiments++;
            a.total_pnl += alloc.realized_pnl;
            if (alloc.realized_pnl > 0.0) wins++;
        }
    }

    if (a.completed_experiments > 0) {
        a.avg_pnl = a.total_pnl / a.completed_experiments;
        a.win_rate = static_cast<double>(wins) / a.completed_experiments;
    }
    a.utilization = p->total_capital > 0.0 ? p->allocated_capital / p->total_capital : 0.0;
    a.drawdown = p->current_drawdown;
    a.risk_adjusted_return = a.avg_pnl / (p->current_drawdown > 0.0 ? p->current_drawdown : 0.01);
    return a;
}

CapitalLimits CapitalLedger::limits() const {
    std::lock_guard<std::mutex> book(book_mtx_);
    return limits_;
}

void CapitalLedger::set_limits(const CapitalLimits& limits) {
    std::lock_guard<std::mutex> book(book_mtx_);
    limits_ = limits;
    std::cout << "[LEDGER] Limits updated: low=" << limits.max_per_experiment_low
              << " medium=" << limits.max_per_experiment_medium
              << " high=" << limits.max_per_experiment_high
              << " concurrent=" << limits.max_concurrent_experiments
              << " stop_loss=" << limits.emergency_stop_loss << "\n";
}

} // namespace aegis

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace aegis {

// A set of document writes applied all-or-nothing by StateStore::commit().
struct WriteBatch {
    std::vector<std::pair<std::string, nlohmann::json>> puts;
    std::vector<std::string> erases;

    void put(const std::string& key, nlohmann::json doc) {
        puts.emplace_back(key, std::move(doc));
    }

    void erase(const std::string& key) {
        erases.push_back(key);
    }

    bool empty() const { return puts.empty() && erases.empty(); }
};

// ---------------------------------------------------------------------------
// Persistence boundary for all durable control-plane state.
//
// Two kinds of data:
//   - documents: keyed JSON, replaced as a whole (pools, allocations,
//     pipelines, safety status). Multi-key commits are atomic.
//   - logs: append-only JSON records (capital transactions, validation
//     results, decision traces). Never rewritten.
//
// Implementations throw StoreFailure on I/O errors. Callers persist inside
// the same critical section as the in-memory mutation so the store never
// observes a state the invariants forbid.
// ---------------------------------------------------------------------------
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;

    // All documents whose key starts with prefix, ordered by key.
    virtual std::vector<std::pair<std::string, nlohmann::json>>
    scan(const std::string& prefix) const = 0;

    virtual void commit(const WriteBatch& batch) = 0;

    virtual void append(const std::string& log, const nlohmann::json& record) = 0;

    virtual std::vector<nlohmann::json> read_log(const std::string& log) const = 0;
};

} // namespace aegis

#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "aegis/evidence/DecisionTrace.hpp"
#include "aegis/infra/Clock.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

// ---------------------------------------------------------------------------
// Append-only record of trading decisions.
//
// Two logs: one record per created trace, one per execution status change.
// On load the creation log is replayed, then status updates in order. The
// trace body is never rewritten; only its execution block moves forward:
//
//   pending -> live | filled | rejected | cancelled | blocked
//   live    -> filled | rejected | cancelled
// ---------------------------------------------------------------------------
class DecisionRecorder {
public:
    static constexpr const char* TRACE_LOG  = "evidence.traces";
    static constexpr const char* STATUS_LOG = "evidence.status";
    static constexpr double HIGH_CREDIBILITY = 0.8;

    DecisionRecorder(StateStore& store, const Clock& clock);

    void load();

    // Assigns id and as_of, forces status pending, computes the digest.
    DecisionTrace record(DecisionTrace trace);

    DecisionTrace update_execution(const std::string& trace_id,
                                   ExecutionStatus status,
                                   const std::vector<std::string>& broker_order_ids,
                                   const std::string& reason);

    std::optional<DecisionTrace> get(const std::string& trace_id) const;

    // Most recent first.
    std::vector<DecisionTrace> by_symbol(const std::string& symbol, size_t limit) const;
    std::vector<DecisionTrace> recent(size_t limit) const;

    size_t size() const;

    static bool transition_allowed(ExecutionStatus from, ExecutionStatus to);
    static ProofStrength proof_strength(const DecisionTrace& trace);
    static bool verify(const DecisionTrace& trace);

private:
    void apply_update_locked(DecisionTrace& t, ExecutionStatus status,
                             const std::vector<std::string>& ids,
                             const std::string& reason, uint64_t ts);

    StateStore& store_;
    const Clock& clock_;

    mutable std::mutex mtx_;
    std::map<std::string, DecisionTrace> traces_;
    std::vector<std::string> order_;                            // creation order
    std::map<std::string, std::vector<std::string>> by_symbol_; // creation order
    std::atomic<uint64_t> seq_{0};
};

} // namespace aegis

#include "aegis/evidence/DecisionRecorder.hpp"
#include "aegis/infra/Errors.hpp"

#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

DecisionRecorder::DecisionRecorder(StateStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

// ---------------------------------------------------------------------------
// Restore
// ---------------------------------------------------------------------------

void DecisionRecorder::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    traces_.clear();
    order_.clear();
    by_symbol_.clear();

    for (const auto& rec : store_.read_log(TRACE_LOG)) {
        DecisionTrace t = rec.get<DecisionTrace>();
        if (traces_.count(t.trace_id)) continue;
        order_.push_back(t.trace_id);
        by_symbol_[t.symbol].push_back(t.trace_id);
        traces_[t.trace_id] = std::move(t);
    }

    size_t applied = 0, skipped = 0;
    for (const auto& rec : store_.read_log(STATUS_LOG)) {
        auto it = traces_.find(rec.value("traceId", ""));
        if (it == traces_.end()) {
            skipped++;
            continue;
        }
        ExecutionStatus to = execution_status_from_string(rec.at("status").get<std::string>());
        if (!transition_allowed(it->second.execution.status, to)) {
            skipped++;
            continue;
        }
        apply_update_locked(it->second, to,
                            rec.value("brokerOrderIds", std::vector<std::string>{}),
                            rec.value("reason", ""),
                            rec.value("ts", uint64_t{0}));
        applied++;
    }

    seq_.store(order_.size());

    std::cout << "[EVIDENCE] Restored " << traces_.size() << " traces, "
              << applied << " status updates";
    if (skipped) std::cout << " (" << skipped << " skipped)";
    std::cout << "\n";
}

// ---------------------------------------------------------------------------
// Write path
// ---------------------------------------------------------------------------

DecisionTrace DecisionRecorder::record(DecisionTrace trace) {
    if (trace.symbol.empty()) throw InvalidArgument("trace symbol is empty");

    uint64_t now = clock_.wall_ns();
    trace.trace_id = "trace_" + std::to_string(now) + "_" + std::to_string(seq_.fetch_add(1) + 1);
    trace.as_of_ns = now;
    trace.execution = ExecutionInfo{};
    trace.execution.updated_at_ns = now;
    trace.digest = trace_digest(trace);

    std::lock_guard<std::mutex> lock(mtx_);
    store_.append(TRACE_LOG, json(trace));

    order_.push_back(trace.trace_id);
    by_symbol_[trace.symbol].push_back(trace.trace_id);
    traces_[trace.trace_id] = trace;

    std::cout << "[EVIDENCE] Recorded " << trace.trace_id << " " << trace.symbol
              << " " << trace.plan.action << " proof="
              << proof_strength_to_string(proof_strength(trace)) << "\n";
    return trace;
}

DecisionTrace DecisionRecorder::update_execution(const std::string& trace_id,
                                                 ExecutionStatus status,
                                                 const std::vector<std::string>& broker_order_ids,
                                                 const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = traces_.find(trace_id);
    if (it == traces_.end()) throw NotFound("trace '" + trace_id + "' not found");

    DecisionTrace& t = it->second;
    if (!transition_allowed(t.execution.status, status)) {
        throw InvalidState(std::string("illegal execution transition ") +
                           execution_status_to_string(t.execution.status) + " -> " +
                           execution_status_to_string(status) + " on " + trace_id);
    }

    uint64_t now = clock_.wall_ns();
    store_.append(STATUS_LOG, json{
        {"traceId", trace_id},
        {"status", execution_status_to_string(status)},
        {"brokerOrderIds", broker_order_ids},
        {"reason", reason},
        {"ts", now}
    });
    apply_update_locked(t, status, broker_order_ids, reason, now);
    return t;
}

void DecisionRecorder::apply_update_locked(DecisionTrace& t, ExecutionStatus status,
                                           const std::vector<std::string>& ids,
                                           const std::string& reason, uint64_t ts) {
    t.execution.status = status;
    if (!ids.empty()) t.execution.broker_order_ids = ids;
    t.execution.reason = reason;
    t.execution.updated_at_ns = ts;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<DecisionTrace> DecisionRecorder::get(const std::string& trace_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = traces_.find(trace_id);
    if (it == traces_.end()) return std::nullopt;
    return it->second;
}

std::vector<DecisionTrace> DecisionRecorder::by_symbol(const std::string& symbol, size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<DecisionTrace> out;
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) return out;

    const auto& ids = it->second;
    for (auto rit = ids.rbegin(); rit != ids.rend() && out.size() < limit; ++rit) {
        out.push_back(traces_.at(*rit));
    }
    return out;
}

std::vector<DecisionTrace> DecisionRecorder::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<DecisionTrace> out;
    for (auto rit = order_.rbegin(); rit != order_.rend() && out.size() < limit; ++rit) {
        out.push_back(traces_.at(*rit));
    }
    return out;
}

size_t DecisionRecorder::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return traces_.size();
}

// ---------------------------------------------------------------------------
// Rules
// ---------------------------------------------------------------------------

bool DecisionRecorder::transition_allowed(ExecutionStatus from, ExecutionStatus to) {
    switch (from) {
        case ExecutionStatus::PENDING:
            return to == ExecutionStatus::LIVE || to == ExecutionStatus::FILLED ||
                   to == ExecutionStatus::REJECTED || to == ExecutionStatus::CANCELLED ||
                   to == ExecutionStatus::BLOCKED;
        case ExecutionStatus::LIVE:
            return to == ExecutionStatus::FILLED || to == ExecutionStatus::REJECTED ||
                   to == ExecutionStatus::CANCELLED;
        default:
            return false;   // terminal
    }
}

ProofStrength DecisionRecorder::proof_strength(const DecisionTrace& t) {
    const int risk_passed = t.risk_gate.passed_count();
    const bool all_gates = std::all_of(t.gates.begin(), t.gates.end(),
                                       [](const GateOutcome& g) { return g.passed; });
    const size_t evidence = t.news_evidence.size();
    const bool credible = std::any_of(t.news_evidence.begin(), t.news_evidence.end(),
                                      [](const NewsEvidence& e) { return e.credibility >= HIGH_CREDIBILITY; });

    if (risk_passed == 3 && all_gates && t.market_context &&
        (evidence >= 2 || credible)) {
        return ProofStrength::STRONG;
    }
    if (risk_passed >= 2 && (evidence >= 1 || t.nudge)) {
        return ProofStrength::MEDIUM;
    }
    return ProofStrength::WEAK;
}

bool DecisionRecorder::verify(const DecisionTrace& t) {
    return !t.digest.empty() && trace_digest(t) == t.digest;
}

} // namespace aegis

#include "aegis/pipeline/PromotionPipeline.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

namespace {

std::string flight_key(const std::string& pipeline_id, const std::string& candidate_id) {
    return pipeline_id + "/" + candidate_id;
}

// Clears the in-flight mark however promote_candidate exits.
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mtx, std::set<std::string>& set, std::string key)
        : mtx_(mtx), set_(set), key_(std::move(key)) {}

    ~InFlightGuard() {
        std::lock_guard<std::mutex> lock(mtx_);
        set_.erase(key_);
    }

private:
    std::mutex& mtx_;
    std::set<std::string>& set_;
    std::string key_;
};

void require_candidate_shape(const StrategyCandidate& c) {
    if (c.id.empty()) throw InvalidArgument("candidate id is empty");
    if (c.generation < 0) throw InvalidArgument("generation must be >= 0");
    const auto& p = c.performance;
    if (!(p.win_rate >= 0.0 && p.win_rate <= 1.0)) throw InvalidArgument("winRate must be in [0,1]");
    if (!(p.max_drawdown >= 0.0 && p.max_drawdown <= 1.0)) throw InvalidArgument("maxDrawdown must be in [0,1]");
    if (!(p.profit_factor >= 0.0)) throw InvalidArgument("profitFactor must be >= 0");
    if (p.total_trades < 0) throw InvalidArgument("totalTrades must be >= 0");
    if (!std::isfinite(c.fitness) || !std::isfinite(p.sharpe_ratio)) {
        throw InvalidArgument("fitness and sharpeRatio must be finite");
    }
}

// Validation span in ns, capped at now - start. The cap is applied in double
// so a very long configured period cannot overflow the cast.
uint64_t clamped_span_ns(double period_days, uint64_t start_ns, uint64_t now_ns) {
    const uint64_t elapsed = now_ns > start_ns ? now_ns - start_ns : 0;
    const double want = period_days * static_cast<double>(NS_PER_DAY);
    if (!(want > 0.0)) return 0;
    if (want >= static_cast<double>(elapsed)) return elapsed;
    return static_cast<uint64_t>(want);
}

} // namespace

PromotionPipeline::PromotionPipeline(StateStore& store, NotificationBus& bus, const Clock& clock,
                                     CapitalLedger& ledger, CandidateValidator& validator,
                                     StrategyDeployer& deployer, PromotionSettings settings)
    : store_(store), bus_(bus), clock_(clock), ledger_(ledger),
      validator_(validator), deployer_(deployer), settings_(std::move(settings)) {}

// ---------------------------------------------------------------------------
// Restore
// ---------------------------------------------------------------------------

void PromotionPipeline::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    pipelines_.clear();
    candidates_.clear();
    results_.clear();

    for (const auto& kv : store_.scan("pipeline.")) {
        PipelineState p = kv.second.get<PipelineState>();
        for (const auto& pc : p.candidates) candidates_[pc.candidate.id] = pc.candidate;
        for (const auto& c : p.promoted) candidates_[c.id] = c;
        for (const auto& c : p.rejected) candidates_[c.id] = c;
        pipelines_[p.id] = std::move(p);
    }

    size_t n = 0;
    for (const auto& rec : store_.read_log(RESULT_LOG)) {
        ValidationResult r = rec.get<ValidationResult>();
        results_[r.candidate_id].push_back(std::move(r));
        n++;
    }

    std::cout << "[PIPELINE] Restored " << pipelines_.size() << " pipelines, "
              << candidates_.size() << " candidates, " << n << " validation results\n";
}

void PromotionPipeline::persist_pipeline_locked(const PipelineState& p) {
    WriteBatch batch;
    batch.put("pipeline." + p.id, json(p));
    store_.commit(batch);
}

// ---------------------------------------------------------------------------
// Pipelines
// ---------------------------------------------------------------------------

PipelineState PromotionPipeline::create_pipeline(const std::string& id, const std::string& name,
                                                 const PromotionCriteria& criteria, bool active) {
    if (id.empty()) throw InvalidArgument("pipeline id is empty");
    if (!(criteria.validation_period_days >= 0.0)) throw InvalidArgument("validationPeriod must be >= 0");

    std::lock_guard<std::mutex> lock(mtx_);
    if (pipelines_.count(id)) throw InvalidState("pipeline '" + id + "' already exists");

    PipelineState p;
    p.id = id;
    p.name = name.empty() ? id : name;
    p.criteria = criteria;
    p.active = active;
    p.created_at_ns = clock_.wall_ns();

    persist_pipeline_locked(p);
    pipelines_[id] = p;

    std::cout << "[PIPELINE] Created " << id << (active ? " (active)" : " (inactive)") << "\n";
    return p;
}

void PromotionPipeline::set_pipeline_active(const std::string& id, bool active) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = pipelines_.find(id);
    if (it == pipelines_.end()) throw NotFound("pipeline '" + id + "' not found");
    if (it->second.active == active) return;

    PipelineState next = it->second;
    next.active = active;
    persist_pipeline_locked(next);
    it->second = std::move(next);

    std::cout << "[PIPELINE] " << id << (active ? " activated" : " deactivated") << "\n";
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

double PromotionPipeline::consistency_score(const CandidatePerformance& perf) const {
    const auto& w = settings_.consistency;
    return w.w_win_rate * perf.win_rate +
           w.w_profit_factor * std::min(perf.profit_factor / w.profit_factor_norm, 1.0) +
           w.w_sharpe * std::min(perf.sharpe_ratio / w.sharpe_norm, 1.0);
}

bool PromotionPipeline::evaluate_candidate(const StrategyCandidate& c,
                                           const PromotionCriteria& cr) const {
    const auto& p = c.performance;
    return c.generation >= cr.min_generations &&
           c.fitness >= cr.min_fitness &&
           p.win_rate >= cr.min_win_rate &&
           p.max_drawdown <= cr.max_drawdown &&
           p.total_trades >= cr.min_trades &&
           consistency_score(p) >= cr.consistency_score;
}

std::vector<std::string> PromotionPipeline::add_candidate(const StrategyCandidate& candidate) {
    require_candidate_shape(candidate);

    StrategyCandidate c = candidate;
    uint64_t now = clock_.wall_ns();
    if (c.created_at_ns == 0) c.created_at_ns = now;

    std::vector<std::string> joined;
    {
        std::lock_guard<std::mutex> lock(mtx_);

        WriteBatch batch;
        std::vector<PipelineState> updated;
        for (const auto& kv : pipelines_) {
            const PipelineState& p = kv.second;
            if (!p.active || p.contains(c.id)) continue;
            if (!evaluate_candidate(c, p.criteria)) continue;

            PipelineState next = p;
            next.candidates.push_back({c, now});
            batch.put("pipeline." + next.id, json(next));
            updated.push_back(std::move(next));
        }

        store_.commit(batch);

        candidates_.emplace(c.id, c);
        for (auto& p : updated) {
            joined.push_back(p.id);
            pipelines_[p.id] = std::move(p);
        }
    }

    if (joined.empty()) {
        std::cout << "[PIPELINE] Candidate " << c.id << " qualified for no active pipeline\n";
    } else {
        std::cout << "[PIPELINE] Candidate " << c.id << " added to " << joined.size()
                  << " pipeline(s)\n";
    }
    return joined;
}

// ---------------------------------------------------------------------------
// Validation scoring
// ---------------------------------------------------------------------------

ValidationResult PromotionPipeline::build_result(const ValidationPerformance& perf,
                                                 const PromotionCriteria& cr,
                                                 const ScoreWeights& w) {
    ValidationResult r;
    r.performance = perf;
    r.validation_period_days = cr.validation_period_days;

    r.passed = perf.pnl > 0.0 &&
               perf.win_rate > cr.min_win_rate &&
               perf.drawdown < cr.max_drawdown;

    r.score = w.w_pnl * (perf.pnl / w.pnl_norm) +
              w.w_win_rate * perf.win_rate +
              w.w_drawdown * (1.0 - perf.drawdown / w.drawdown_norm);

    if (r.passed) {
        r.feedback.push_back("Passed all validation criteria");
        if (perf.pnl > 500.0)       r.feedback.push_back("Strong profit performance");
        if (perf.win_rate > 0.7)    r.feedback.push_back("High win rate maintained");
        if (perf.drawdown < 0.05)   r.feedback.push_back("Excellent risk management");
    } else {
        r.feedback.push_back("Failed validation criteria");
        if (perf.pnl <= 0.0)                 r.feedback.push_back("Negative P&L during validation");
        if (perf.win_rate <= cr.min_win_rate) r.feedback.push_back("Win rate below threshold");
        if (perf.drawdown >= cr.max_drawdown) r.feedback.push_back("Excessive drawdown");
    }
    return r;
}

ValidationResult PromotionPipeline::run_validation(const PendingCandidate& pending,
                                                   const std::string& pipeline_id,
                                                   const PromotionCriteria& criteria) {
    ValidationWindow window;
    window.period_days = criteria.validation_period_days;
    window.start_ns = pending.entered_at_ns;
    window.end_ns = pending.entered_at_ns + clamped_span_ns(criteria.validation_period_days,
                                                            pending.entered_at_ns, clock_.wall_ns());

    ValidationPerformance perf;
    try {
        perf = validator_.evaluate(pending.candidate, criteria, window);
    } catch (const std::exception& e) {
        std::cerr << "[PIPELINE] Validator fault on " << pending.candidate.id
                  << " in " << pipeline_id << ": " << e.what() << "\n";
        throw AegisError(ErrorKind::VALIDATION_FAILED,
                         std::string("validator fault: ") + e.what());
    }
    if (!std::isfinite(perf.pnl) || !std::isfinite(perf.win_rate) || !std::isfinite(perf.drawdown)) {
        throw AegisError(ErrorKind::VALIDATION_FAILED, "validator returned non-finite performance");
    }

    ValidationResult r = build_result(perf, criteria, settings_.score);
    r.candidate_id = pending.candidate.id;
    r.pipeline_id = pipeline_id;
    r.ts_ns = clock_.wall_ns();
    return r;
}

// ---------------------------------------------------------------------------
// Deployment
// ---------------------------------------------------------------------------

DeployedStrategy PromotionPipeline::deploy(const StrategyCandidate& c, const std::string& pipeline_id) {
    const RiskLevel risk = c.metadata.risk_level;
    const double amount = settings_.deploy_amount(risk);

    std::string allocation_id;
    try {
        CapitalAllocation a = ledger_.allocate_capital(settings_.deploy_pool, c.experiment_id, amount, risk);
        allocation_id = a.id;
        return deployer_.deploy(c, pipeline_id, allocation_id, amount);
    } catch (const std::exception& e) {
        std::cerr << "[PIPELINE] Deployment of " << c.id << " from " << pipeline_id
                  << " failed: " << e.what() << "\n";

        if (!allocation_id.empty()) {
            try {
                ledger_.release_capital(allocation_id, 0.0);
            } catch (const std::exception& re) {
                std::cerr << "[PIPELINE] Release of " << allocation_id
                          << " after failed deployment also failed: " << re.what() << "\n";
            }
        }

        bus_.publish(NotificationType::DEPLOYMENT_FAILED, "pipeline",
                     "deployment of " + c.id + " failed: " + e.what(),
                     json{{"candidateId", c.id}, {"pipelineId", pipeline_id},
                          {"allocationId", allocation_id}, {"error", e.what()}});
        throw DeploymentFailure("deployment of " + c.id + " failed: " + e.what());
    }
}

void PromotionPipeline::retire(const DeployedStrategy& d, const std::string& why) {
    try {
        deployer_.withdraw(d.strategy_id);
    } catch (const std::exception& e) {
        std::cerr << "[PIPELINE] Withdrawal of " << d.strategy_id << " (" << why
                  << ") failed, capital stays allocated: " << e.what() << "\n";
        return;
    }
    try {
        ledger_.release_capital(d.allocation_id, 0.0);
    } catch (const std::exception& e) {
        std::cerr << "[PIPELINE] Release of " << d.allocation_id << " after withdrawing "
                  << d.strategy_id << " failed: " << e.what() << "\n";
    }
}

std::optional<ValidationResult> PromotionPipeline::last_result_locked(const std::string& candidate_id,
                                                                      const std::string& pipeline_id) const {
    auto it = results_.find(candidate_id);
    if (it == results_.end()) return std::nullopt;
    for (auto r = it->second.rbegin(); r != it->second.rend(); ++r) {
        if (r->pipeline_id == pipeline_id) return *r;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Promotion
// ---------------------------------------------------------------------------

ValidationResult PromotionPipeline::promote_candidate(const std::string& candidate_id,
                                                      const std::string& pipeline_id) {
    PendingCandidate pending;
    PromotionCriteria criteria;
    const std::string key = flight_key(pipeline_id, candidate_id);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto pit = pipelines_.find(pipeline_id);
        if (pit == pipelines_.end()) throw NotFound("pipeline '" + pipeline_id + "' not found");
        if (!candidates_.count(candidate_id)) throw NotFound("candidate '" + candidate_id + "' not found");

        const PipelineState& p = pit->second;
        auto cit = std::find_if(p.candidates.begin(), p.candidates.end(),
                                [&](const PendingCandidate& pc) { return pc.candidate.id == candidate_id; });
        if (cit == p.candidates.end()) {
            throw InvalidState("candidate '" + candidate_id + "' is not pending in " + pipeline_id);
        }
        if (in_flight_.count(key)) {
            throw InvalidState("promotion of '" + candidate_id + "' in " + pipeline_id +
                               " already in progress");
        }

        in_flight_.insert(key);
        pending = *cit;
        criteria = p.criteria;
    }
    InFlightGuard guard(mtx_, in_flight_, key);

    // A deployment left behind by an interrupted attempt.
    std::optional<DeployedStrategy> existing = deployer_.find_deployment(candidate_id, pipeline_id);

    ValidationResult result;
    bool reused = false;
    if (existing) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto prior = last_result_locked(candidate_id, pipeline_id);
        if (prior && prior->passed) {
            result = *prior;
            reused = true;
        }
    }

    if (reused) {
        std::cout << "[PIPELINE] Resuming promotion of " << candidate_id << " in " << pipeline_id
                  << ": " << existing->strategy_id << " already deployed\n";
    } else {
        result = run_validation(pending, pipeline_id, criteria);
        std::lock_guard<std::mutex> lock(mtx_);
        store_.append(RESULT_LOG, json(result));
        results_[candidate_id].push_back(result);
    }

    std::optional<DeployedStrategy> fresh;
    if (result.passed && !existing) {
        fresh = deploy(pending.candidate, pipeline_id);
    } else if (!result.passed && existing) {
        retire(*existing, "validation failed");
    }

    // Atomic move out of the pending set.
    std::exception_ptr persist_error;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        PipelineState next = pipelines_.at(pipeline_id);
        next.candidates.erase(
            std::remove_if(next.candidates.begin(), next.candidates.end(),
                           [&](const PendingCandidate& pc) { return pc.candidate.id == candidate_id; }),
            next.candidates.end());
        if (result.passed) next.promoted.push_back(pending.candidate);
        else next.rejected.push_back(pending.candidate);

        try {
            persist_pipeline_locked(next);
            pipelines_[pipeline_id] = std::move(next);
        } catch (const std::exception& e) {
            std::cerr << "[PIPELINE] Recording promotion of " << candidate_id << " in "
                      << pipeline_id << " failed: " << e.what() << "\n";
            persist_error = std::current_exception();
        }
    }
    if (persist_error) {
        if (fresh) retire(*fresh, "promotion not recorded");
        std::rethrow_exception(persist_error);
    }

    if (result.passed) {
        std::cout << "[PIPELINE] PROMOTED " << candidate_id << " in " << pipeline_id
                  << " (score=" << result.score << ")\n";
        bus_.publish(NotificationType::STRATEGY_PROMOTED, "pipeline",
                     "strategy " + pending.candidate.name + " promoted",
                     json{{"candidateId", candidate_id}, {"pipelineId", pipeline_id},
                          {"result", result}});
    } else {
        std::cout << "[PIPELINE] REJECTED " << candidate_id << " in " << pipeline_id
                  << " (score=" << result.score << ")\n";
        bus_.publish(NotificationType::STRATEGY_REJECTED, "pipeline",
                     "strategy " + pending.candidate.name + " rejected",
                     json{{"candidateId", candidate_id}, {"pipelineId", pipeline_id},
                          {"result", result}});
    }
    return result;
}

size_t PromotionPipeline::check_for_promotions() {
    std::vector<std::pair<std::string, std::string>> due;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_.wall_ns();
        for (const auto& kv : pipelines_) {
            const PipelineState& p = kv.second;
            if (!p.active) continue;
            for (const auto& pc : p.candidates) {
                double days = now > pc.entered_at_ns ? ns_to_days(now - pc.entered_at_ns) : 0.0;
                if (days >= p.criteria.validation_period_days &&
                    !in_flight_.count(flight_key(p.id, pc.candidate.id))) {
                    due.emplace_back(pc.candidate.id, p.id);
                }
            }
        }
    }

    size_t decisions = 0;
    for (const auto& d : due) {
        try {
            promote_candidate(d.first, d.second);
            decisions++;
        } catch (const AegisError& e) {
            std::cerr << "[PIPELINE] Sweep: " << d.first << " in " << d.second << " left pending ("
                      << error_kind_to_string(e.kind()) << "): " << e.what() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[PIPELINE] Sweep: " << d.first << " in " << d.second
                      << " left pending: " << e.what() << "\n";
        }
    }

    if (!due.empty()) {
        std::cout << "[PIPELINE] Sweep: " << decisions << "/" << due.size() << " decided\n";
    }
    return decisions;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<PipelineState> PromotionPipeline::pipelines() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<PipelineState> out;
    for (const auto& kv : pipelines_) out.push_back(kv.second);
    return out;
}

std::optional<PipelineState> PromotionPipeline::pipeline(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = pipelines_.find(id);
    if (it == pipelines_.end()) return std::nullopt;
    return it->second;
}

std::optional<StrategyCandidate> PromotionPipeline::candidate(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = candidates_.find(id);
    if (it == candidates_.end()) return std::nullopt;
    return it->second;
}

std::vector<ValidationResult> PromotionPipeline::validation_results(const std::string& candidate_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = results_.find(candidate_id);
    if (it == results_.end()) return {};
    return it->second;
}

PromotionStats PromotionPipeline::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    PromotionStats s;
    s.total_pipelines = pipelines_.size();
    for (const auto& kv : pipelines_) {
        const PipelineState& p = kv.second;
        s.total_pending += p.candidates.size();
        s.total_promoted += p.promoted.size();
        s.total_rejected += p.rejected.size();
        if (p.active) s.active_pipelines++;
    }
    size_t decided = s.total_promoted + s.total_rejected;
    s.success_rate = decided > 0 ? static_cast<double>(s.total_promoted) / decided : 0.0;
    return s;
}

} // namespace aegis

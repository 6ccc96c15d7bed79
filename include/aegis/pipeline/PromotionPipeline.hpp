#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/ledger/CapitalLedger.hpp"
#include "aegis/notify/NotificationBus.hpp"
#include "aegis/pipeline/CandidateValidator.hpp"
#include "aegis/pipeline/StrategyDeployer.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

struct PromotionSettings {
    ConsistencyWeights consistency;
    ScoreWeights score;

    std::string deploy_pool = "competition_pool";
    double deploy_low    = 1000.0;
    double deploy_medium = 2500.0;
    double deploy_high   = 5000.0;

    double deploy_amount(RiskLevel r) const {
        switch (r) {
            case RiskLevel::LOW:    return deploy_low;
            case RiskLevel::MEDIUM: return deploy_medium;
            case RiskLevel::HIGH:   return deploy_high;
        }
        return deploy_low;
    }
};

// ---------------------------------------------------------------------------
// Staged promotion of evolved strategies.
//
//   add_candidate        -> pending in every active pipeline it qualifies for
//   promote_candidate    -> validate, then deploy + promoted, or rejected
//   check_for_promotions -> promote everything whose validation period ran out
//
// Membership changes happen under mtx_ and are persisted with the pipeline
// document in the same critical section. Validation and deployment run
// outside the lock; the (pipeline, candidate) pair is marked in flight for
// the duration so a second promotion of the same pair is refused.
//
// A deployment that outlived its promotion (crash or failed membership
// write) is picked up by the next attempt instead of being deployed again.
// ---------------------------------------------------------------------------
class PromotionPipeline {
public:
    static constexpr const char* RESULT_LOG = "promotion.validations";

    PromotionPipeline(StateStore& store, NotificationBus& bus, const Clock& clock,
                      CapitalLedger& ledger, CandidateValidator& validator,
                      StrategyDeployer& deployer, PromotionSettings settings = {});

    void load();

    // --- Pipelines ---------------------------------------------------------
    PipelineState create_pipeline(const std::string& id, const std::string& name,
                                  const PromotionCriteria& criteria, bool active);
    void set_pipeline_active(const std::string& id, bool active);

    // --- Candidates --------------------------------------------------------
    // Ids of the pipelines the candidate joined.
    std::vector<std::string> add_candidate(const StrategyCandidate& candidate);

    bool evaluate_candidate(const StrategyCandidate& candidate,
                            const PromotionCriteria& criteria) const;
    double consistency_score(const CandidatePerformance& perf) const;

    ValidationResult promote_candidate(const std::string& candidate_id,
                                       const std::string& pipeline_id);

    size_t check_for_promotions();

    // Pure scoring of a validator's output against the criteria.
    static ValidationResult build_result(const ValidationPerformance& perf,
                                         const PromotionCriteria& criteria,
                                         const ScoreWeights& weights);

    // --- Queries -----------------------------------------------------------
    std::vector<PipelineState> pipelines() const;
    std::optional<PipelineState> pipeline(const std::string& id) const;
    std::optional<StrategyCandidate> candidate(const std::string& id) const;
    std::vector<ValidationResult> validation_results(const std::string& candidate_id) const;
    PromotionStats stats() const;

    const PromotionSettings& settings() const { return settings_; }

private:
    ValidationResult run_validation(const PendingCandidate& pending,
                                    const std::string& pipeline_id,
                                    const PromotionCriteria& criteria);

    DeployedStrategy deploy(const StrategyCandidate& candidate, const std::string& pipeline_id);

    // Withdraws a deployment and returns its capital. The allocation is kept
    // when the withdrawal fails so a live strategy never runs unfunded.
    void retire(const DeployedStrategy& d, const std::string& why);

    std::optional<ValidationResult> last_result_locked(const std::string& candidate_id,
                                                       const std::string& pipeline_id) const;

    void persist_pipeline_locked(const PipelineState& p);

    StateStore& store_;
    NotificationBus& bus_;
    const Clock& clock_;
    CapitalLedger& ledger_;
    CandidateValidator& validator_;
    StrategyDeployer& deployer_;
    const PromotionSettings settings_;

    mutable std::mutex mtx_;
    std::map<std::string, PipelineState> pipelines_;
    std::map<std::string, StrategyCandidate> candidates_;
    std::map<std::string, std::vector<ValidationResult>> results_;
    std::set<std::string> in_flight_;
};

} // namespace aegis

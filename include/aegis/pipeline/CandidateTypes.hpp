#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aegis/infra/Types.hpp"

namespace aegis {

struct CandidatePerformance {
    int total_trades = 0;
    double win_rate = 0.0;          // [0,1]
    double profit_factor = 0.0;
    double max_drawdown = 0.0;      // [0,1]
    double sharpe_ratio = 0.0;
};

struct CandidateMetadata {
    RiskLevel risk_level = RiskLevel::LOW;
    std::string strategy_type;
    std::vector<std::string> market_conditions;
    std::map<std::string, double> parameters;
};

// Emitted by the evolution engine. Never modified after submission.
struct StrategyCandidate {
    std::string id;
    std::string name;
    double fitness = 0.0;
    int generation = 0;
    std::string experiment_id;
    uint64_t created_at_ns = 0;
    CandidatePerformance performance;
    CandidateMetadata metadata;
};

struct PromotionCriteria {
    int min_generations = 0;
    double min_fitness = 0.0;
    double min_win_rate = 0.0;
    double max_drawdown = 1.0;
    int min_trades = 0;
    double consistency_score = 0.0;
    double validation_period_days = 0.0;
};

// consistency = w_win_rate*winRate + w_profit_factor*min(pf/pf_norm,1)
//             + w_sharpe*min(sharpe/sharpe_norm,1)
struct ConsistencyWeights {
    double w_win_rate = 0.4;
    double w_profit_factor = 0.3;
    double w_sharpe = 0.3;
    double profit_factor_norm = 2.0;
    double sharpe_norm = 3.0;
};

// score = w_pnl*(pnl/pnl_norm) + w_win_rate*winRate + w_drawdown*(1 - dd/drawdown_norm)
struct ScoreWeights {
    double w_pnl = 0.4;
    double pnl_norm = 1000.0;
    double w_win_rate = 0.4;
    double w_drawdown = 0.2;
    double drawdown_norm = 0.15;
};

struct ValidationPerformance {
    double pnl = 0.0;
    double win_rate = 0.0;
    double drawdown = 0.0;
    int trades = 0;
};

struct ValidationResult {
    std::string candidate_id;
    std::string pipeline_id;
    bool passed = false;
    double score = 0.0;
    double validation_period_days = 0.0;
    ValidationPerformance performance;
    std::vector<std::string> feedback;
    uint64_t ts_ns = 0;
};

struct PendingCandidate {
    StrategyCandidate candidate;
    uint64_t entered_at_ns = 0;
};

// One promotion track. A candidate id is in at most one of the three sets.
struct PipelineState {
    std::string id;
    std::string name;
    PromotionCriteria criteria;
    bool active = true;
    uint64_t created_at_ns = 0;

    std::vector<PendingCandidate> candidates;
    std::vector<StrategyCandidate> promoted;
    std::vector<StrategyCandidate> rejected;

    bool contains(const std::string& candidate_id) const;
    bool is_pending(const std::string& candidate_id) const;
};

struct PromotionStats {
    size_t total_pending = 0;
    size_t total_promoted = 0;
    size_t total_rejected = 0;
    double success_rate = 0.0;
    size_t active_pipelines = 0;
    size_t total_pipelines = 0;
};

void to_json(nlohmann::json& j, const StrategyCandidate& c);
void from_json(const nlohmann::json& j, StrategyCandidate& c);

void to_json(nlohmann::json& j, const PromotionCriteria& c);
void from_json(const nlohmann::json& j, PromotionCriteria& c);

void to_json(nlohmann::json& j, const ValidationResult& r);
void from_json(const nlohmann::json& j, ValidationResult& r);

void to_json(nlohmann::json& j, const PipelineState& p);
void from_json(const nlohmann::json& j, PipelineState& p);

void to_json(nlohmann::json& j, const PromotionStats& s);

} // namespace aegis

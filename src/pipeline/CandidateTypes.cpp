#include "aegis/pipeline/CandidateTypes.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace aegis {

bool PipelineState::is_pending(const std::string& candidate_id) const {
    return std::any_of(candidates.begin(), candidates.end(),
                       [&](const PendingCandidate& p) { return p.candidate.id == candidate_id; });
}

bool PipelineState::contains(const std::string& candidate_id) const {
    auto same = [&](const StrategyCandidate& c) { return c.id == candidate_id; };
    return is_pending(candidate_id) ||
           std::any_of(promoted.begin(), promoted.end(), same) ||
           std::any_of(rejected.begin(), rejected.end(), same);
}

// ---------------------------------------------------------------------------
// Candidate
// ---------------------------------------------------------------------------

void to_json(json& j, const StrategyCandidate& c) {
    j = json{
        {"id", c.id},
        {"name", c.name},
        {"fitness", c.fitness},
        {"generation", c.generation},
        {"experimentId", c.experiment_id},
        {"createdAt", c.created_at_ns},
        {"performance", {
            {"totalTrades", c.performance.total_trades},
            {"winRate", c.performance.win_rate},
            {"profitFactor", c.performance.profit_factor},
            {"maxDrawdown", c.performance.max_drawdown},
            {"sharpeRatio", c.performance.sharpe_ratio}
        }},
        {"metadata", {
            {"riskLevel", risk_level_to_string(c.metadata.risk_level)},
            {"strategyType", c.metadata.strategy_type},
            {"marketConditions", c.metadata.market_conditions},
            {"parameters", c.metadata.parameters}
        }}
    };
}

void from_json(const json& j, StrategyCandidate& c) {
    c.id = j.at("id").get<std::string>();
    c.name = j.value("name", c.id);
    c.fitness = j.at("fitness").get<double>();
    c.generation = j.at("generation").get<int>();
    c.experiment_id = j.value("experimentId", c.id);
    c.created_at_ns = j.value("createdAt", uint64_t{0});

    const auto& p = j.at("performance");
    c.performance.total_trades = p.at("totalTrades").get<int>();
    c.performance.win_rate = p.at("winRate").get<double>();
    c.performance.profit_factor = p.at("profitFactor").get<double>();
    c.performance.max_drawdown = p.at("maxDrawdown").get<double>();
    c.performance.sharpe_ratio = p.at("sharpeRatio").get<double>();

    if (j.contains("metadata")) {
        const auto& m = j.at("metadata");
        c.metadata.risk_level = risk_level_from_string(m.value("riskLevel", "low"));
        c.metadata.strategy_type = m.value("strategyType", "");
        c.metadata.market_conditions = m.value("marketConditions", std::vector<std::string>{});
        c.metadata.parameters = m.value("parameters", std::map<std::string, double>{});
    }
}

// ---------------------------------------------------------------------------
// Criteria
// ---------------------------------------------------------------------------

void to_json(json& j, const PromotionCriteria& c) {
    j = json{
        {"minGenerations", c.min_generations},
        {"minFitness", c.min_fitness},
        {"minWinRate", c.min_win_rate},
        {"maxDrawdown", c.max_drawdown},
        {"minTrades", c.min_trades},
        {"consistencyScore", c.consistency_score},
        {"validationPeriod", c.validation_period_days}
    };
}

void from_json(const json& j, PromotionCriteria& c) {
    c.min_generations = j.at("minGenerations").get<int>();
    c.min_fitness = j.at("minFitness").get<double>();
    c.min_win_rate = j.at("minWinRate").get<double>();
    c.max_drawdown = j.at("maxDrawdown").get<double>();
    c.min_trades = j.at("minTrades").get<int>();
    c.consistency_score = j.at("consistencyScore").get<double>();
    c.validation_period_days = j.at("validationPeriod").get<double>();
}

// ---------------------------------------------------------------------------
// Validation result
// ---------------------------------------------------------------------------

void to_json(json& j, const ValidationResult& r) {
    j = json{
        {"candidateId", r.candidate_id},
        {"pipelineId", r.pipeline_id},
        {"passed", r.passed},
        {"score", r.score},
        {"validationPeriod", r.validation_period_days},
        {"performance", {
            {"pnl", r.performance.pnl},
            {"winRate", r.performance.win_rate},
            {"drawdown", r.performance.drawdown},
            {"trades", r.performance.trades}
        }},
        {"feedback", r.feedback},
        {"timestamp", r.ts_ns}
    };
}

void from_json(const json& j, ValidationResult& r) {
    r.candidate_id = j.at("candidateId").get<std::string>();
    r.pipeline_id = j.value("pipelineId", "");
    r.passed = j.at("passed").get<bool>();
    r.score = j.value("score", 0.0);
    r.validation_period_days = j.value("validationPeriod", 0.0);
    const auto& p = j.at("performance");
    r.performance.pnl = p.value("pnl", 0.0);
    r.performance.win_rate = p.value("winRate", 0.0);
    r.performance.drawdown = p.value("drawdown", 0.0);
    r.performance.trades = p.value("trades", 0);
    r.feedback = j.value("feedback", std::vector<std::string>{});
    r.ts_ns = j.value("timestamp", uint64_t{0});
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

void to_json(json& j, const PipelineState& p) {
    json pending = json::array();
    for (const auto& c : p.candidates) {
        pending.push_back(json{{"candidate", c.candidate}, {"enteredAt", c.entered_at_ns}});
    }
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"criteria", p.criteria},
        {"active", p.active},
        {"createdAt", p.created_at_ns},
        {"candidates", pending},
        {"promoted", p.promoted},
        {"rejected", p.rejected}
    };
}

void from_json(const json& j, PipelineState& p) {
    p.id = j.at("id").get<std::string>();
    p.name = j.value("name", p.id);
    p.criteria = j.at("criteria").get<PromotionCriteria>();
    p.active = j.value("active", true);
    p.created_at_ns = j.value("createdAt", uint64_t{0});

    p.candidates.clear();
    for (const auto& e : j.value("candidates", json::array())) {
        PendingCandidate pc;
        pc.candidate = e.at("candidate").get<StrategyCandidate>();
        pc.entered_at_ns = e.value("enteredAt", uint64_t{0});
        p.candidates.push_back(std::move(pc));
    }
    p.promoted = j.value("promoted", std::vector<StrategyCandidate>{});
    p.rejected = j.value("rejected", std::vector<StrategyCandidate>{});
}

void to_json(json& j, const PromotionStats& s) {
    j = json{
        {"totalPending", s.total_pending},
        {"totalPromoted", s.total_promoted},
        {"totalRejected", s.total_rejected},
        {"successRate", s.success_rate},
        {"activePipelines", s.active_pipelines},
        {"totalPipelines", s.total_pipelines}
    };
}

} // namespace aegis

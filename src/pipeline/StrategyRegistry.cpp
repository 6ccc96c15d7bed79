#include "aegis/pipeline/StrategyDeployer.hpp"
#include "aegis/infra/Errors.hpp"

#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const DeployedStrategy& d) {
    j = json{
        {"strategyId", d.strategy_id},
        {"candidateId", d.candidate_id},
        {"pipelineId", d.pipeline_id},
        {"allocationId", d.allocation_id},
        {"capital", d.capital},
        {"deployedAt", d.deployed_at_ns}
    };
}

void from_json(const json& j, DeployedStrategy& d) {
    d.strategy_id = j.at("strategyId").get<std::string>();
    d.candidate_id = j.at("candidateId").get<std::string>();
    d.pipeline_id = j.value("pipelineId", "");
    d.allocation_id = j.value("allocationId", "");
    d.capital = j.value("capital", 0.0);
    d.deployed_at_ns = j.value("deployedAt", uint64_t{0});
}

StrategyRegistry::StrategyRegistry(StateStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

void StrategyRegistry::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    deployed_.clear();
    for (const auto& kv : store_.scan("strategy.")) {
        deployed_.push_back(kv.second.get<DeployedStrategy>());
    }
    std::cout << "[PIPELINE] Restored " << deployed_.size() << " deployed strategies\n";
}

DeployedStrategy StrategyRegistry::deploy(const StrategyCandidate& candidate,
                                          const std::string& pipeline_id,
                                          const std::string& allocation_id,
                                          double capital) {
    DeployedStrategy d;
    d.strategy_id = strategy_id_for(candidate.id, pipeline_id);
    d.candidate_id = candidate.id;
    d.pipeline_id = pipeline_id;
    d.allocation_id = allocation_id;
    d.capital = capital;
    d.deployed_at_ns = clock_.wall_ns();

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& e : deployed_) {
        if (e.strategy_id == d.strategy_id) {
            throw DeploymentFailure("strategy " + d.strategy_id + " is already deployed");
        }
    }

    WriteBatch batch;
    batch.put("strategy." + d.strategy_id, json(d));
    store_.commit(batch);
    deployed_.push_back(d);

    std::cout << "[PIPELINE] Deployed " << d.strategy_id << " with " << capital
              << " (" << allocation_id << ")\n";
    return d;
}

std::string StrategyRegistry::strategy_id_for(const std::string& candidate_id,
                                              const std::string& pipeline_id) {
    return "strat_" + candidate_id + "@" + pipeline_id;
}

std::optional<DeployedStrategy> StrategyRegistry::find_deployment(const std::string& candidate_id,
                                                                  const std::string& pipeline_id) const {
    return find(strategy_id_for(candidate_id, pipeline_id));
}

void StrategyRegistry::withdraw(const std::string& strategy_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(deployed_.begin(), deployed_.end(),
                           [&](const DeployedStrategy& e) { return e.strategy_id == strategy_id; });
    if (it == deployed_.end()) throw NotFound("strategy " + strategy_id + " is not deployed");

    WriteBatch batch;
    batch.erase("strategy." + strategy_id);
    store_.commit(batch);
    deployed_.erase(it);

    std::cout << "[PIPELINE] Withdrew " << strategy_id << "\n";
}

std::optional<DeployedStrategy> StrategyRegistry::find(const std::string& strategy_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& e : deployed_) {
        if (e.strategy_id == strategy_id) return e;
    }
    return std::nullopt;
}

std::vector<DeployedStrategy> StrategyRegistry::all() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return deployed_;
}

} // namespace aegis

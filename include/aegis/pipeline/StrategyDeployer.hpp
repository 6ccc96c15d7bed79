#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aegis/infra/Clock.hpp"
#include "aegis/pipeline/CandidateTypes.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

struct DeployedStrategy {
    std::string strategy_id;
    std::string candidate_id;
    std::string pipeline_id;
    std::string allocation_id;
    double capital = 0.0;
    uint64_t deployed_at_ns = 0;
};

void to_json(nlohmann::json& j, const DeployedStrategy& d);
void from_json(const nlohmann::json& j, DeployedStrategy& d);

// Registers a promoted strategy for execution. Throws on failure; the
// pipeline then releases the capital it allocated.
//
// find_deployment() lets a promotion interrupted after deployment finish
// without deploying twice. withdraw() undoes a deployment whose promotion
// could not be recorded.
class StrategyDeployer {
public:
    virtual ~StrategyDeployer() = default;

    virtual DeployedStrategy deploy(const StrategyCandidate& candidate,
                                    const std::string& pipeline_id,
                                    const std::string& allocation_id,
                                    double capital) = 0;

    virtual std::optional<DeployedStrategy> find_deployment(const std::string& candidate_id,
                                                            const std::string& pipeline_id) const = 0;

    virtual void withdraw(const std::string& strategy_id) = 0;
};

// Durable registry of deployed strategies. The execution side polls it.
class StrategyRegistry final : public StrategyDeployer {
public:
    StrategyRegistry(StateStore& store, const Clock& clock);

    void load();

    DeployedStrategy deploy(const StrategyCandidate& candidate,
                            const std::string& pipeline_id,
                            const std::string& allocation_id,
                            double capital) override;

    std::optional<DeployedStrategy> find_deployment(const std::string& candidate_id,
                                                    const std::string& pipeline_id) const override;

    void withdraw(const std::string& strategy_id) override;

    static std::string strategy_id_for(const std::string& candidate_id,
                                       const std::string& pipeline_id);

    std::optional<DeployedStrategy> find(const std::string& strategy_id) const;
    std::vector<DeployedStrategy> all() const;

private:
    StateStore& store_;
    const Clock& clock_;

    mutable std::mutex mtx_;
    std::vector<DeployedStrategy> deployed_;
};

} // namespace aegis

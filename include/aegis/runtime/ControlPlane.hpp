#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "aegis/evidence/DecisionRecorder.hpp"
#include "aegis/exec/OrderGateway.hpp"
#include "aegis/infra/Clock.hpp"
#include "aegis/ledger/CapitalLedger.hpp"
#include "aegis/notify/NotificationBus.hpp"
#include "aegis/notify/NotificationSinks.hpp"
#include "aegis/nudge/ConfidenceNudgeEngine.hpp"
#include "aegis/nudge/ReactionStats.hpp"
#include "aegis/pipeline/PaperTradeValidator.hpp"
#include "aegis/pipeline/PromotionPipeline.hpp"
#include "aegis/pipeline/StrategyDeployer.hpp"
#include "aegis/runtime/PeriodicScheduler.hpp"
#include "aegis/runtime/Settings.hpp"
#include "aegis/safety/SafetySupervisor.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

// One trading decision as produced by a strategy, before any gate ran.
struct DecisionRequest {
    std::string symbol;
    std::string sector;
    std::string strategy_id;
    TradePlan plan;
    RiskGate risk_gate;
    std::optional<MarketContext> market_context;
    std::vector<NewsEvidence> news_evidence;
    std::vector<EventSignal> events;
    bool is_entry = true;
    double limit_price = 0.0;
};

// =============================================================================
// ControlPlane - single owner of every control-plane component.
//
// Construction wires the components together but touches no state. start()
// restores everything from the store, installs the configured pools and
// pipelines that do not exist yet, attaches notification sinks and starts
// the periodic tasks:
//
//   promotion_sweep  PromotionPipeline::check_for_promotions
//   safety_tick      SafetySupervisor::tick   (breaker reset, cooldown, day)
//   nudge_tick       ConfidenceNudgeEngine::tick
//
// stop() halts the tasks and flushes the webhook worker. The store and the
// clock are owned by the caller and must outlive this object.
// =============================================================================
class ControlPlane {
public:
    ControlPlane(ControlPlaneSettings settings, StateStore& store, const Clock& clock);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    void start();
    void stop();
    bool started() const { return started_; }

    // Gates, records and (when every gate passes) submits one decision.
    // Returns the trace with its final execution status.
    DecisionTrace execute_decision(DecisionRequest request);

    // Later broker outcome for a submitted decision (live -> filled and so
    // on). A fill is fed to the safety supervisor with its realized P&L.
    // Only live, filled, rejected and cancelled can be reported.
    DecisionTrace report_execution(const std::string& trace_id, ExecutionStatus status,
                                   const std::vector<std::string>& broker_order_ids,
                                   const std::string& reason,
                                   std::optional<double> realized_pnl = std::nullopt);

    // Not owned. Must outlive the control plane or be detached first.
    void set_live_broker(BrokerAdapter* live) { gateway_.set_live_broker(live); }
    void set_risk_source(RiskMetricsSource* source) { safety_.set_risk_source(source); }

    // --- Components ----------------------------------------------------------
    const ControlPlaneSettings& settings() const { return settings_; }
    const Clock& clock() const { return clock_; }
    NotificationBus& bus() { return bus_; }
    CapitalLedger& ledger() { return ledger_; }
    SafetySupervisor& safety() { return safety_; }
    OrderGateway& gateway() { return gateway_; }
    ReactionStatsTable& reaction_stats() { return reaction_stats_; }
    ConfidenceNudgeEngine& nudge() { return nudge_; }
    PaperTradeValidator& paper_validator() { return validator_; }
    StrategyRegistry& registry() { return registry_; }
    PromotionPipeline& pipeline() { return pipeline_; }
    DecisionRecorder& recorder() { return recorder_; }
    PeriodicScheduler& scheduler() { return scheduler_; }

private:
    void attach_sinks();
    void install_pools();
    void install_pipelines();
    void load_reaction_stats();
    void register_tasks();

    const ControlPlaneSettings settings_;
    StateStore& store_;
    const Clock& clock_;

    // Declared before the bus so they outlive its subscriptions.
    std::unique_ptr<JournalSink> journal_;
    std::unique_ptr<WebhookSink> webhook_;

    NotificationBus bus_;
    CapitalLedger ledger_;
    SafetySupervisor safety_;
    PaperBroker paper_broker_;
    OrderGateway gateway_;
    ReactionStatsTable reaction_stats_;
    ConfidenceNudgeEngine nudge_;
    PaperTradeValidator validator_;
    StrategyRegistry registry_;
    PromotionPipeline pipeline_;
    DecisionRecorder recorder_;
    PeriodicScheduler scheduler_;

    bool tasks_registered_ = false;
    bool started_ = false;
};

} // namespace aegis

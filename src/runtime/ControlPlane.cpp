#include "aegis/runtime/ControlPlane.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace aegis {

ControlPlane::ControlPlane(ControlPlaneSettings settings, StateStore& store, const Clock& clock)
    : settings_(std::move(settings)),
      store_(store),
      clock_(clock),
      bus_(clock, settings_.notify.history),
      ledger_(store, bus_, clock, settings_.capital_limits),
      safety_(store, bus_, clock, settings_.safety),
      gateway_(safety_, paper_broker_, clock),
      nudge_(reaction_stats_, bus_, clock, settings_.nudge),
      validator_(store, settings_.validation_notional),
      registry_(store, clock),
      pipeline_(store, bus_, clock, ledger_, validator_, registry_, settings_.promotion),
      recorder_(store, clock) {}

ControlPlane::~ControlPlane() {
    stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void ControlPlane::start() {
    if (started_) return;
    std::cout << "[AEGIS] Starting control plane\n";

    attach_sinks();

    ledger_.load();
    install_pools();

    safety_.restore();

    load_reaction_stats();

    validator_.load();
    registry_.load();
    pipeline_.load();
    install_pipelines();

    recorder_.load();

    register_tasks();
    scheduler_.start();

    started_ = true;
    std::cout << "[AEGIS] Control plane up: " << ledger_.pools().size() << " pools, "
              << pipeline_.pipelines().size() << " pipelines, "
              << recorder_.size() << " traces, mode="
              << trading_mode_to_string(safety_.trading_mode()) << "\n";
}

void ControlPlane::stop() {
    if (!started_) return;
    std::cout << "[AEGIS] Stopping control plane\n";
    scheduler_.stop();
    if (webhook_) webhook_->stop();
    started_ = false;
}

void ControlPlane::attach_sinks() {
    const auto& n = settings_.notify;
    if (!n.journal_path.empty() && !journal_) {
        journal_ = std::make_unique<JournalSink>(n.journal_path);
        journal_->attach(bus_);
        std::cout << "[NOTIFY] Journal -> " << n.journal_path << "\n";
    }
    if (!n.webhook_url.empty()) {
        if (!webhook_) {
            webhook_ = std::make_unique<WebhookSink>(n.webhook_url, n.webhook_queue,
                                                     n.webhook_timeout_sec);
            webhook_->attach(bus_);
        }
        webhook_->start();
    }
}

void ControlPlane::install_pools() {
    for (const auto& p : settings_.pools) {
        if (ledger_.has_pool(p.id)) continue;
        ledger_.create_pool(p.id, p.name, p.purpose, p.risk_level, p.total_capital);
    }
}

void ControlPlane::install_pipelines() {
    for (const auto& p : settings_.pipelines) {
        if (pipeline_.pipeline(p.id)) continue;
        pipeline_.create_pipeline(p.id, p.name, p.criteria, p.active);
    }
}

void ControlPlane::load_reaction_stats() {
    const auto& path = settings_.reaction_stats_path;
    if (path.empty()) {
        std::cout << "[NUDGE] No reaction stats configured, nudges stay neutral\n";
        return;
    }
    try {
        size_t n = reaction_stats_.load_file(path);
        std::cout << "[NUDGE] Loaded " << n << " reaction stats from " << path << "\n";
    } catch (const AegisError& e) {
        // A missing table degrades every nudge to 0; trading is unaffected.
        std::cerr << "[NUDGE] Reaction stats unavailable: " << e.what() << "\n";
    }
}

void ControlPlane::register_tasks() {
    if (tasks_registered_) return;
    const auto& s = settings_.schedule;

    scheduler_.add_task("promotion_sweep", std::chrono::seconds(s.promotion_sweep_sec), [this] {
        size_t n = pipeline_.check_for_promotions();
        if (n > 0) std::cout << "[SCHED] Promotion sweep decided " << n << " candidates\n";
    });
    scheduler_.add_task("safety_tick", std::chrono::milliseconds(s.safety_tick_ms), [this] {
        safety_.tick();
    });
    scheduler_.add_task("nudge_tick", std::chrono::milliseconds(s.nudge_tick_ms), [this] {
        nudge_.tick();
    });
    tasks_registered_ = true;
}

// ---------------------------------------------------------------------------
// Decision flow
//
//   risk gates -> nudge -> safety veto -> record trace -> gateway -> status
//
// The trace is recorded before anything is sent, so a crash between submit
// and the status update leaves a pending trace rather than an unrecorded
// order. Every gate that ran appears in trace.gates.
// ---------------------------------------------------------------------------

static std::string fmt(double v, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

DecisionTrace ControlPlane::execute_decision(DecisionRequest req) {
    if (req.symbol.empty()) throw InvalidArgument("decision needs a symbol");

    DecisionTrace t;
    t.symbol = req.symbol;
    t.plan = req.plan;
    t.risk_gate = req.risk_gate;
    t.market_context = req.market_context;
    t.news_evidence = req.news_evidence;

    const auto& rg = req.risk_gate;
    t.gates.push_back({"position_limits", rg.position_limits_ok, ""});
    t.gates.push_back({"portfolio_heat", rg.portfolio_heat_ok, ""});
    t.gates.push_back({"drawdown", rg.drawdown_ok, ""});
    const bool risk_ok = rg.passed_count() == 3;

    if (!req.events.empty()) {
        for (auto& e : req.events) {
            if (!e.validated) nudge_.validate_event(e, req.sector);
        }
        MarketContext ctx = req.market_context.value_or(MarketContext{});
        double n = nudge_.calculate_nudge(req.events, ctx, req.sector, req.symbol);
        t.nudge = nudge_.explain(n, req.events, ctx);
        t.gates.push_back({"nudge_engine", !t.nudge->breaker_active,
                           t.nudge->breaker_active
                               ? "breaker active, nudge forced to 0"
                               : "nudge " + fmt(t.nudge->nudge_bps, 2) + " bps"});
    }

    const bool wants_order = req.plan.action != "hold" && req.plan.qty > 0.0;

    OrderIntent intent;
    intent.strategy_id = req.strategy_id;
    intent.symbol = req.symbol;
    intent.side = req.plan.action == "sell" ? -1 : 1;
    intent.qty = req.plan.qty;
    intent.order_type = req.plan.order_type;
    intent.limit_price = req.limit_price;
    intent.is_entry = req.is_entry;

    GateDecision veto = safety_.check_order(intent);
    t.gates.push_back({"safety", veto.allowed,
                       veto.allowed
                           ? std::string("mode ") + trading_mode_to_string(safety_.trading_mode())
                           : veto.reason});

    DecisionTrace rec = recorder_.record(std::move(t));

    if (!wants_order) {
        return recorder_.update_execution(rec.trace_id, ExecutionStatus::CANCELLED, {},
                                          "no order: plan action " + req.plan.action);
    }
    if (!risk_ok) {
        return recorder_.update_execution(rec.trace_id, ExecutionStatus::BLOCKED, {},
                                          "risk gate failed (" +
                                          std::to_string(rg.passed_count()) + "/3 passed)");
    }
    if (!veto.allowed) {
        return recorder_.update_execution(rec.trace_id, ExecutionStatus::BLOCKED, {},
                                          veto.reason);
    }

    intent.client_order_id = rec.trace_id;
    ExecutionReport report = gateway_.submit(intent);
    if (report.status == ExecutionStatus::PENDING) return rec;

    return recorder_.update_execution(rec.trace_id, report.status,
                                      report.broker_order_ids, report.reason);
}

DecisionTrace ControlPlane::report_execution(const std::string& trace_id, ExecutionStatus status,
                                             const std::vector<std::string>& broker_order_ids,
                                             const std::string& reason,
                                             std::optional<double> realized_pnl) {
    if (status == ExecutionStatus::PENDING || status == ExecutionStatus::BLOCKED) {
        throw InvalidArgument(std::string("cannot report status '") +
                              execution_status_to_string(status) + "' from a broker");
    }
    if (realized_pnl && status != ExecutionStatus::FILLED) {
        throw InvalidArgument("realized P&L only accompanies a fill");
    }
    if (realized_pnl && !std::isfinite(*realized_pnl)) {
        throw InvalidArgument("realized P&L must be finite");
    }

    DecisionTrace t = recorder_.update_execution(trace_id, status, broker_order_ids, reason);
    if (status == ExecutionStatus::FILLED) {
        safety_.record_fill(realized_pnl.value_or(0.0));
    }
    std::cout << "[GATEWAY] " << trace_id << " reported " << execution_status_to_string(status);
    if (realized_pnl) std::cout << " pnl=" << *realized_pnl;
    std::cout << "\n";
    return t;
}

} // namespace aegis

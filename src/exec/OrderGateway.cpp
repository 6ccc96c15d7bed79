#include "aegis/exec/OrderGateway.hpp"

#include <iostream>

using json = nlohmann::json;

namespace aegis {

void to_json(json& j, const ExecutionReport& r) {
    j = json{
        {"status", execution_status_to_string(r.status)},
        {"brokerOrderIds", r.broker_order_ids},
        {"reason", r.reason},
        {"mode", trading_mode_to_string(r.mode)},
        {"latencyMs", r.latency_ms}
    };
    if (r.realized_pnl) j["realizedPnl"] = *r.realized_pnl;
}

ExecutionReport PaperBroker::submit(const OrderIntent& order) {
    ExecutionReport r;
    if (order.qty <= 0.0) {
        r.status = ExecutionStatus::REJECTED;
        r.reason = "quantity must be positive";
        return r;
    }
    r.status = ExecutionStatus::FILLED;
    r.broker_order_ids.push_back("paper-" + std::to_string(seq_.fetch_add(1) + 1));
    return r;
}

OrderGateway::OrderGateway(SafetySupervisor& safety, BrokerAdapter& paper, const Clock& clock)
    : safety_(safety), paper_(paper), clock_(clock) {}

void OrderGateway::set_live_broker(BrokerAdapter* live) {
    std::lock_guard<std::mutex> lock(live_mtx_);
    live_ = live;
}

ExecutionReport OrderGateway::submit(const OrderIntent& order) {
    // ---------------------------------------------------------------------------
    // SAFETY GATE: synchronous, at the point of submission. Nothing blocked
    // here reaches a broker or counts as a broker outcome.
    // ---------------------------------------------------------------------------
    GateDecision gate = safety_.check_order(order);
    TradingMode mode = safety_.trading_mode();

    if (!gate.allowed) {
        blocked_++;
        ExecutionReport r;
        r.status = ExecutionStatus::BLOCKED;
        r.reason = gate.reason;
        r.mode = mode;
        return r;
    }

    BrokerAdapter* broker = &paper_;
    if (mode == TradingMode::LIVE) {
        std::lock_guard<std::mutex> lock(live_mtx_);
        broker = live_;
    }

    if (!broker) {
        ExecutionReport r;
        r.status = ExecutionStatus::REJECTED;
        r.reason = "live broker not configured";
        r.mode = mode;
        std::cerr << "[GATEWAY] REJECT " << order.symbol << ": " << r.reason << "\n";
        return r;
    }

    // ---------------------------------------------------------------------------
    // Route + measure
    // ---------------------------------------------------------------------------
    uint64_t t0 = clock_.mono_ns();
    ExecutionReport r;
    try {
        r = broker->submit(order);
    } catch (const std::exception& e) {
        double latency_ms = ns_to_ms(clock_.mono_ns() - t0);
        safety_.record_order_result(false, latency_ms);

        r = ExecutionReport{};
        r.status = ExecutionStatus::REJECTED;
        r.reason = std::string("broker fault: ") + e.what();
        r.mode = mode;
        r.latency_ms = latency_ms;
        std::cerr << "[GATEWAY] " << broker->name() << " fault on " << order.symbol
                  << ": " << e.what() << "\n";
        return r;
    }

    r.latency_ms = ns_to_ms(clock_.mono_ns() - t0);
    r.mode = mode;
    routed_++;

    bool ok = r.status != ExecutionStatus::REJECTED;
    safety_.record_order_result(ok, r.latency_ms);

    if (r.status == ExecutionStatus::FILLED) {
        safety_.record_fill(r.realized_pnl.value_or(0.0));
    }

    std::cout << "[GATEWAY] " << broker->name() << " " << order.symbol
              << " qty=" << order.qty << " -> " << execution_status_to_string(r.status)
              << " (" << r.latency_ms << "ms)\n";
    return r;
}

} // namespace aegis

#pragma once

#include <atomic>
#include <mutex>

#include "aegis/exec/BrokerAdapter.hpp"
#include "aegis/infra/Clock.hpp"
#include "aegis/safety/SafetySupervisor.hpp"

namespace aegis {

// Records every accepted order as filled at the requested price. Stands in
// for a venue while the control plane runs in paper mode.
class PaperBroker final : public BrokerAdapter {
public:
    std::string name() const override { return "paper"; }
    ExecutionReport submit(const OrderIntent& order) override;

    uint64_t submitted() const { return seq_.load(); }

private:
    std::atomic<uint64_t> seq_{0};
};

// ---------------------------------------------------------------------------
// The only path from a trading decision to a broker.
//
// Gate order at submit():
//   1. SafetySupervisor::check_order (emergency stop, breaker, cooldown)
//   2. route by trading mode (paper broker / live broker)
// Every broker round trip feeds latency and success back into the
// supervisor; fills with realized P&L feed daily loss and cooldown.
// ---------------------------------------------------------------------------
class OrderGateway {
public:
    OrderGateway(SafetySupervisor& safety, BrokerAdapter& paper, const Clock& clock);

    // Not owned. nullptr = no live venue; live-mode orders are rejected.
    void set_live_broker(BrokerAdapter* live);

    ExecutionReport submit(const OrderIntent& order);

    uint64_t blocked_count() const { return blocked_.load(); }
    uint64_t routed_count() const { return routed_.load(); }

private:
    SafetySupervisor& safety_;
    BrokerAdapter& paper_;
    const Clock& clock_;

    std::mutex live_mtx_;
    BrokerAdapter* live_ = nullptr;

    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> routed_{0};
};

} // namespace aegis

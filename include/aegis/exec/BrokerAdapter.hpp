#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aegis/infra/Types.hpp"
#include "aegis/safety/SafetyTypes.hpp"

namespace aegis {

struct ExecutionReport {
    ExecutionStatus status = ExecutionStatus::PENDING;
    std::vector<std::string> broker_order_ids;
    std::string reason;
    std::optional<double> realized_pnl;   // set when a fill closes a position
    TradingMode mode = TradingMode::PAPER;
    double latency_ms = 0.0;
};

// Order transport to one venue. submit() may throw on transport faults;
// the gateway counts that as an error outcome.
class BrokerAdapter {
public:
    virtual ~BrokerAdapter() = default;

    virtual std::string name() const = 0;
    virtual ExecutionReport submit(const OrderIntent& order) = 0;
};

void to_json(nlohmann::json& j, const ExecutionReport& r);

} // namespace aegis

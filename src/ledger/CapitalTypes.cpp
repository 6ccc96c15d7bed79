#include "aegis/ledger/CapitalTypes.hpp"

using json = nlohmann::json;

namespace aegis {

static TransactionType transaction_type_from_string(const std::string& s) {
    if (s == "allocation")   return TransactionType::ALLOCATION;
    if (s == "release")      return TransactionType::RELEASE;
    if (s == "pnl_update")   return TransactionType::PNL_UPDATE;
    if (s == "transfer")     return TransactionType::TRANSFER;
    if (s == "pool_created") return TransactionType::POOL_CREATED;
    throw InvalidArgument("unknown transaction type '" + s + "'");
}

void to_json(json& j, const CapitalPool& p) {
    j = json{
        {"id", p.id},
        {"name", p.name},
        {"purpose", pool_purpose_to_string(p.purpose)},
        {"riskLevel", risk_level_to_string(p.risk_level)},
        {"totalCapital", p.total_capital},
        {"allocatedCapital", p.allocated_capital},
        {"availableCapital", p.available()},
        {"realizedPnl", p.realized_pnl},
        {"maxDrawdown", p.max_drawdown},
        {"currentDrawdown", p.current_drawdown},
        {"lastUpdated", p.last_updated_ns}
    };
}

void from_json(const json& j, CapitalPool& p) {
    p.id = j.at("id").get<std::string>();
    p.name = j.value("name", p.id);
    p.purpose = pool_purpose_from_string(j.at("purpose").get<std::string>());
    p.risk_level = risk_level_from_string(j.at("riskLevel").get<std::string>());
    p.total_capital = j.at("totalCapital").get<double>();
    p.allocated_capital = j.at("allocatedCapital").get<double>();
    p.realized_pnl = j.value("realizedPnl", 0.0);
    p.max_drawdown = j.value("maxDrawdown", 0.0);
    p.current_drawdown = j.value("currentDrawdown", 0.0);
    p.last_updated_ns = j.value("lastUpdated", uint64_t{0});
}

void to_json(json& j, const CapitalAllocation& a) {
    j = json{
        {"id", a.id},
        {"poolId", a.pool_id},
        {"experimentId", a.experiment_id},
        {"amount", a.amount},
        {"riskLevel", risk_level_to_string(a.risk_level)},
        {"status", a.active() ? "active" : "released"},
        {"runningPnl", a.running_pnl},
        {"realizedPnl", a.realized_pnl},
        {"allocatedAt", a.allocated_at_ns},
        {"releasedAt", a.released_at_ns}
    };
}

void from_json(const json& j, CapitalAllocation& a) {
    a.id = j.at("id").get<std::string>();
    a.pool_id = j.at("poolId").get<std::string>();
    a.experiment_id = j.at("experimentId").get<std::string>();
    a.amount = j.at("amount").get<double>();
    a.risk_level = risk_level_from_string(j.at("riskLevel").get<std::string>());
    a.status = j.at("status").get<std::string>() == "active"
                   ? AllocationStatus::ACTIVE
                   : AllocationStatus::RELEASED;
    a.running_pnl = j.value("runningPnl", 0.0);
    a.realized_pnl = j.value("realizedPnl", 0.0);
    a.allocated_at_ns = j.value("allocatedAt", uint64_t{0});
    a.released_at_ns = j.value("releasedAt", uint64_t{0});
}

void to_json(json& j, const CapitalTransaction& t) {
    j = json{
        {"id", t.id},
        {"type", transaction_type_to_string(t.type)},
        {"poolId", t.pool_id},
        {"experimentId", t.experiment_id},
        {"allocationId", t.allocation_id},
        {"amount", t.amount},
        {"timestamp", t.ts_ns},
        {"description", t.description}
    };
}

void from_json(const json& j, CapitalTransaction& t) {
    t.id = j.at("id").get<std::string>();
    t.type = transaction_type_from_string(j.at("type").get<std::string>());
    t.pool_id = j.value("poolId", "");
    t.experiment_id = j.value("experimentId", "");
    t.allocation_id = j.value("allocationId", "");
    t.amount = j.value("amount", 0.0);
    t.ts_ns = j.value("timestamp", uint64_t{0});
    t.description = j.value("description", "");
}

void to_json(json& j, const PoolAnalytics& a) {
    j = json{
        {"poolId", a.pool_id},
        {"totalPnl", a.total_pnl},
        {"avgPnl", a.avg_pnl},
        {"winRate", a.win_rate},
        {"activeExperiments", a.active_experiments},
        {"completedExperiments", a.completed_experiments},
        {"utilizationRate", a.utilization},
        {"drawdownPercent", a.drawdown},
        {"riskAdjustedReturn", a.risk_adjusted_return}
    };
}

} // namespace aegis

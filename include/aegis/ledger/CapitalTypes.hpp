#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "aegis/infra/Types.hpp"

namespace aegis {

enum class PoolPurpose : uint8_t {
    RESEARCH = 0,
    COMPETITION,
    VALIDATION
};

inline const char* pool_purpose_to_string(PoolPurpose p) {
    switch (p) {
        case PoolPurpose::RESEARCH:    return "research";
        case PoolPurpose::COMPETITION: return "competition";
        case PoolPurpose::VALIDATION:  return "validation";
        default:                       return "unknown";
    }
}

inline PoolPurpose pool_purpose_from_string(const std::string& s) {
    if (s == "research")    return PoolPurpose::RESEARCH;
    if (s == "competition") return PoolPurpose::COMPETITION;
    if (s == "validation")  return PoolPurpose::VALIDATION;
    throw InvalidArgument("unknown pool purpose '" + s + "'");
}

struct CapitalPool {
    std::string id;
    std::string name;
    PoolPurpose purpose = PoolPurpose::RESEARCH;
    RiskLevel risk_level = RiskLevel::LOW;

    double total_capital = 0.0;
    double allocated_capital = 0.0;   // 0 <= allocated <= total, always
    double realized_pnl = 0.0;
    double max_drawdown = 0.0;
    double current_drawdown = 0.0;

    uint64_t last_updated_ns = 0;

    double available() const { return total_capital - allocated_capital; }
};

enum class AllocationStatus : uint8_t {
    ACTIVE = 0,
    RELEASED
};

struct CapitalAllocation {
    std::string id;
    std::string pool_id;
    std::string experiment_id;
    double amount = 0.0;
    RiskLevel risk_level = RiskLevel::LOW;
    AllocationStatus status = AllocationStatus::ACTIVE;

    double running_pnl = 0.0;
    double realized_pnl = 0.0;

    uint64_t allocated_at_ns = 0;
    uint64_t released_at_ns = 0;

    bool active() const { return status == AllocationStatus::ACTIVE; }
};

enum class TransactionType : uint8_t {
    ALLOCATION = 0,
    RELEASE,
    PNL_UPDATE,
    TRANSFER,
    POOL_CREATED
};

inline const char* transaction_type_to_string(TransactionType t) {
    switch (t) {
        case TransactionType::ALLOCATION:   return "allocation";
        case TransactionType::RELEASE:      return "release";
        case TransactionType::PNL_UPDATE:   return "pnl_update";
        case TransactionType::TRANSFER:     return "transfer";
        case TransactionType::POOL_CREATED: return "pool_created";
        default:                            return "unknown";
    }
}

struct CapitalTransaction {
    std::string id;
    TransactionType type = TransactionType::ALLOCATION;
    std::string pool_id;
    std::string experiment_id;
    std::string allocation_id;
    double amount = 0.0;
    uint64_t ts_ns = 0;
    std::string description;
};

struct CapitalLimits {
    double max_per_experiment_low    = 1000.0;
    double max_per_experiment_medium = 2500.0;
    double max_per_experiment_high   = 5000.0;
    int    max_concurrent_experiments = 5;
    double emergency_stop_loss = 0.20;   // fraction of pool total

    double max_for(RiskLevel r) const {
        switch (r) {
            case RiskLevel::LOW:    return max_per_experiment_low;
            case RiskLevel::MEDIUM: return max_per_experiment_medium;
            case RiskLevel::HIGH:   return max_per_experiment_high;
        }
        return max_per_experiment_low;
    }
};

struct PoolAnalytics {
    std::string pool_id;
    double total_pnl = 0.0;
    double avg_pnl = 0.0;
    double win_rate = 0.0;
    int active_experiments = 0;
    int completed_experiments = 0;
    double utilization = 0.0;
    double drawdown = 0.0;
    double risk_adjusted_return = 0.0;
};

// --- JSON mapping (persistence + operator API) ------------------------------

void to_json(nlohmann::json& j, const CapitalPool& p);
void from_json(const nlohmann::json& j, CapitalPool& p);

void to_json(nlohmann::json& j, const CapitalAllocation& a);
void from_json(const nlohmann::json& j, CapitalAllocation& a);

void to_json(nlohmann::json& j, const CapitalTransaction& t);
void from_json(const nlohmann::json& j, CapitalTransaction& t);

void to_json(nlohmann::json& j, const PoolAnalytics& a);

} // namespace aegis

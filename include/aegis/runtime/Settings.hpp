#pragma once
// =============================================================================
// Settings.hpp - typed view of config.ini
// =============================================================================
// Every section is optional; a missing key keeps the built-in default.
// Repeated blocks ([pool.<id>], [pipeline.<id>]) replace the built-in pools
// and pipelines entirely when at least one is present.
// =============================================================================

#include <string>
#include <vector>

#include "aegis/config/ConfigLoader.hpp"
#include "aegis/ledger/CapitalTypes.hpp"
#include "aegis/nudge/ConfidenceNudgeEngine.hpp"
#include "aegis/pipeline/PromotionPipeline.hpp"
#include "aegis/safety/SafetyTypes.hpp"

namespace aegis {

struct PoolSpec {
    std::string id;
    std::string name;
    PoolPurpose purpose = PoolPurpose::RESEARCH;
    RiskLevel risk_level = RiskLevel::LOW;
    double total_capital = 0.0;
};

struct PipelineSpec {
    std::string id;
    std::string name;
    PromotionCriteria criteria;
    bool active = true;
};

struct NotifySettings {
    size_t history = 256;
    std::string journal_path;          // empty = no journal
    std::string webhook_url;           // empty = no webhook
    size_t webhook_queue = 512;
    long webhook_timeout_sec = 3;
};

struct HttpSettings {
    bool enabled = true;
    std::string bind = "127.0.0.1";
    int port = 8088;
    int io_timeout_ms = 5000;   // per-request read and write deadline
};

struct ScheduleSettings {
    int promotion_sweep_sec = 900;
    int safety_tick_ms = 1000;
    int nudge_tick_ms = 1000;
};

struct ControlPlaneSettings {
    CapitalLimits capital_limits;
    std::vector<PoolSpec> pools;
    SafetyLimits safety;
    NudgeParams nudge;
    std::string reaction_stats_path;   // empty = start with no reaction stats
    std::vector<PipelineSpec> pipelines;
    PromotionSettings promotion;
    double validation_notional = 10000.0;
    std::string data_dir = "data";
    NotifySettings notify;
    HttpSettings http;
    ScheduleSettings schedule;
};

std::vector<PoolSpec> default_pools();
std::vector<PipelineSpec> default_pipelines();

// Throws InvalidArgument on an unparseable enum value (purpose, risk level).
ControlPlaneSettings load_settings(const ConfigLoader& cfg);

} // namespace aegis

#include "aegis/runtime/Settings.hpp"
#include "aegis/infra/Errors.hpp"

#include <cmath>
#include <iostream>

namespace aegis {

std::vector<PoolSpec> default_pools() {
    return {
        {"research_pool",    "Research Pool",    PoolPurpose::RESEARCH,    RiskLevel::LOW,    10000.0},
        {"competition_pool", "Competition Pool", PoolPurpose::COMPETITION, RiskLevel::MEDIUM, 50000.0},
        {"validation_pool",  "Validation Pool",  PoolPurpose::VALIDATION,  RiskLevel::MEDIUM, 15000.0},
    };
}

std::vector<PipelineSpec> default_pipelines() {
    //                      gens  fit   win   dd    trades cons  days
    PromotionCriteria conservative{10, 2.0, 0.55, 0.15, 100, 0.7, 7.0};
    PromotionCriteria aggressive  { 5, 1.5, 0.60, 0.20,  50, 0.6, 3.0};
    PromotionCriteria high_freq   { 3, 1.2, 0.65, 0.10, 200, 0.8, 1.0};

    return {
        {"conservative_promotion", "Conservative Promotion",   conservative, true},
        {"aggressive_promotion",   "Aggressive Promotion",     aggressive,   true},
        {"high_freq_promotion",    "High-Frequency Promotion", high_freq,    false},
    };
}

// ---------------------------------------------------------------------------
// Range checks. A value outside its range is a config error, never clamped.
// ---------------------------------------------------------------------------

static void require(bool ok, const std::string& sec, const std::string& key, const std::string& rule) {
    if (!ok) throw InvalidArgument("config [" + sec + "] " + key + " must be " + rule);
}

static int int_at_least(const ConfigLoader& cfg, const std::string& sec, const std::string& key,
                        int def, int min) {
    int v = cfg.getInt(sec, key, def);
    require(v >= min, sec, key, ">= " + std::to_string(min));
    return v;
}

static double positive(const ConfigLoader& cfg, const std::string& sec, const std::string& key, double def) {
    double v = cfg.getDouble(sec, key, def);
    require(v > 0.0 && std::isfinite(v), sec, key, "a finite value > 0");
    return v;
}

static double non_negative(const ConfigLoader& cfg, const std::string& sec, const std::string& key, double def) {
    double v = cfg.getDouble(sec, key, def);
    require(v >= 0.0 && std::isfinite(v), sec, key, "a finite value >= 0");
    return v;
}

// (0, 1]
static double fraction(const ConfigLoader& cfg, const std::string& sec, const std::string& key, double def) {
    double v = cfg.getDouble(sec, key, def);
    require(v > 0.0 && v <= 1.0, sec, key, "in (0, 1]");
    return v;
}

static void load_ledger(const ConfigLoader& cfg, ControlPlaneSettings& s) {
    auto& l = s.capital_limits;
    l.max_per_experiment_low    = non_negative(cfg, "ledger", "max_per_experiment_low", l.max_per_experiment_low);
    l.max_per_experiment_medium = non_negative(cfg, "ledger", "max_per_experiment_medium", l.max_per_experiment_medium);
    l.max_per_experiment_high   = non_negative(cfg, "ledger", "max_per_experiment_high", l.max_per_experiment_high);
    l.max_concurrent_experiments = int_at_least(cfg, "ledger", "max_concurrent_experiments", l.max_concurrent_experiments, 1);
    l.emergency_stop_loss       = fraction(cfg, "ledger", "emergency_stop_loss", l.emergency_stop_loss);

    auto ids = cfg.sections_with_prefix("pool");
    if (ids.empty()) {
        s.pools = default_pools();
        return;
    }
    for (const auto& id : ids) {
        const std::string sec = "pool." + id;
        PoolSpec p;
        p.id = id;
        p.name = cfg.get(sec, "name", id);
        p.purpose = pool_purpose_from_string(cfg.get(sec, "purpose", "research"));
        p.risk_level = risk_level_from_string(cfg.get(sec, "risk_level", "low"));
        p.total_capital = non_negative(cfg, sec, "total_capital", 0.0);
        s.pools.push_back(p);
    }
}

static void load_safety(const ConfigLoader& cfg, SafetyLimits& l) {
    const std::string sec = "safety";
    l.max_daily_loss       = non_negative(cfg, sec, "max_daily_loss", l.max_daily_loss);
    l.max_trades_per_day   = int_at_least(cfg, sec, "max_trades_per_day", l.max_trades_per_day, 0);
    l.error_rate_threshold = fraction(cfg, sec, "error_rate_threshold", l.error_rate_threshold);
    l.error_window         = static_cast<size_t>(int_at_least(cfg, sec, "error_window", static_cast<int>(l.error_window), 1));
    l.error_min_samples    = static_cast<size_t>(int_at_least(cfg, sec, "error_min_samples", static_cast<int>(l.error_min_samples), 1));
    l.latency_p95_ms       = positive(cfg, sec, "latency_p95_ms", l.latency_p95_ms);
    l.latency_window       = static_cast<size_t>(int_at_least(cfg, sec, "latency_window", static_cast<int>(l.latency_window), 1));
    l.latency_min_samples  = static_cast<size_t>(int_at_least(cfg, sec, "latency_min_samples", static_cast<int>(l.latency_min_samples), 1));
    l.breaker_reset_sec    = static_cast<uint64_t>(int_at_least(cfg, sec, "breaker_reset_sec", static_cast<int>(l.breaker_reset_sec), 0));
    l.cooldown_sec         = static_cast<uint64_t>(int_at_least(cfg, sec, "cooldown_sec", static_cast<int>(l.cooldown_sec), 0));
}

static void load_nudge(const ConfigLoader& cfg, ControlPlaneSettings& s) {
    const std::string sec = "nudge";
    auto& p = s.nudge;
    p.confidence_cap        = positive(cfg, sec, "confidence_cap", p.confidence_cap);
    p.effect_size_cap       = positive(cfg, sec, "effect_size_cap", p.effect_size_cap);
    p.vix_threshold         = non_negative(cfg, sec, "vix_threshold", p.vix_threshold);
    p.vix_shrink_per_point  = non_negative(cfg, sec, "vix_shrink_per_point", p.vix_shrink_per_point);
    p.min_regime_shrink     = fraction(cfg, sec, "min_regime_shrink", p.min_regime_shrink);
    p.spread_threshold      = non_negative(cfg, sec, "spread_threshold", p.spread_threshold);
    p.spread_shrink         = fraction(cfg, sec, "spread_shrink", p.spread_shrink);
    p.trend_threshold       = non_negative(cfg, sec, "trend_threshold", p.trend_threshold);
    p.trend_shrink          = fraction(cfg, sec, "trend_shrink", p.trend_shrink);
    p.min_sample_size       = int_at_least(cfg, sec, "min_sample_size", p.min_sample_size, 0);
    p.min_abs_effect        = non_negative(cfg, sec, "min_abs_effect", p.min_abs_effect);
    p.max_abs_orthogonality = non_negative(cfg, sec, "max_abs_orthogonality", p.max_abs_orthogonality);
    p.latency_ema_alpha     = fraction(cfg, sec, "latency_ema_alpha", p.latency_ema_alpha);
    p.latency_threshold_ms  = positive(cfg, sec, "latency_threshold_ms", p.latency_threshold_ms);
    p.max_consecutive_errors = int_at_least(cfg, sec, "max_consecutive_errors", p.max_consecutive_errors, 1);
    p.breaker_reset_sec     = static_cast<uint64_t>(int_at_least(cfg, sec, "breaker_reset_sec", static_cast<int>(p.breaker_reset_sec), 0));

    s.reaction_stats_path = cfg.get(sec, "reaction_stats", "");
}

static void load_pipelines(const ConfigLoader& cfg, ControlPlaneSettings& s) {
    auto ids = cfg.sections_with_prefix("pipeline");
    if (ids.empty()) {
        s.pipelines = default_pipelines();
        return;
    }
    for (const auto& id : ids) {
        const std::string sec = "pipeline." + id;
        PipelineSpec p;
        p.id = id;
        p.name = cfg.get(sec, "name", id);
        p.active = cfg.getBool(sec, "active", true);
        auto& c = p.criteria;
        c.min_generations   = cfg.getInt(sec, "min_generations", c.min_generations);
        c.min_fitness       = cfg.getDouble(sec, "min_fitness", c.min_fitness);
        c.min_win_rate      = cfg.getDouble(sec, "min_win_rate", c.min_win_rate);
        c.max_drawdown      = cfg.getDouble(sec, "max_drawdown", c.max_drawdown);
        c.min_trades        = cfg.getInt(sec, "min_trades", c.min_trades);
        c.consistency_score = cfg.getDouble(sec, "consistency_score", c.consistency_score);
        c.validation_period_days = non_negative(cfg, sec, "validation_period_days", c.validation_period_days);
        s.pipelines.push_back(p);
    }
}

static void load_promotion(const ConfigLoader& cfg, ControlPlaneSettings& s) {
    auto& p = s.promotion;
    auto& cw = p.consistency;
    cw.w_win_rate         = cfg.getDouble("promotion", "consistency_w_win_rate", cw.w_win_rate);
    cw.w_profit_factor    = cfg.getDouble("promotion", "consistency_w_profit_factor", cw.w_profit_factor);
    cw.w_sharpe           = cfg.getDouble("promotion", "consistency_w_sharpe", cw.w_sharpe);
    cw.profit_factor_norm = positive(cfg, "promotion", "profit_factor_norm", cw.profit_factor_norm);
    cw.sharpe_norm        = positive(cfg, "promotion", "sharpe_norm", cw.sharpe_norm);

    auto& sw = p.score;
    sw.w_pnl         = cfg.getDouble("promotion", "score_w_pnl", sw.w_pnl);
    sw.pnl_norm      = positive(cfg, "promotion", "score_pnl_norm", sw.pnl_norm);
    sw.w_win_rate    = cfg.getDouble("promotion", "score_w_win_rate", sw.w_win_rate);
    sw.w_drawdown    = cfg.getDouble("promotion", "score_w_drawdown", sw.w_drawdown);
    sw.drawdown_norm = positive(cfg, "promotion", "score_drawdown_norm", sw.drawdown_norm);

    // Deployment defaults follow the ledger caps unless set explicitly.
    p.deploy_pool   = cfg.get("promotion", "deploy_pool", p.deploy_pool);
    p.deploy_low    = positive(cfg, "promotion", "deploy_low", s.capital_limits.max_per_experiment_low);
    p.deploy_medium = positive(cfg, "promotion", "deploy_medium", s.capital_limits.max_per_experiment_medium);
    p.deploy_high   = positive(cfg, "promotion", "deploy_high", s.capital_limits.max_per_experiment_high);

    s.validation_notional = positive(cfg, "promotion", "validation_notional", s.validation_notional);
}

ControlPlaneSettings load_settings(const ConfigLoader& cfg) {
    ControlPlaneSettings s;

    load_ledger(cfg, s);
    load_safety(cfg, s.safety);
    load_nudge(cfg, s);
    load_pipelines(cfg, s);
    load_promotion(cfg, s);

    s.data_dir = cfg.get("store", "data_dir", s.data_dir);

    auto& n = s.notify;
    n.history = static_cast<size_t>(int_at_least(cfg, "notify", "history", static_cast<int>(n.history), 1));
    n.journal_path = cfg.get("notify", "journal_path", n.journal_path);
    n.webhook_url = cfg.get("notify", "webhook_url", n.webhook_url);
    n.webhook_queue = static_cast<size_t>(int_at_least(cfg, "notify", "webhook_queue", static_cast<int>(n.webhook_queue), 1));
    n.webhook_timeout_sec = int_at_least(cfg, "notify", "webhook_timeout_sec", static_cast<int>(n.webhook_timeout_sec), 1);

    s.http.enabled = cfg.getBool("http", "enabled", s.http.enabled);
    s.http.bind = cfg.get("http", "bind", s.http.bind);
    s.http.port = int_at_least(cfg, "http", "port", s.http.port, 0);
    require(s.http.port <= 65535, "http", "port", "<= 65535");
    s.http.io_timeout_ms = int_at_least(cfg, "http", "io_timeout_ms", s.http.io_timeout_ms, 1);

    s.schedule.promotion_sweep_sec = int_at_least(cfg, "schedule", "promotion_sweep_sec", s.schedule.promotion_sweep_sec, 1);
    s.schedule.safety_tick_ms = int_at_least(cfg, "schedule", "safety_tick_ms", s.schedule.safety_tick_ms, 1);
    s.schedule.nudge_tick_ms = int_at_least(cfg, "schedule", "nudge_tick_ms", s.schedule.nudge_tick_ms, 1);

    std::cout << "[AEGIS] Settings: " << s.pools.size() << " pools, "
              << s.pipelines.size() << " pipelines, data_dir=" << s.data_dir << "\n";
    return s;
}

} // namespace aegis

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "aegis/pipeline/CandidateValidator.hpp"
#include "aegis/store/StateStore.hpp"

namespace aegis {

struct PaperTrade {
    std::string candidate_id;
    double pnl = 0.0;
    uint64_t ts_ns = 0;
};

// ---------------------------------------------------------------------------
// Validates a candidate from the trades it produced while paper trading.
//
// Only trades inside the validation window count. The equity curve starts
// at the validation notional; drawdown is the deepest peak-to-trough fall
// as a fraction of the running peak. Trades are journaled so a restart
// mid-window keeps the evidence.
// ---------------------------------------------------------------------------
class PaperTradeValidator final : public CandidateValidator {
public:
    static constexpr const char* TRADE_LOG = "paper.trades";

    PaperTradeValidator(StateStore& store, double notional);

    void load();

    void record_trade(const std::string& candidate_id, double pnl, uint64_t ts_ns);

    ValidationPerformance evaluate(const StrategyCandidate& candidate,
                                   const PromotionCriteria& criteria,
                                   const ValidationWindow& window) override;

    size_t trade_count(const std::string& candidate_id) const;

private:
    StateStore& store_;
    const double notional_;

    mutable std::mutex mtx_;
    std::map<std::string, std::vector<PaperTrade>> trades_;
};

} // namespace aegis

#include "aegis/pipeline/PaperTradeValidator.hpp"
#include "aegis/infra/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace aegis {

PaperTradeValidator::PaperTradeValidator(StateStore& store, double notional)
    : store_(store), notional_(notional) {
    if (!(notional_ > 0.0)) throw InvalidArgument("validation notional must be positive");
}

void PaperTradeValidator::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    trades_.clear();

    size_t n = 0;
    for (const auto& rec : store_.read_log(TRADE_LOG)) {
        PaperTrade t;
        t.candidate_id = rec.at("candidateId").get<std::string>();
        t.pnl = rec.at("pnl").get<double>();
        t.ts_ns = rec.at("ts").get<uint64_t>();
        trades_[t.candidate_id].push_back(t);
        n++;
    }
    std::cout << "[PIPELINE] Restored " << n << " paper trades for "
              << trades_.size() << " candidates\n";
}

void PaperTradeValidator::record_trade(const std::string& candidate_id, double pnl, uint64_t ts_ns) {
    if (candidate_id.empty()) throw InvalidArgument("candidate id is empty");
    if (!std::isfinite(pnl)) throw InvalidArgument("trade P&L must be finite");

    std::lock_guard<std::mutex> lock(mtx_);
    store_.append(TRADE_LOG, json{{"candidateId", candidate_id}, {"pnl", pnl}, {"ts", ts_ns}});
    trades_[candidate_id].push_back({candidate_id, pnl, ts_ns});
}

ValidationPerformance PaperTradeValidator::evaluate(const StrategyCandidate& candidate,
                                                    const PromotionCriteria&,
                                                    const ValidationWindow& window) {
    std::vector<PaperTrade> in_window;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = trades_.find(candidate.id);
        if (it != trades_.end()) {
            for (const auto& t : it->second) {
                if (t.ts_ns >= window.start_ns && t.ts_ns <= window.end_ns) in_window.push_back(t);
            }
        }
    }

    std::sort(in_window.begin(), in_window.end(),
              [](const PaperTrade& a, const PaperTrade& b) { return a.ts_ns < b.ts_ns; });

    ValidationPerformance perf;
    double equity = notional_;
    double peak = notional_;
    int wins = 0;

    for (const auto& t : in_window) {
        perf.pnl += t.pnl;
        if (t.pnl > 0.0) wins++;

        equity += t.pnl;
        peak = std::max(peak, equity);
        if (peak > 0.0) perf.drawdown = std::max(perf.drawdown, (peak - equity) / peak);
    }

    perf.trades = static_cast<int>(in_window.size());
    perf.win_rate = perf.trades > 0 ? static_cast<double>(wins) / perf.trades : 0.0;
    return perf;
}

size_t PaperTradeValidator::trade_count(const std::string& candidate_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = trades_.find(candidate_id);
    return it == trades_.end() ? 0 : it->second.size();
}

} // namespace aegis

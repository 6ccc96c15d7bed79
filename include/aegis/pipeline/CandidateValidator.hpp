#pragma once

#include <cstdint>

#include "aegis/pipeline/CandidateTypes.hpp"

namespace aegis {

struct ValidationWindow {
    uint64_t start_ns = 0;
    uint64_t end_ns = 0;
    double period_days = 0.0;
};

// Evaluation backend for promotion. May throw; the pipeline treats a throw
// as "no verdict" and leaves the candidate pending.
class CandidateValidator {
public:
    virtual ~CandidateValidator() = default;

    virtual ValidationPerformance evaluate(const StrategyCandidate& candidate,
                                           const PromotionCriteria& criteria,
                                           const ValidationWindow& window) = 0;
};

} // namespace aegis

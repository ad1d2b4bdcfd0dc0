#include "odds_engine.hpp"

#include "errors.hpp"

#include <limits>

namespace cd {

namespace {

void requireEdgeBelowOne(const Amount& edge) {
    if (edge >= kScale) {
        throw EngineError(ErrorCode::InvalidHouseEdge, "house edge must be below 100%");
    }
}

void requireNonZeroOdds(const Amount& target) {
    if (target == 0) {
        throw EngineError(ErrorCode::DivisionByZeroOdds, "target odds of zero");
    }
}

} // namespace

Amount adjustedOdds(const Amount& target, const Amount& edge) {
    requireEdgeBelowOne(edge);
    return mulDiv(target, kScale - edge, kScale);
}

Amount winThreshold(const Amount& target, const Amount& edge) {
    Amount adjusted = adjustedOdds(target, edge);
    if (adjusted >= kScale) {
        return std::numeric_limits<Amount>::max();
    }
    return mulDiv(adjusted, std::numeric_limits<Amount>::max(), kScale);
}

bool isWinner(const Amount& rawOutcome, const Amount& target, const Amount& edge) {
    return rawOutcome < winThreshold(target, edge);
}

Amount payoutFor(const Amount& amount, const Amount& target) {
    requireNonZeroOdds(target);
    return mulDiv(amount, kScale, target);
}

Amount payoutMultiplier(const Amount& target) {
    requireNonZeroOdds(target);
    return mulDiv(kScale, kScale, target);
}

} // namespace cd

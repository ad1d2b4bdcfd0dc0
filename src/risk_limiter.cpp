#include "risk_limiter.hpp"

#include "errors.hpp"
#include "odds_engine.hpp"

namespace cd {

Amount maxBet(const Amount& poolBalance, const Amount& target, const Amount& edge) {
    if (target == 0) {
        throw EngineError(ErrorCode::DivisionByZeroOdds, "risk limit requested for zero odds");
    }
    if (poolBalance == 0) {
        return 0;
    }

    Amount multiplier = payoutMultiplier(target);
    Amount denominator = kMinRiskDenominator;
    if (multiplier > kScale && multiplier - kScale > kMinRiskDenominator) {
        denominator = multiplier - kScale;
    }
    return mulDiv(poolBalance, edge, denominator);
}

} // namespace cd

#pragma once

#include "fixed_point.hpp"

namespace cd {

// Floor for (multiplier - 1) as target odds approach 1; equivalent to a 1.001x multiplier.
inline const Amount kMinRiskDenominator = kScale / 1000;

// Kelly bound on stake size: poolBalance * edge / (multiplier(target) - 1).
// Caps the profit a single winning bet can take out of the pool at edge * poolBalance.
Amount maxBet(const Amount& poolBalance, const Amount& target, const Amount& edge);

} // namespace cd

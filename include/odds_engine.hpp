#pragma once

#include "fixed_point.hpp"

namespace cd {

// All odds and edges are 1e18-scaled fractions of the unit interval.

// target * (1 - edge): the player's real win probability after the house edge.
Amount adjustedOdds(const Amount& target, const Amount& edge);

// adjustedOdds mapped onto the 2^256 outcome range of the randomness hash.
Amount winThreshold(const Amount& target, const Amount& edge);

// rawOutcome is uniform over [0, 2^256). Zero always wins, the maximum never does.
bool isWinner(const Amount& rawOutcome, const Amount& target, const Amount& edge);

// amount / target, the gross payout of a winning bet (stake included).
Amount payoutFor(const Amount& amount, const Amount& target);

// 1 / target, 1e18-scaled.
Amount payoutMultiplier(const Amount& target);

} // namespace cd

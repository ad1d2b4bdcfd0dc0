#pragma once

#include "asset_ledger.hpp"
#include "fixed_point.hpp"
#include "randomness_source.hpp"

#include <cstdint>

namespace cd {

struct EngineConfig {
    Amount houseEdge = fixedFromPercent(1);
    // Hard ceiling for setHouseEdge; values above it are rejected.
    Amount maxHouseEdge = fixedFromPercent(10);
    Amount minBet = 1;
    Amount minOdds = fixedFromPercent(1);
    Amount maxOdds = fixedFromPercent(95);
    // Positions a finalized block hash stays queryable.
    std::uint64_t hashWindow = kDefaultHashWindow;
    // Positions after origin before a pending bet may be swept. Must exceed hashWindow.
    std::uint64_t expiryHorizon = 300;
    AccountId operatorId = "operator";
    AccountId custodyAccount = "clawdice:custody";
    AccountId poolAccount = "clawdice:pool";

    // Throws EngineError(InvalidConfig).
    void validate() const;
};

// Overrides fields from CD_* environment variables, then validates.
EngineConfig loadConfigFromEnvironment(EngineConfig base = {});

} // namespace cd

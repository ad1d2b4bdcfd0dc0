#pragma once

#include "asset_ledger.hpp"
#include "bet_ledger.hpp"
#include "engine_config.hpp"
#include "entry_lock.hpp"
#include "event_log.hpp"
#include "liquidity_pool.hpp"
#include "randomness_source.hpp"
#include "sweep_scheduler.hpp"

#include <cstddef>

namespace cd {

// One wagering engine: a bet ledger over a shared liquidity pool, resolved
// against a randomness source, with collateral held by an external asset ledger.
// All mutating calls share one EntryLock; event listeners run after it is released.
class Clawdice {
public:
    Clawdice(const EngineConfig& config, RandomnessSource& randomness, AssetLedger& assets);

    Clawdice(const Clawdice&) = delete;
    Clawdice& operator=(const Clawdice&) = delete;

    BetId placeBet(const AccountId& player, const Amount& amount, const Amount& targetOdds) {
        return ledger_.placeBet(player, amount, targetOdds);
    }
    ClaimReceipt claim(const AccountId& player, BetId betId) { return ledger_.claim(player, betId); }
    std::size_t sweepExpired(std::size_t maxCount) { return sweeper_.sweepExpired(maxCount); }

    Amount getMaxBet(const Amount& targetOdds) const { return ledger_.getMaxBet(targetOdds); }
    BetResult computeResult(BetId betId) const { return ledger_.computeResult(betId); }
    Bet getBet(BetId betId) const { return ledger_.getBet(betId); }
    Amount houseEdge() const { return ledger_.houseEdge(); }
    void setHouseEdge(const AccountId& caller, const Amount& newEdge) {
        ledger_.setHouseEdge(caller, newEdge);
    }
    BetId nextBetId() const { return ledger_.nextBetId(); }
    std::size_t pendingBetCount() const { return ledger_.pendingBetCount(); }

    Amount stake(const AccountId& provider, const Amount& assets) {
        return pool_.stake(provider, assets);
    }
    Amount unstake(const AccountId& provider, const Amount& shares) {
        return pool_.unstake(provider, shares);
    }

    const EngineConfig& config() const { return config_; }
    LiquidityPool& pool() { return pool_; }
    const LiquidityPool& pool() const { return pool_; }
    BetLedger& ledger() { return ledger_; }
    const BetLedger& ledger() const { return ledger_; }
    SweepScheduler& sweeper() { return sweeper_; }
    EventLog& events() { return events_; }
    const EventLog& events() const { return events_; }

private:
    EngineConfig config_;
    EntryLock lock_;
    EventLog events_;
    LiquidityPool pool_;
    BetLedger ledger_;
    SweepScheduler sweeper_;
};

} // namespace cd

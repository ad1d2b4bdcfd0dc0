#pragma once

#include "asset_ledger.hpp"
#include "engine_config.hpp"
#include "entry_lock.hpp"
#include "event_log.hpp"
#include "fixed_point.hpp"
#include "liquidity_pool.hpp"
#include "randomness_source.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>

namespace cd {

using BetId = std::uint64_t;

constexpr BetId kFirstBetId = 1;

enum class BetStatus : std::uint8_t { Pending, Won, Lost, Claimed, Expired };

const char* betStatusName(BetStatus status);

struct Bet {
    AccountId owner;
    Amount amount;
    Amount targetOdds;
    // House edge in force at placement; resolution always uses this value.
    Amount houseEdge;
    std::uint64_t originBlock = 0;
    BetStatus status = BetStatus::Pending;
};

struct BetResult {
    bool won = false;
    Amount payout;
};

struct ClaimReceipt {
    BetId betId = 0;
    bool won = false;
    Amount payout;
    BetStatus status = BetStatus::Pending;
};

// Owns every bet record. Records are never removed; terminal ones stay for
// idempotent rejection and audit.
//
// Queries return copies taken under the engine's EntryLock, so they are safe
// from any thread and stay valid after later placements.
class BetLedger {
public:
    BetLedger(const EngineConfig& config,
              RandomnessSource& randomness,
              LiquidityPool& pool,
              AssetLedger& assets,
              EntryLock& lock,
              EventLog& events);

    BetLedger(const BetLedger&) = delete;
    BetLedger& operator=(const BetLedger&) = delete;

    BetId placeBet(const AccountId& owner, const Amount& amount, const Amount& targetOdds);
    BetResult computeResult(BetId betId) const;
    ClaimReceipt claim(const AccountId& caller, BetId betId);

    Bet getBet(BetId betId) const;
    Amount getMaxBet(const Amount& targetOdds) const;
    Amount houseEdge() const;
    void setHouseEdge(const AccountId& caller, const Amount& newEdge);

    BetId nextBetId() const;
    std::size_t pendingBetCount() const;
    const EngineConfig& config() const { return config_; }

    // Sweep support. Pending ids are kept in id order, which is also origin
    // order, so the oldest pending bet is always the next expiry candidate.
    std::optional<BetId> oldestPending() const;
    std::set<BetId> pendingIds() const;
    bool isSweepable(BetId betId) const;
    void expire(const EntryLock::Scope& scope, BetId betId);

private:
    Bet& record(BetId betId);
    const Bet& record(BetId betId) const;
    ClaimReceipt settle(const AccountId& caller, BetId betId);
    BetResult resolve(BetId betId, const Bet& bet) const;
    void validatePlacement(const Amount& amount, const Amount& targetOdds) const;

    EngineConfig config_;
    RandomnessSource& randomness_;
    LiquidityPool& pool_;
    AssetLedger& assets_;
    EntryLock& lock_;
    EventLog& events_;

    Amount houseEdge_;
    // Deque keeps records in place as bets are appended.
    std::deque<Bet> bets_;
    std::set<BetId> pending_;
};

} // namespace cd

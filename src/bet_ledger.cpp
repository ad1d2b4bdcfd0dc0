#include "bet_ledger.hpp"

#include "errors.hpp"
#include "hashing.hpp"
#include "odds_engine.hpp"
#include "risk_limiter.hpp"

#include <sstream>

namespace cd {

namespace {

std::string betLabel(BetId betId) {
    std::ostringstream oss;
    oss << "bet #" << betId;
    return oss.str();
}

} // namespace

const char* betStatusName(BetStatus status) {
    switch (status) {
    case BetStatus::Pending:
        return "Pending";
    case BetStatus::Won:
        return "Won";
    case BetStatus::Lost:
        return "Lost";
    case BetStatus::Claimed:
        return "Claimed";
    case BetStatus::Expired:
        return "Expired";
    }
    return "Unknown";
}

BetLedger::BetLedger(const EngineConfig& config,
                     RandomnessSource& randomness,
                     LiquidityPool& pool,
                     AssetLedger& assets,
                     EntryLock& lock,
                     EventLog& events)
    : config_(config)
    , randomness_(randomness)
    , pool_(pool)
    , assets_(assets)
    , lock_(lock)
    , events_(events)
    , houseEdge_(config.houseEdge) {
    config_.validate();
    if (config_.expiryHorizon <= randomness_.historyWindow()) {
        std::ostringstream oss;
        oss << "expiryHorizon (" << config_.expiryHorizon
            << ") must exceed the randomness history window (" << randomness_.historyWindow()
            << ")";
        throw EngineError(ErrorCode::InvalidConfig, oss.str());
    }
    if (config_.custodyAccount == pool_.account()) {
        throw EngineError(ErrorCode::InvalidConfig, "custody account collides with pool account");
    }
}

Bet& BetLedger::record(BetId betId) {
    if (betId < kFirstBetId || betId - kFirstBetId >= bets_.size()) {
        throw EngineError(ErrorCode::UnknownBet, betLabel(betId) + " does not exist");
    }
    return bets_[static_cast<std::size_t>(betId - kFirstBetId)];
}

const Bet& BetLedger::record(BetId betId) const {
    if (betId < kFirstBetId || betId - kFirstBetId >= bets_.size()) {
        throw EngineError(ErrorCode::UnknownBet, betLabel(betId) + " does not exist");
    }
    return bets_[static_cast<std::size_t>(betId - kFirstBetId)];
}

Bet BetLedger::getBet(BetId betId) const {
    auto guard = lock_.read();
    return record(betId);
}

Amount BetLedger::getMaxBet(const Amount& targetOdds) const {
    auto guard = lock_.read();
    return maxBet(pool_.totalAssets(), targetOdds, houseEdge_);
}

Amount BetLedger::houseEdge() const {
    auto guard = lock_.read();
    return houseEdge_;
}

BetId BetLedger::nextBetId() const {
    auto guard = lock_.read();
    return kFirstBetId + bets_.size();
}

std::size_t BetLedger::pendingBetCount() const {
    auto guard = lock_.read();
    return pending_.size();
}

std::set<BetId> BetLedger::pendingIds() const {
    auto guard = lock_.read();
    return pending_;
}

void BetLedger::validatePlacement(const Amount& amount, const Amount& targetOdds) const {
    if (amount == 0 || amount < config_.minBet) {
        std::ostringstream oss;
        oss << "amount " << amount << " is below the minimum bet " << config_.minBet;
        throw EngineError(ErrorCode::InvalidAmount, oss.str());
    }
    if (targetOdds < config_.minOdds || targetOdds > config_.maxOdds) {
        std::ostringstream oss;
        oss << "target odds " << formatFixed(targetOdds) << " outside ["
            << formatFixed(config_.minOdds) << ", " << formatFixed(config_.maxOdds) << "]";
        throw EngineError(ErrorCode::InvalidOdds, oss.str());
    }
    Amount ceiling = getMaxBet(targetOdds);
    if (amount > ceiling) {
        std::ostringstream oss;
        oss << "amount " << amount << " exceeds max bet " << ceiling << " at odds "
            << formatFixed(targetOdds);
        throw EngineError(ErrorCode::ExceedsRiskLimit, oss.str());
    }
}

BetId BetLedger::placeBet(const AccountId& owner, const Amount& amount, const Amount& targetOdds) {
    BetId betId = 0;
    {
        auto scope = lock_.enter("placeBet");
        if (owner.empty()) {
            throw EngineError(ErrorCode::Unauthorized, "bets need an owner");
        }
        validatePlacement(amount, targetOdds);

        // Stake is held in custody, outside the pool, until settlement.
        assets_.transfer(owner, config_.custodyAccount, amount);

        betId = nextBetId();
        Bet bet;
        bet.owner = owner;
        bet.amount = amount;
        bet.targetOdds = targetOdds;
        bet.houseEdge = houseEdge_;
        bet.originBlock = randomness_.currentPosition();
        bet.status = BetStatus::Pending;
        bets_.push_back(bet);
        pending_.insert(betId);

        events_.append(BetPlaced{ betId, owner, amount, targetOdds, bet.originBlock });
    }
    events_.deliverPending();
    return betId;
}

BetResult BetLedger::resolve(BetId betId, const Bet& bet) const {
    HashLookup lookup = randomness_.resolveAfter(bet.originBlock);
    switch (lookup.state) {
    case Resolvability::NotYetAvailable:
        throw EngineError(ErrorCode::TooEarly,
                          betLabel(betId) + " resolves once the block after its origin is final");
    case Resolvability::NoLongerAvailable:
        throw EngineError(ErrorCode::ResultExpired,
                          betLabel(betId) + " outcome hash has left the history window");
    case Resolvability::Available:
        break;
    }

    Amount rawOutcome = hashToAmount(betOutcomeSeed(betId, lookup.hash));
    BetResult result;
    result.won = isWinner(rawOutcome, bet.targetOdds, bet.houseEdge);
    result.payout = result.won ? payoutFor(bet.amount, bet.targetOdds) : Amount(0);
    return result;
}

BetResult BetLedger::computeResult(BetId betId) const {
    auto guard = lock_.read();
    return resolve(betId, record(betId));
}

ClaimReceipt BetLedger::claim(const AccountId& caller, BetId betId) {
    ClaimReceipt receipt = settle(caller, betId);
    events_.deliverPending();
    return receipt;
}

ClaimReceipt BetLedger::settle(const AccountId& caller, BetId betId) {
    auto scope = lock_.enter("claim");
    Bet& bet = record(betId);
    if (caller != bet.owner) {
        throw EngineError(ErrorCode::Unauthorized, caller + " does not own " + betLabel(betId));
    }
    if (bet.status != BetStatus::Pending) {
        throw EngineError(ErrorCode::AlreadySettled,
                          betLabel(betId) + " is already " + betStatusName(bet.status));
    }

    BetResult result = resolve(betId, bet);
    ClaimReceipt receipt{ betId, result.won, result.payout, BetStatus::Pending };

    if (result.won) {
        // The pool funds the winnings; the stake comes back out of custody.
        Amount winnings = result.payout - bet.amount;
        if (!pool_.canCover(winnings)) {
            std::ostringstream oss;
            oss << betLabel(betId) << " won " << result.payout << " but the pool holds "
                << pool_.totalAssets();
            throw EngineError(ErrorCode::InsufficientLiquidity, oss.str());
        }
        pool_.debitPayout(scope, config_.custodyAccount, winnings);
        bet.status = BetStatus::Won;
        try {
            assets_.transfer(config_.custodyAccount, bet.owner, result.payout);
        } catch (...) {
            bet.status = BetStatus::Pending;
            pool_.refundPayout(scope, config_.custodyAccount, winnings);
            throw;
        }
        bet.status = BetStatus::Claimed;
    } else {
        pool_.creditLoss(scope, config_.custodyAccount, bet.amount);
        bet.status = BetStatus::Lost;
    }
    pending_.erase(betId);
    receipt.status = bet.status;

    events_.append(BetResolved{ betId, result.won, result.payout });
    if (result.won) {
        events_.append(BetClaimed{ betId, bet.owner, result.payout });
    }
    return receipt;
}

void BetLedger::setHouseEdge(const AccountId& caller, const Amount& newEdge) {
    {
        auto scope = lock_.enter("setHouseEdge");
        if (caller != config_.operatorId) {
            throw EngineError(ErrorCode::Unauthorized, caller + " may not change the house edge");
        }
        if (newEdge > config_.maxHouseEdge) {
            std::ostringstream oss;
            oss << "house edge " << formatFixed(newEdge) << " exceeds ceiling "
                << formatFixed(config_.maxHouseEdge);
            throw EngineError(ErrorCode::InvalidHouseEdge, oss.str());
        }
        Amount oldEdge = houseEdge_;
        houseEdge_ = newEdge;
        events_.append(HouseEdgeChanged{ oldEdge, newEdge });
    }
    events_.deliverPending();
}

std::optional<BetId> BetLedger::oldestPending() const {
    auto guard = lock_.read();
    if (pending_.empty()) {
        return std::nullopt;
    }
    return *pending_.begin();
}

bool BetLedger::isSweepable(BetId betId) const {
    auto guard = lock_.read();
    const Bet& bet = record(betId);
    if (bet.status != BetStatus::Pending) {
        return false;
    }
    std::uint64_t now = randomness_.currentPosition();
    return now > bet.originBlock && now - bet.originBlock > config_.expiryHorizon;
}

void BetLedger::expire(const EntryLock::Scope& scope, BetId betId) {
    lock_.requireScope(scope, "expire");
    Bet& bet = record(betId);
    if (bet.status != BetStatus::Pending) {
        throw EngineError(ErrorCode::AlreadySettled,
                          betLabel(betId) + " is already " + betStatusName(bet.status));
    }
    if (!isSweepable(betId)) {
        throw EngineError(ErrorCode::TooEarly, betLabel(betId) + " has not passed its expiry horizon");
    }

    pool_.creditLoss(scope, config_.custodyAccount, bet.amount);
    bet.status = BetStatus::Expired;
    pending_.erase(betId);
    events_.append(BetExpired{ betId });
}

} // namespace cd

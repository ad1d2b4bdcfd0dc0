#pragma once

#include "clawdice.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "odds_engine.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace cd::test {

inline std::string& suiteName() {
    static std::string name = "test";
    return name;
}

[[noreturn]] inline void fail(const std::string& msg) {
    std::cerr << suiteName() << " failure: " << msg << std::endl;
    std::exit(1);
}

inline void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

template <typename Fn>
void expectError(ErrorCode code, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const EngineError& ex) {
        if (ex.code() != code) {
            fail(what + ": expected " + errorCodeName(code) + ", got " + ex.what());
        }
        return;
    }
    fail(what + ": expected " + errorCodeName(code) + " but the call succeeded");
}

// Searches for a block hash that makes betId resolve to the wanted outcome.
inline Hash256 outcomeHash(BetId betId, const Amount& odds, const Amount& edge, bool wantWin) {
    for (int i = 0; i < 100'000; ++i) {
        Hash256 candidate = sha256("outcome-candidate:" + std::to_string(i));
        Amount raw = hashToAmount(betOutcomeSeed(betId, candidate));
        if (isWinner(raw, odds, edge) == wantWin) {
            return candidate;
        }
    }
    fail("no block hash found for the requested outcome");
}

// Engine over an in-memory chain starting at position 100 and an in-memory asset ledger.
struct Table {
    explicit Table(EngineConfig config = {}, std::uint64_t window = kDefaultHashWindow)
        : cfg(config)
        , chain(window, 100)
        , assets()
        , house(cfg, chain, assets) {}

    void seedPool(const Amount& amount, const AccountId& provider = "lp") {
        assets.mint(provider, amount);
        house.stake(provider, amount);
    }

    BetId fundAndBet(const AccountId& player, const Amount& amount, const Amount& odds) {
        assets.mint(player, amount);
        return house.placeBet(player, amount, odds);
    }

    // Seals the bet's origin block and the block after it so the bet resolves as requested.
    void resolveAs(BetId betId, bool wantWin) {
        Bet bet = house.getBet(betId);
        if (chain.currentPosition() != bet.originBlock) {
            fail("resolveAs must run while the bet's origin block is still open");
        }
        chain.sealBlock(sha256("origin-block"));
        chain.sealBlock(outcomeHash(betId, bet.targetOdds, bet.houseEdge, wantWin));
    }

    EngineConfig cfg;
    BlockHashHistory chain;
    InMemoryAssetLedger assets;
    Clawdice house;
};

inline Amount odds(const char* decimal) {
    return parseFixed(decimal);
}

} // namespace cd::test

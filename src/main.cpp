#include "clawdice.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "odds_engine.hpp"

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

using namespace cd;

namespace {

constexpr const char* kPlayer = "player";
constexpr const char* kHouse = "house";

void printOddsTable(const Clawdice& house) {
    std::cout << "Odds band " << formatFixed(house.config().minOdds * 100, 0) << "% - "
              << formatFixed(house.config().maxOdds * 100, 0) << "%, house edge "
              << formatFixed(house.houseEdge() * 100, 2) << "%\n";
    for (std::uint64_t pct : { 10, 25, 50, 75 }) {
        Amount target = fixedFromPercent(pct);
        std::cout << "  " << pct << "%  pays " << formatFixed(payoutMultiplier(target), 2)
                  << "x  max bet " << house.getMaxBet(target).str() << "\n";
    }
}

void printReveal(const Clawdice& house, const BlockHashHistory& chain, BetId betId,
                 const ClaimReceipt& receipt) {
    Bet bet = house.getBet(betId);
    Hash256 outcomeBlock = chain.resolveAfter(bet.originBlock).hash;

    if (receipt.won) {
        std::cout << "Bet #" << betId << " won " << receipt.payout.str() << ".\n";
    } else {
        std::cout << "Bet #" << betId << " lost " << bet.amount.str() << ".\n";
    }

    std::cout << "\n=== PROVABLY FAIR REVEAL ===\n";
    std::cout << "Block " << bet.originBlock + 1 << " hash: " << toHex(outcomeBlock) << "\n";
    std::cout << "Outcome seed: " << toHex(betOutcomeSeed(betId, outcomeBlock)) << "\n";
    std::cout << "Threshold: " << winThreshold(bet.targetOdds, bet.houseEdge).str() << "\n";
    std::cout << "Verify with: audit_bet " << betId << " " << toHex(outcomeBlock) << " "
              << formatFixed(bet.targetOdds, 18) << " " << formatFixed(bet.houseEdge, 18) << " "
              << bet.amount.str() << "\n";
    std::cout << "Event log root: " << toHex(house.events().merkleRoot()) << "\n";
}

// Returns true once the bet needs no further claim attempts.
bool trySettle(Clawdice& house, const BlockHashHistory& chain, BetId betId) {
    ClaimReceipt receipt;
    try {
        receipt = house.claim(kPlayer, betId);
    } catch (const EngineError& ex) {
        switch (ex.code()) {
        case ErrorCode::AlreadySettled:
            return true;
        case ErrorCode::ResultExpired:
            std::cout << "Bet #" << betId << " can no longer be claimed; "
                      << "the next sweep returns its stake to the pool.\n";
            return true;
        default:
            std::cout << "Claim for bet #" << betId << " failed: " << ex.what()
                      << ". It will be retried next round.\n";
            return false;
        }
    }
    printReveal(house, chain, betId, receipt);
    return true;
}

} // namespace

int main() {
    EngineConfig cfg;
    try {
        cfg = loadConfigFromEnvironment();
    } catch (const EngineError& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    BlockHashHistory chain(cfg.hashWindow);
    InMemoryAssetLedger assets;
    Clawdice house(cfg, chain, assets);

    assets.mint(kHouse, 1'000'000);
    house.stake(kHouse, 1'000'000);
    assets.mint(kPlayer, 1000);

    std::cout << "Welcome to Clawdice.\n";
    std::cout << "Each roll resolves against the hash of the block after the one it was placed in.\n";
    std::cout << "(set CD_HOUSE_EDGE, CD_MIN_ODDS, CD_MAX_ODDS ... to override the table)\n";

    std::vector<BetId> unsettled;
    while (true) {
        for (auto it = unsettled.begin(); it != unsettled.end();) {
            it = trySettle(house, chain, *it) ? unsettled.erase(it) : it + 1;
        }

        Amount bankroll = assets.balanceOf(kPlayer);
        if (bankroll == 0) {
            std::cout << "\nYou are out of funds. Session over.\n";
            break;
        }

        std::cout << "\n----------------------------------------\n";
        std::cout << "Current bankroll: " << bankroll.str() << "\n";
        printOddsTable(house);

        std::cout << "\nWin chance in percent (or 0 to quit): ";
        std::uint64_t pct = 0;
        if (!(std::cin >> pct)) {
            return 0;
        }
        if (pct == 0) {
            std::cout << "Exiting.\n";
            break;
        }

        std::cout << "Stake amount: ";
        std::string stakeText;
        if (!(std::cin >> stakeText)) {
            return 0;
        }

        BetId betId = 0;
        try {
            betId = house.placeBet(kPlayer, parseAmount(stakeText), fixedFromPercent(pct));
        } catch (const EngineError& ex) {
            std::cout << "Bet rejected: " << ex.what() << "\n";
            continue;
        } catch (const std::exception& ex) {
            std::cout << "Invalid stake: " << ex.what() << "\n";
            continue;
        }

        std::cout << "Bet #" << betId << " placed in block " << house.getBet(betId).originBlock << "\n";
        chain.sealBlock();
        chain.sealBlock();

        if (!trySettle(house, chain, betId)) {
            unsettled.push_back(betId);
        }
    }

    if (!unsettled.empty()) {
        std::cout << "\n" << unsettled.size()
                  << " bet(s) left unclaimed; they expire back to the pool once past the horizon.\n";
    }

    std::cout << "\nFinal bankroll: " << assets.balanceOf(kPlayer).str() << "\n";
    std::cout << "House pool: " << house.pool().totalAssets().str() << "\n";
    std::cout << "Thanks for playing.\n";
    return 0;
}

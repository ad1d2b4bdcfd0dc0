#include "fixed_point.hpp"
#include "hashing.hpp"
#include "odds_engine.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: audit_bet <betId> <nextBlockHashHex> <targetOdds> <houseEdge> <amount>\n"
                  << "  nextBlockHashHex is the hash of the block after the bet's origin block.\n";
        return 1;
    }

    std::uint64_t betId = 0;
    cd::Hash256 blockHash{};
    cd::Amount targetOdds;
    cd::Amount houseEdge;
    cd::Amount amount;
    try {
        betId = std::stoull(argv[1]);
        blockHash = cd::hashFromHex(argv[2]);
        targetOdds = cd::parseFixed(argv[3]);
        houseEdge = cd::parseFixed(argv[4]);
        amount = cd::parseAmount(argv[5]);
    } catch (const std::exception& ex) {
        std::cerr << "Invalid arguments: " << ex.what() << '\n';
        return 1;
    }

    try {
        cd::Hash256 seed = cd::betOutcomeSeed(betId, blockHash);
        cd::Amount rawOutcome = cd::hashToAmount(seed);
        cd::Amount threshold = cd::winThreshold(targetOdds, houseEdge);
        bool won = rawOutcome < threshold;

        std::cout << "Bet #" << betId << '\n';
        std::cout << "  Outcome seed:  " << cd::toHex(seed) << '\n';
        std::cout << "  Raw outcome:   " << rawOutcome << '\n';
        std::cout << "  Threshold:     " << threshold << '\n';
        std::cout << "  Real odds:     " << cd::formatFixed(cd::adjustedOdds(targetOdds, houseEdge), 6)
                  << '\n';
        std::cout << "  Won:           " << (won ? "yes" : "no") << '\n';
        std::cout << "  Payout:        " << (won ? cd::payoutFor(amount, targetOdds) : cd::Amount(0))
                  << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Audit failed: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}

#include "clawdice.hpp"
#include "errors.hpp"
#include "odds_engine.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

constexpr const char* kProvider = "lp";
constexpr const char* kPlayer = "player";

} // namespace

int main(int argc, char* argv[]) {
    std::uint64_t rounds = 10'000;
    cd::Amount odds = cd::parseFixed("0.5");
    cd::Amount bankroll = cd::parseAmount("1000000");
    try {
        if (argc > 1) {
            rounds = std::stoull(argv[1]);
        }
        if (argc > 2) {
            odds = cd::parseFixed(argv[2]);
        }
        if (argc > 3) {
            bankroll = cd::parseAmount(argv[3]);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Usage: simulate_house [rounds] [odds] [poolBankroll]\n"
                  << "Invalid arguments: " << ex.what() << '\n';
        return 1;
    }

    try {
        cd::EngineConfig cfg = cd::loadConfigFromEnvironment();
        cd::BlockHashHistory chain(cfg.hashWindow);
        cd::InMemoryAssetLedger assets;
        cd::Clawdice house(cfg, chain, assets);

        assets.mint(kProvider, bankroll);
        house.stake(kProvider, bankroll);

        std::uint64_t wins = 0;
        std::uint64_t settled = 0;
        std::uint64_t skipped = 0;
        for (std::uint64_t round = 0; round < rounds; ++round) {
            cd::Amount stake = house.getMaxBet(odds);
            if (stake < cfg.minBet) {
                ++skipped;
                chain.sealBlock();
                continue;
            }
            assets.mint(kPlayer, stake);
            cd::BetId id = house.placeBet(kPlayer, stake, odds);
            chain.sealBlocks(2);
            try {
                auto receipt = house.claim(kPlayer, id);
                ++settled;
                if (receipt.won) {
                    ++wins;
                }
            } catch (const cd::EngineError& ex) {
                if (ex.code() != cd::ErrorCode::InsufficientLiquidity) {
                    throw;
                }
                std::cerr << "Round " << round << ": " << ex.what() << '\n';
            }
        }

        double expected = cd::toDouble(cd::adjustedOdds(odds, house.houseEdge()));
        double observed = settled == 0 ? 0.0 : static_cast<double>(wins) / static_cast<double>(settled);

        std::cout << "=== HOUSE SIMULATION ===\n";
        std::cout << "Rounds:            " << rounds << " (" << skipped << " skipped at zero limit)\n";
        std::cout << "Target odds:       " << cd::formatFixed(odds, 4) << '\n';
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "Expected win rate: " << expected << '\n';
        std::cout << "Observed win rate: " << observed << '\n';
        std::cout << "Pool assets:       " << house.pool().totalAssets().str() << " (started "
                  << bankroll.str() << ")\n";
        std::cout << "Share price:       " << cd::formatFixed(house.pool().sharePrice(), 6) << '\n';
        std::cout << "Events logged:     " << house.events().size() << '\n';
        std::cout << "Event log root:    " << cd::toHex(house.events().merkleRoot()) << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Simulation failed: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}

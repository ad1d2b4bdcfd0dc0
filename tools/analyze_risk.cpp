#include "engine_config.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "odds_engine.hpp"
#include "risk_limiter.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: analyze_risk <poolBalance> [houseEdge, e.g. 0.01] [odds...]\n";
        return 1;
    }

    cd::Amount pool;
    cd::EngineConfig cfg;
    std::vector<cd::Amount> oddsLevels;
    try {
        cfg = cd::loadConfigFromEnvironment();
        pool = cd::parseAmount(argv[1]);
        if (argc > 2) {
            cfg.houseEdge = cd::parseFixed(argv[2]);
            cfg.validate();
        }
        for (int i = 3; i < argc; ++i) {
            oddsLevels.push_back(cd::parseFixed(argv[i]));
        }
    } catch (const std::exception& ex) {
        std::cerr << "Invalid arguments: " << ex.what() << '\n';
        return 1;
    }
    if (oddsLevels.empty()) {
        oddsLevels = { cd::parseFixed("0.5"), cd::parseFixed("0.25"), cd::parseFixed("0.1") };
    }

    std::cout << "=== HOUSE EDGE ANALYSIS ===\n";
    std::cout << "Pool balance: " << pool << "\n";
    std::cout << "House edge:   " << cd::formatFixed(cfg.houseEdge * 100, 2) << "%\n";
    std::cout << "Odds band:    [" << cd::formatFixed(cfg.minOdds) << ", "
              << cd::formatFixed(cfg.maxOdds) << "]\n\n";

    std::cout << std::left << std::setw(10) << "odds" << std::setw(12) << "multiplier"
              << std::setw(12) << "real odds" << std::setw(14) << "EV per 100" << "max bet\n";
    for (const auto& odds : oddsLevels) {
        try {
            cd::Amount multiplier = cd::payoutMultiplier(odds);
            cd::Amount real = cd::adjustedOdds(odds, cfg.houseEdge);
            cd::Amount ceiling = cd::maxBet(pool, odds, cfg.houseEdge);
            // EV = P(win) * payout - stake, for a stake of 100.
            double ev = cd::toDouble(real) * cd::toDouble(multiplier) * 100.0 - 100.0;
            bool inBand = odds >= cfg.minOdds && odds <= cfg.maxOdds;

            std::cout << std::left << std::setw(10) << cd::formatFixed(odds, 4) << std::setw(12)
                      << (cd::formatFixed(multiplier, 2) + "x") << std::setw(12)
                      << cd::formatFixed(real, 4) << std::setw(14) << std::fixed
                      << std::setprecision(2) << ev << ceiling.str()
                      << (inBand ? "" : "  (outside odds band)") << '\n';
        } catch (const cd::EngineError& ex) {
            std::cout << cd::formatFixed(odds, 4) << "  rejected: " << ex.what() << '\n';
        }
    }

    std::cout << "\nWorst single-bet drawdown at the ceiling: "
              << cd::mulDiv(pool, cfg.houseEdge, cd::kScale).str() << " (pool * edge)\n";
    return 0;
}

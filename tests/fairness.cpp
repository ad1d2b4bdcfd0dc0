#include "test_support.hpp"

#include <array>
#include <cmath>
#include <string>

using namespace cd;
using namespace cd::test;

namespace {

double empiricalWinRate(const Amount& target, const Amount& edge, int trials) {
    int wins = 0;
    for (int i = 0; i < trials; ++i) {
        Hash256 block = sha256("fairness-block:" + std::to_string(i));
        Amount raw = hashToAmount(betOutcomeSeed(static_cast<BetId>(i + 1), block));
        if (isWinner(raw, target, edge)) {
            ++wins;
        }
    }
    return static_cast<double>(wins) / static_cast<double>(trials);
}

void checkWinRates() {
    const Amount edge = odds("0.01");
    const int trials = 20'000;

    struct Case {
        const char* target;
        double tolerance;
    };
    const std::array<Case, 3> cases{ { { "0.5", 0.02 }, { "0.25", 0.02 }, { "0.1", 0.012 } } };
    for (const auto& c : cases) {
        Amount target = odds(c.target);
        double expected = toDouble(adjustedOdds(target, edge));
        double observed = empiricalWinRate(target, edge, trials);
        if (std::abs(observed - expected) > c.tolerance) {
            fail(std::string("win rate at ") + c.target + " drifted: expected " +
                 std::to_string(expected) + ", observed " + std::to_string(observed));
        }
    }
}

void checkOutcomeSpread() {
    std::array<int, 16> buckets{};
    const int samples = 16'000;
    for (int i = 0; i < samples; ++i) {
        Hash256 seed = betOutcomeSeed(7, sha256("spread:" + std::to_string(i)));
        ++buckets[seed[0] >> 4];
    }
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        if (std::abs(buckets[b] - samples / 16) > 200) {
            fail("outcome bucket " + std::to_string(b) + " holds " + std::to_string(buckets[b]));
        }
    }
}

void checkEngineMatchesMath() {
    Table t;
    t.seedPool(1'000'000);
    const Amount half = odds("0.5");
    const int rounds = 2'000;
    int wins = 0;

    for (int i = 0; i < rounds; ++i) {
        BetId id = t.fundAndBet("player", 10, half);
        t.chain.sealBlock(sha256("origin:" + std::to_string(i)));
        Hash256 outcomeBlock = sha256("outcome:" + std::to_string(i));
        t.chain.sealBlock(outcomeBlock);

        bool expected = isWinner(hashToAmount(betOutcomeSeed(id, outcomeBlock)), half, t.cfg.houseEdge);
        ClaimReceipt receipt = t.house.claim("player", id);
        if (receipt.won != expected) {
            fail("engine outcome for bet " + std::to_string(id) + " differs from the audit formula");
        }
        if (receipt.won) {
            ++wins;
        }
    }

    double rate = static_cast<double>(wins) / rounds;
    expect(std::abs(rate - 0.495) < 0.05, "engine win rate near the adjusted odds");

    Amount custody = t.assets.balanceOf(t.cfg.custodyAccount);
    Amount held = t.assets.balanceOf("player") + t.assets.balanceOf(t.house.pool().account()) + custody;
    expect(custody == 0, "every bet settled out of custody");
    expect(held == t.assets.totalSupply(), "collateral is conserved");
    expect(t.house.pool().totalAssets() == t.assets.balanceOf(t.house.pool().account()),
           "pool books match the pool account");
}

} // namespace

int main() {
    suiteName() = "fairness_test";
    checkWinRates();
    checkOutcomeSpread();
    checkEngineMatchesMath();
    std::cout << "fairness_test passed" << std::endl;
    return 0;
}

#include "test_support.hpp"

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace cd;
using namespace cd::test;

namespace {

struct Snapshot {
    Amount player;
    Amount custody;
    Amount poolBooks;
    Amount poolAccount;
    std::size_t events = 0;
};

Snapshot capture(const Table& t, const AccountId& player) {
    return Snapshot{ t.assets.balanceOf(player),
                     t.assets.balanceOf(t.cfg.custodyAccount),
                     t.house.pool().totalAssets(),
                     t.assets.balanceOf(t.house.pool().account()),
                     t.house.events().size() };
}

void expectUnchanged(const Snapshot& before, const Snapshot& after, const std::string& what) {
    expect(before.player == after.player, what + ": player balance changed");
    expect(before.custody == after.custody, what + ": custody balance changed");
    expect(before.poolBooks == after.poolBooks, what + ": pool books changed");
    expect(before.poolAccount == after.poolAccount, what + ": pool account changed");
    expect(before.events == after.events, what + ": events emitted");
}

void checkClaimReentryRollsBack() {
    Table t;
    t.seedPool(10'000);
    BetId id = t.fundAndBet("alice", 100, odds("0.5"));
    t.resolveAs(id, true);

    t.assets.setReceiveHook("alice", [&](const AccountId&, const Amount&) {
        t.house.claim("alice", id);
    });
    Snapshot before = capture(t, "alice");
    expectError(ErrorCode::ReentrantCall, [&] { t.house.claim("alice", id); }, "claim from payout hook");
    expectUnchanged(before, capture(t, "alice"), "rejected re-entry");
    expect(t.house.getBet(id).status == BetStatus::Pending, "bet still pending after rollback");

    t.assets.setReceiveHook("alice", [](const AccountId&, const Amount&) {
        throw EngineError(ErrorCode::TransferFailed, "recipient refuses collateral");
    });
    expectError(ErrorCode::TransferFailed, [&] { t.house.claim("alice", id); }, "refused payout");
    expectUnchanged(before, capture(t, "alice"), "refused payout");

    t.assets.clearReceiveHook("alice");
    ClaimReceipt receipt = t.house.claim("alice", id);
    expect(receipt.status == BetStatus::Claimed, "claim succeeds once the hook is gone");
    expect(t.assets.balanceOf("alice") == 200, "paid exactly once");
}

void checkSwallowedReentryCannotDoublePay() {
    Table t;
    t.seedPool(10'000);
    t.assets.mint("alice", 50);
    BetId id = t.fundAndBet("alice", 100, odds("0.5"));
    t.resolveAs(id, true);

    int rejected = 0;
    auto attempt = [&](auto&& call) {
        try {
            call();
        } catch (const EngineError& ex) {
            if (ex.code() != ErrorCode::ReentrantCall) {
                throw;
            }
            ++rejected;
        }
    };
    t.assets.setReceiveHook("alice", [&](const AccountId&, const Amount&) {
        attempt([&] { t.house.claim("alice", id); });
        attempt([&] { t.house.placeBet("alice", 10, odds("0.5")); });
        attempt([&] { t.house.stake("alice", 10); });
        attempt([&] { t.house.sweepExpired(10); });
        attempt([&] { t.house.setHouseEdge("operator", odds("0.02")); });
    });

    ClaimReceipt receipt = t.house.claim("alice", id);
    expect(receipt.status == BetStatus::Claimed, "outer claim completes");
    expect(rejected == 5, "every nested entry point was rejected");
    expect(t.assets.balanceOf("alice") == 250, "paid exactly once");
    expect(t.house.pool().totalAssets() == 9'900, "pool debited exactly once");
    expect(t.house.nextBetId() == id + 1, "nested placement left no record");
    expect(t.house.houseEdge() == t.cfg.houseEdge, "nested edge change had no effect");
}

void checkUnstakeReentry() {
    Table t;
    t.seedPool(10'000);
    t.assets.setReceiveHook("lp", [&](const AccountId&, const Amount&) {
        t.house.unstake("lp", 5'000);
    });
    expectError(ErrorCode::ReentrantCall, [&] { t.house.unstake("lp", 5'000); },
                "unstake from unstake hook");
    expect(t.house.pool().sharesOf("lp") == 10'000, "shares intact after rollback");
    expect(t.house.pool().totalAssets() == 10'000, "assets intact after rollback");
    expect(t.assets.balanceOf("lp") == 0, "no collateral leaked");
    t.assets.clearReceiveHook("lp");
    expect(t.house.unstake("lp", 5'000) == 5'000, "unstake works without the hook");
}

void checkConcurrentPlacement() {
    Table t;
    t.seedPool(1'000'000);
    const int perThread = 200;
    const std::vector<std::string> players{ "p0", "p1", "p2", "p3" };
    for (const auto& player : players) {
        t.assets.mint(player, perThread * 10);
    }

    std::vector<std::vector<BetId>> placed(players.size());
    std::vector<std::thread> workers;
    for (std::size_t w = 0; w < players.size(); ++w) {
        workers.emplace_back([&, w] {
            for (int i = 0; i < perThread; ++i) {
                placed[w].push_back(t.house.placeBet(players[w], 10, odds("0.5")));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<BetId> unique;
    for (const auto& ids : placed) {
        unique.insert(ids.begin(), ids.end());
    }
    const std::size_t total = players.size() * perThread;
    expect(unique.size() == total, "concurrent placements received distinct ids");
    expect(t.house.pendingBetCount() == total, "every placement recorded");
    expect(t.house.nextBetId() == kFirstBetId + total, "id counter matches placements");
    expect(t.assets.balanceOf(t.cfg.custodyAccount) == 10 * total, "custody holds every stake");
}

void checkReadsDuringPlacement() {
    Table t;
    t.seedPool(1'000'000);
    const Amount half = odds("0.5");
    BetId first = t.fundAndBet("reader", 10, half);
    const int placements = 400;
    t.assets.mint("writer", placements * 10);

    std::atomic<bool> done{ false };
    bool consistent = true;
    std::thread reader([&] {
        while (!done.load()) {
            Bet bet = t.house.getBet(first);
            if (bet.owner != "reader" || bet.amount != 10 || t.house.pendingBetCount() == 0 ||
                t.house.nextBetId() <= first || t.house.getMaxBet(half) == 0) {
                consistent = false;
            }
        }
    });
    std::thread writer([&] {
        for (int i = 0; i < placements; ++i) {
            t.house.placeBet("writer", 10, half);
        }
        done.store(true);
    });
    writer.join();
    reader.join();

    expect(consistent, "reads during placement saw consistent records");
    expect(t.house.pendingBetCount() == placements + 1, "every placement recorded");
    expect(t.house.getBet(first).owner == "reader", "first record intact");
}

} // namespace

int main() {
    suiteName() = "reentrancy_test";
    checkClaimReentryRollsBack();
    checkSwallowedReentryCannotDoublePay();
    checkUnstakeReentry();
    checkConcurrentPlacement();
    checkReadsDuringPlacement();
    std::cout << "reentrancy_test passed" << std::endl;
    return 0;
}

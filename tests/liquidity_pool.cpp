#include "asset_ledger.hpp"
#include "entry_lock.hpp"
#include "event_log.hpp"
#include "liquidity_pool.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>

using namespace cd;
using namespace cd::test;

namespace {

const AccountId kPoolAccount = "pool";
const AccountId kCustody = "custody";

struct PoolFixture {
    PoolFixture()
        : pool(assets, lock, events, kPoolAccount) {}

    InMemoryAssetLedger assets;
    EntryLock lock;
    EventLog events;
    LiquidityPool pool;
};

void checkProportionalShares() {
    PoolFixture f;
    f.assets.mint("alice", 1000);
    f.assets.mint("bob", 500);

    expect(f.pool.sharePrice() == kScale, "empty pool prices at 1.0");
    expect(f.pool.stake("alice", 1000) == 1000, "first stake mints 1:1");
    expect(f.pool.stake("bob", 500) == 500, "second stake at unchanged price");
    expect(f.pool.totalAssets() == 1500 && f.pool.totalShares() == 1500, "totals after two stakes");

    {
        auto scope = f.lock.enter("test-credit");
        f.assets.mint(kCustody, 300);
        f.pool.creditLoss(scope, kCustody, 300);
    }
    expect(f.pool.totalAssets() == 1800, "credited loss reaches the pool");
    expect(f.pool.sharePrice() == parseFixed("1.2"), "credited loss raises the share price");

    f.assets.mint("carol", 600);
    expect(f.pool.previewStake(600) == 500, "preview at price 1.2");
    expect(f.pool.stake("carol", 600) == 500, "stake at price 1.2");
    expect(f.pool.previewUnstake(500) == 600, "preview of the round trip");
    expect(f.pool.unstake("carol", 500) == 600, "round trip returns the deposit");
    expect(f.assets.balanceOf("carol") == 600, "carol made whole");

    expect(f.pool.unstake("bob", 500) == 600, "bob redeems at price 1.2");
    expect(f.pool.unstake("alice", 1000) == 1200, "alice redeems at price 1.2");
    expect(f.pool.totalAssets() == 0 && f.pool.totalShares() == 0, "pool drained");
    expect(f.pool.sharesOf("alice") == 0, "drained provider holds nothing");
    expect(f.assets.balanceOf(kPoolAccount) == 0, "no collateral left behind");

    expect(f.events.eventsOfType<LiquidityStaked>().size() == 3, "stake events");
    expect(f.events.eventsOfType<LiquidityUnstaked>().size() == 3, "unstake events");
}

void checkDonationIsIgnored() {
    PoolFixture f;
    f.assets.mint("attacker", 1'000'001);
    f.assets.mint("victim", 1000);

    expect(f.pool.stake("attacker", 1) == 1, "attacker seeds the pool with one unit");
    // Collateral pushed straight into the pool account bypasses stake.
    f.assets.transfer("attacker", kPoolAccount, 1'000'000);

    expect(f.pool.unaccountedBalance() == 1'000'000, "donation shows up as unaccounted");
    expect(f.pool.sharePrice() == kScale, "donation does not move the share price");

    Amount minted = f.pool.stake("victim", 1000);
    expect(minted == 1000, "second depositor is priced without the donation");
    expect(f.pool.unstake("victim", minted) == 1000, "second depositor redeems in full");
    expect(f.pool.unstake("attacker", 1) == 1, "attacker only recovers the tracked stake");
    expect(f.pool.unaccountedBalance() == 1'000'000, "donation stays outside the books");
}

void checkRejections() {
    PoolFixture f;
    f.assets.mint("alice", 1000);
    f.pool.stake("alice", 1000);

    expectError(ErrorCode::InvalidAmount, [&] { f.pool.stake("alice", 0); }, "zero stake");
    expectError(ErrorCode::InvalidAmount, [&] { f.pool.unstake("alice", 0); }, "zero unstake");
    expectError(ErrorCode::InvalidAmount, [&] { f.pool.unstake("alice", 1001); }, "unstake over balance");
    expectError(ErrorCode::InvalidAmount, [&] { f.pool.unstake("mallory", 1); }, "unstake by non-holder");
    expectError(ErrorCode::TransferFailed, [&] { f.pool.stake("mallory", 10); }, "unfunded stake");
    expect(f.pool.sharesOf("mallory") == 0, "failed stake mints nothing");
    expect(f.pool.totalAssets() == 1000, "failed stake leaves totals alone");

    {
        auto scope = f.lock.enter("test-debit");
        expectError(ErrorCode::InsufficientLiquidity,
                    [&] { f.pool.debitPayout(scope, kCustody, 1001); },
                    "payout above pool assets");
        expect(f.pool.totalAssets() == 1000, "failed payout leaves totals alone");
        expect(f.assets.balanceOf(kCustody) == 0, "failed payout moves nothing");

        f.pool.debitPayout(scope, kCustody, 400);
        f.pool.refundPayout(scope, kCustody, 400);
        expect(f.pool.totalAssets() == 1000, "refunded payout restores totals");

        // Settlement calls share the caller's scope; a fresh entry is rejected.
        expectError(ErrorCode::ReentrantCall, [&] { f.pool.stake("alice", 1); }, "stake inside scope");
    }
}

void checkSharesWithoutAssets() {
    PoolFixture f;
    f.assets.mint("alice", 100);
    f.assets.mint("bob", 100);
    f.pool.stake("alice", 100);
    {
        auto scope = f.lock.enter("test-drain");
        f.pool.debitPayout(scope, kCustody, 100);
    }
    expect(f.pool.totalAssets() == 0 && f.pool.totalShares() == 100, "shares outlive assets");
    expect(f.pool.sharePrice() == 0, "worthless shares price at zero");
    expectError(ErrorCode::InsufficientLiquidity, [&] { f.pool.stake("bob", 100); },
                "stake into a pool with shares but no assets");
    expectError(ErrorCode::InvalidAmount, [&] { f.pool.unstake("alice", 100); },
                "unstake of worthless shares");
}

void checkForeignScopeRejected() {
    PoolFixture f;
    f.assets.mint("alice", 1000);
    f.pool.stake("alice", 1000);
    f.assets.mint(kCustody, 300);

    auto rejected = [](auto&& call, const std::string& what) {
        try {
            call();
        } catch (const std::invalid_argument&) {
            return;
        }
        fail(what + ": scope from another lock was accepted");
    };

    EntryLock otherEngine;
    {
        auto foreign = otherEngine.enter("other-engine");
        rejected([&] { f.pool.creditLoss(foreign, kCustody, 300); }, "credit");
        rejected([&] { f.pool.debitPayout(foreign, kCustody, 100); }, "payout");
        rejected([&] { f.pool.refundPayout(foreign, kCustody, 100); }, "refund");
    }

    expect(f.pool.totalAssets() == 1000 && f.pool.totalShares() == 1000, "totals untouched");
    expect(f.assets.balanceOf(kPoolAccount) == 1000, "pool account untouched");
    expect(f.assets.balanceOf(kCustody) == 300, "custody untouched");

    auto scope = f.lock.enter("test-credit");
    f.pool.creditLoss(scope, kCustody, 300);
    expect(f.pool.totalAssets() == 1300, "own scope still accepted");
}

} // namespace

int main() {
    suiteName() = "liquidity_pool_test";
    checkProportionalShares();
    checkDonationIsIgnored();
    checkRejections();
    checkSharesWithoutAssets();
    checkForeignScopeRejected();
    std::cout << "liquidity_pool_test passed" << std::endl;
    return 0;
}

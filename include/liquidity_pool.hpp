#pragma once

#include "asset_ledger.hpp"
#include "entry_lock.hpp"
#include "event_log.hpp"
#include "fixed_point.hpp"

#include <map>

namespace cd {

// Share-based bankroll. totalAssets is tracked internally; collateral that
// reaches the pool account by any path other than stake/creditLoss never
// enters pricing.
class LiquidityPool {
public:
    LiquidityPool(AssetLedger& assets, EntryLock& lock, EventLog& events, AccountId poolAccount);

    LiquidityPool(const LiquidityPool&) = delete;
    LiquidityPool& operator=(const LiquidityPool&) = delete;

    // Mints shares at the price before the deposit; the first stake into an empty pool is 1:1.
    Amount stake(const AccountId& provider, const Amount& assets);
    // Burns shares and returns their assets at the current price.
    Amount unstake(const AccountId& provider, const Amount& shares);

    Amount previewStake(const Amount& assets) const;
    Amount previewUnstake(const Amount& shares) const;

    // Settlement hooks for the bet ledger; only callable inside a guarded operation
    // on this pool's lock. A scope from any other lock is rejected with
    // std::invalid_argument before state changes.
    void creditLoss(const EntryLock::Scope& scope, const AccountId& from, const Amount& amount);
    void debitPayout(const EntryLock::Scope& scope, const AccountId& to, const Amount& amount);
    // Returns a payout whose onward delivery failed, restoring the pre-debit state exactly.
    void refundPayout(const EntryLock::Scope& scope, const AccountId& from, const Amount& amount);

    bool canCover(const Amount& amount) const;

    Amount totalAssets() const;
    Amount totalShares() const;
    Amount sharesOf(const AccountId& provider) const;
    // 1e18-scaled assets per share; 1.0 while the pool is empty.
    Amount sharePrice() const;
    // Collateral sitting in the pool account outside the tracked totalAssets.
    Amount unaccountedBalance() const;
    const AccountId& account() const { return poolAccount_; }

private:
    Amount withdraw(const AccountId& provider, const Amount& shares);
    Amount sharesForDeposit(const Amount& assets,
                            const Amount& assetsBefore,
                            const Amount& sharesBefore) const;

    AssetLedger& assets_;
    EntryLock& lock_;
    EventLog& events_;
    AccountId poolAccount_;

    Amount totalAssets_ = 0;
    Amount totalShares_ = 0;
    std::map<AccountId, Amount> shares_;
};

} // namespace cd

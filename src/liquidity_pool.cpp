#include "liquidity_pool.hpp"

#include "errors.hpp"

#include <algorithm>
#include <sstream>

namespace cd {

namespace {

std::string describeShortfall(const Amount& needed, const Amount& available) {
    std::ostringstream oss;
    oss << "pool needs " << needed << " but holds " << available;
    return oss.str();
}

} // namespace

LiquidityPool::LiquidityPool(AssetLedger& assets,
                             EntryLock& lock,
                             EventLog& events,
                             AccountId poolAccount)
    : assets_(assets)
    , lock_(lock)
    , events_(events)
    , poolAccount_(std::move(poolAccount)) {
    if (poolAccount_.empty()) {
        throw EngineError(ErrorCode::InvalidConfig, "pool account must be named");
    }
}

Amount LiquidityPool::sharesForDeposit(const Amount& assets,
                                       const Amount& assetsBefore,
                                       const Amount& sharesBefore) const {
    if (sharesBefore == 0) {
        return assets;
    }
    if (assetsBefore == 0) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          "pool has outstanding shares but no assets to price them");
    }
    return mulDiv(assets, sharesBefore, assetsBefore);
}

Amount LiquidityPool::previewStake(const Amount& assets) const {
    auto guard = lock_.read();
    return sharesForDeposit(assets, totalAssets_, totalShares_);
}

Amount LiquidityPool::previewUnstake(const Amount& shares) const {
    auto guard = lock_.read();
    if (totalShares_ == 0) {
        return 0;
    }
    return mulDiv(shares, totalAssets_, totalShares_);
}

Amount LiquidityPool::stake(const AccountId& provider, const Amount& assets) {
    Amount minted;
    {
        auto scope = lock_.enter("stake");
        if (assets == 0) {
            throw EngineError(ErrorCode::InvalidAmount, "stake of zero assets");
        }

        // Price against the balance captured before the incoming collateral is recorded.
        const Amount assetsBefore = totalAssets_;
        const Amount sharesBefore = totalShares_;
        minted = sharesForDeposit(assets, assetsBefore, sharesBefore);
        if (minted == 0) {
            throw EngineError(ErrorCode::InvalidAmount, "stake too small to mint a share");
        }

        assets_.transfer(provider, poolAccount_, assets);

        totalAssets_ = assetsBefore + assets;
        totalShares_ = sharesBefore + minted;
        shares_[provider] += minted;

        events_.append(LiquidityStaked{ provider, assets, minted });
    }
    events_.deliverPending();
    return minted;
}

Amount LiquidityPool::unstake(const AccountId& provider, const Amount& shares) {
    Amount redeemed = withdraw(provider, shares);
    events_.deliverPending();
    return redeemed;
}

Amount LiquidityPool::withdraw(const AccountId& provider, const Amount& shares) {
    auto scope = lock_.enter("unstake");
    if (shares == 0) {
        throw EngineError(ErrorCode::InvalidAmount, "unstake of zero shares");
    }
    Amount held = sharesOf(provider);
    if (shares > held) {
        std::ostringstream oss;
        oss << provider << " holds " << held << " shares, requested " << shares;
        throw EngineError(ErrorCode::InvalidAmount, oss.str());
    }

    Amount redeemed = mulDiv(shares, totalAssets_, totalShares_);
    if (redeemed == 0) {
        throw EngineError(ErrorCode::InvalidAmount, "shares redeem for zero assets");
    }
    Amount onHand = assets_.balanceOf(poolAccount_);
    if (redeemed > totalAssets_ || redeemed > onHand) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          describeShortfall(redeemed, std::min(totalAssets_, onHand)));
    }

    assets_.transfer(poolAccount_, provider, redeemed);

    totalAssets_ -= redeemed;
    totalShares_ -= shares;
    Amount remaining = held - shares;
    if (remaining == 0) {
        shares_.erase(provider);
    } else {
        shares_[provider] = remaining;
    }

    events_.append(LiquidityUnstaked{ provider, shares, redeemed });
    return redeemed;
}

void LiquidityPool::creditLoss(const EntryLock::Scope& scope,
                               const AccountId& from,
                               const Amount& amount) {
    lock_.requireScope(scope, "creditLoss");
    if (amount == 0) {
        return;
    }
    assets_.transfer(from, poolAccount_, amount);
    totalAssets_ += amount;
}

bool LiquidityPool::canCover(const Amount& amount) const {
    auto guard = lock_.read();
    return amount <= totalAssets_ && amount <= assets_.balanceOf(poolAccount_);
}

void LiquidityPool::debitPayout(const EntryLock::Scope& scope,
                                const AccountId& to,
                                const Amount& amount) {
    lock_.requireScope(scope, "debitPayout");
    if (amount == 0) {
        return;
    }
    if (!canCover(amount)) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          describeShortfall(amount, totalAssets_));
    }
    assets_.transfer(poolAccount_, to, amount);
    totalAssets_ -= amount;
}

void LiquidityPool::refundPayout(const EntryLock::Scope& scope,
                                 const AccountId& from,
                                 const Amount& amount) {
    lock_.requireScope(scope, "refundPayout");
    creditLoss(scope, from, amount);
}

Amount LiquidityPool::totalAssets() const {
    auto guard = lock_.read();
    return totalAssets_;
}

Amount LiquidityPool::totalShares() const {
    auto guard = lock_.read();
    return totalShares_;
}

Amount LiquidityPool::sharesOf(const AccountId& provider) const {
    auto guard = lock_.read();
    auto it = shares_.find(provider);
    if (it == shares_.end()) {
        return 0;
    }
    return it->second;
}

Amount LiquidityPool::sharePrice() const {
    auto guard = lock_.read();
    if (totalShares_ == 0) {
        return kScale;
    }
    return mulDiv(totalAssets_, kScale, totalShares_);
}

Amount LiquidityPool::unaccountedBalance() const {
    auto guard = lock_.read();
    Amount onHand = assets_.balanceOf(poolAccount_);
    if (onHand <= totalAssets_) {
        return 0;
    }
    return onHand - totalAssets_;
}

} // namespace cd

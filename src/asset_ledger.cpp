#include "asset_ledger.hpp"

#include "errors.hpp"

namespace cd {

Amount InMemoryAssetLedger::balanceOf(const AccountId& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

void InMemoryAssetLedger::transfer(const AccountId& from,
                                   const AccountId& to,
                                   const Amount& amount) {
    if (from.empty() || to.empty()) {
        throw EngineError(ErrorCode::TransferFailed, "transfer requires both accounts");
    }
    Amount available = balanceOf(from);
    if (available < amount) {
        throw EngineError(ErrorCode::TransferFailed,
                          from + " holds " + available.str() + ", needs " + amount.str());
    }
    if (amount == 0 || from == to) {
        return;
    }

    balances_[from] = available - amount;
    balances_[to] += amount;

    auto hookIt = hooks_.find(to);
    if (hookIt != hooks_.end() && hookIt->second) {
        ReceiveHook hook = hookIt->second;
        try {
            hook(from, amount);
        } catch (...) {
            // A failing recipient rejects the whole transfer.
            balances_[to] -= amount;
            balances_[from] += amount;
            throw;
        }
    }
}

void InMemoryAssetLedger::mint(const AccountId& account, const Amount& amount) {
    if (account.empty()) {
        throw EngineError(ErrorCode::TransferFailed, "cannot mint to an empty account");
    }
    totalSupply_ += amount;
    balances_[account] += amount;
}

void InMemoryAssetLedger::setReceiveHook(const AccountId& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void InMemoryAssetLedger::clearReceiveHook(const AccountId& account) {
    hooks_.erase(account);
}

} // namespace cd

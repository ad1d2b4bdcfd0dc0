#pragma once

#include "fixed_point.hpp"

#include <functional>
#include <map>
#include <string>

namespace cd {

using AccountId = std::string;

// External collateral custody. A transfer either moves the full amount or raises
// EngineError(TransferFailed) with no balance changed.
class AssetLedger {
public:
    virtual ~AssetLedger() = default;

    virtual Amount balanceOf(const AccountId& account) const = 0;
    virtual void transfer(const AccountId& from, const AccountId& to, const Amount& amount) = 0;
};

class InMemoryAssetLedger : public AssetLedger {
public:
    // Runs after collateral has landed in the hooked account.
    using ReceiveHook = std::function<void(const AccountId& from, const Amount& amount)>;

    Amount balanceOf(const AccountId& account) const override;
    void transfer(const AccountId& from, const AccountId& to, const Amount& amount) override;

    void mint(const AccountId& account, const Amount& amount);
    void setReceiveHook(const AccountId& account, ReceiveHook hook);
    void clearReceiveHook(const AccountId& account);

    Amount totalSupply() const { return totalSupply_; }

private:
    std::map<AccountId, Amount> balances_;
    std::map<AccountId, ReceiveHook> hooks_;
    Amount totalSupply_ = 0;
};

} // namespace cd

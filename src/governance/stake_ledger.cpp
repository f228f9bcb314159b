// STAKEGOV - Stake Ledger Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/stake_ledger.h"
#include "stakegov/governance/collaborators.h"

namespace stakegov {
namespace governance {

OpResult<Amount> StakeLedger::CommitStake(const Identity& caller, Amount amount,
                                          IValueCustody& custody,
                                          const Identity& custodyAccount) {
    // The custody account cannot lock value into itself
    if (amount <= 0 || caller == custodyAccount) {
        return OpResult<Amount>::Failure(GovernanceError::InvalidAmount);
    }

    Amount newStake = 0;
    Amount newTotal = 0;
    if (!CheckedAdd(GetStake(caller), amount, newStake) ||
        !CheckedAdd(totalStaked_, amount, newTotal)) {
        return OpResult<Amount>::Failure(GovernanceError::InvalidAmount);
    }

    if (!custody.Transfer(amount, caller, custodyAccount)) {
        return OpResult<Amount>::Failure(GovernanceError::InvalidAmount);
    }

    stakes_[caller] = newStake;
    totalStaked_ = newTotal;
    return OpResult<Amount>::Success(newStake);
}

Amount StakeLedger::GetStake(const Identity& who) const {
    auto it = stakes_.find(who);
    return it == stakes_.end() ? 0 : it->second;
}

bool StakeLedger::Restore(const std::map<Identity, Amount>& stakes) {
    Amount total = 0;
    for (const auto& [who, amount] : stakes) {
        if (amount <= 0 || !CheckedAdd(total, amount, total)) {
            return false;
        }
    }
    stakes_ = stakes;
    totalStaked_ = total;
    return true;
}

void StakeLedger::Clear() {
    stakes_.clear();
    totalStaked_ = 0;
}

} // namespace governance
} // namespace stakegov

// STAKEGOV - Stake Ledger
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Committed stake per participant plus the global total.
// Stake only ever increases; there is no withdrawal path.

#ifndef STAKEGOV_GOVERNANCE_STAKE_LEDGER_H
#define STAKEGOV_GOVERNANCE_STAKE_LEDGER_H

#include "stakegov/core/types.h"
#include "stakegov/governance/errors.h"

#include <map>

namespace stakegov {
namespace governance {

class IValueCustody;

class StakeLedger {
public:
    /**
     * Move amount from the caller into custody and credit it as stake.
     *
     * Checks amount > 0 and that neither the caller's stake nor the total
     * would overflow, then asks custody for the transfer. If the transfer
     * fails nothing is recorded.
     *
     * @return The caller's new total stake
     */
    OpResult<Amount> CommitStake(const Identity& caller, Amount amount,
                                 IValueCustody& custody, const Identity& custodyAccount);

    /// Current stake of a participant (0 if never staked)
    Amount GetStake(const Identity& who) const;

    Amount GetTotalStaked() const { return totalStaked_; }

    const std::map<Identity, Amount>& GetStakes() const { return stakes_; }

    size_t GetStakerCount() const { return stakes_.size(); }

    /// Replace contents with persisted records; total is recomputed.
    /// Returns false on a non-positive amount or an overflowing sum.
    bool Restore(const std::map<Identity, Amount>& stakes);

    void Clear();

private:
    std::map<Identity, Amount> stakes_;
    Amount totalStaked_{0};
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_STAKE_LEDGER_H

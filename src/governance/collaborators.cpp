// STAKEGOV - Governance Collaborators Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/collaborators.h"

namespace stakegov {
namespace governance {

// ============================================================================
// ManualClock
// ============================================================================

bool ManualClock::SetHeight(Height height) {
    if (height < height_) {
        return false;
    }
    height_ = height;
    return true;
}

bool ManualClock::Advance(Height delta) {
    Height next = 0;
    if (!CheckedAdd(height_, delta, next)) {
        return false;
    }
    height_ = next;
    return true;
}

// ============================================================================
// BalanceCustody
// ============================================================================

bool BalanceCustody::Transfer(Amount amount, const Identity& from, const Identity& to) {
    if (amount <= 0 || from == to) {
        return false;
    }

    Amount fromBalance = GetBalance(from);
    if (fromBalance < amount) {
        return false;
    }

    Amount toBalance = 0;
    if (!CheckedAdd(GetBalance(to), amount, toBalance)) {
        return false;
    }

    balances_[from] = fromBalance - amount;
    balances_[to] = toBalance;
    return true;
}

bool BalanceCustody::Credit(const Identity& account, Amount amount) {
    Amount updated = 0;
    if (amount <= 0 || !CheckedAdd(GetBalance(account), amount, updated)) {
        return false;
    }
    balances_[account] = updated;
    return true;
}

Amount BalanceCustody::GetBalance(const Identity& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

} // namespace governance
} // namespace stakegov

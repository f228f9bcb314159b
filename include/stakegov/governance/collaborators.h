// STAKEGOV - Governance Collaborators
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Interfaces the engine consumes but does not own: the global clock and
// the value-custody transfer primitive.

#ifndef STAKEGOV_GOVERNANCE_COLLABORATORS_H
#define STAKEGOV_GOVERNANCE_COLLABORATORS_H

#include "stakegov/core/types.h"

#include <map>

namespace stakegov {
namespace governance {

// ============================================================================
// Clock
// ============================================================================

/// Monotonic global clock (block height). Advanced externally.
class IClock {
public:
    virtual ~IClock() = default;

    virtual Height Now() const = 0;
};

/// Clock driven explicitly by its owner
class ManualClock : public IClock {
public:
    explicit ManualClock(Height start = 0) : height_(start) {}

    Height Now() const override { return height_; }

    /// Returns false (and keeps the current height) if height would go backwards
    bool SetHeight(Height height);

    /// Move forward by delta blocks; false on a negative delta or overflow
    bool Advance(Height delta);

private:
    Height height_;
};

// ============================================================================
// Value Custody
// ============================================================================

/// All-or-nothing value transfer between accounts
class IValueCustody {
public:
    virtual ~IValueCustody() = default;

    /// Move amount between two distinct accounts. On failure nothing moves.
    virtual bool Transfer(Amount amount, const Identity& from, const Identity& to) = 0;
};

/**
 * Simple balance book implementing IValueCustody.
 *
 * Used by the command-line tool (persisted alongside the governance
 * state) and by tests.
 */
class BalanceCustody : public IValueCustody {
public:
    bool Transfer(Amount amount, const Identity& from, const Identity& to) override;

    /// Add value to an account; false on non-positive amount or overflow
    bool Credit(const Identity& account, Amount amount);

    Amount GetBalance(const Identity& account) const;

    const std::map<Identity, Amount>& GetBalances() const { return balances_; }

    void Clear() { balances_.clear(); }

private:
    std::map<Identity, Amount> balances_;
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_COLLABORATORS_H

// STAKEGOV - Governance Store
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Persists the governance state, custody balances and last clock height
// in a db::Database.
//
// Key layout:
//   'S' + identity              -> stake amount (int64)
//   'P' + proposal id (uint64)  -> ProposalRecord
//   'V' + proposal id + voter   -> VoteRecord
//   'G' + name                  -> global counter (int64 / uint64)
//   'X' + identity              -> custody balance (int64)
//   'H'                         -> last clock height (int64)
//
// Proposal ids are written big-endian so keys sort numerically.

#ifndef STAKEGOV_GOVERNANCE_STORE_H
#define STAKEGOV_GOVERNANCE_STORE_H

#include "stakegov/db/database.h"
#include "stakegov/governance/collaborators.h"
#include "stakegov/governance/engine.h"

#include <optional>
#include <string>

namespace stakegov {
namespace governance {

class GovernanceStore {
public:
    /// db must outlive the store
    explicit GovernanceStore(db::Database& db) : db_(db) {}

    /**
     * Replace everything under the governance prefixes with the engine
     * state, the custody balances and height, in one atomic batch.
     */
    db::Status Save(const GovernanceEngine& engine, const BalanceCustody& custody,
                    Height height);

    /**
     * Load into engine and custody. An empty database loads as an empty
     * state at height 0. Undecodable records, broken invariants or a
     * custody balance below the total stake return Corruption and leave
     * engine and custody untouched.
     */
    db::Status Load(GovernanceEngine& engine, BalanceCustody& custody, Height& height);

    // === Key Helpers ===

    static std::string StakeKey(const Identity& who);
    static std::string ProposalKey(ProposalId id);
    static std::string VoteKey(ProposalId id, const Identity& voter);
    static std::string CustodyKey(const Identity& who);
    static std::string CounterKey(const std::string& name);
    static std::string HeightKey();

private:
    /// Queue deletes for every key under prefix
    void DeletePrefix(char prefix, db::WriteBatch& batch);

    db::Database& db_;
};

/// Counter names under the 'G' prefix
namespace counter {
    constexpr const char* PROPOSAL_COUNT = "proposal_count";
    constexpr const char* TOTAL_STAKED = "total_staked";
}

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_STORE_H

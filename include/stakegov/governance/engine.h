// STAKEGOV - Governance Engine
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Single owner of the governance state. Participants stake value for
// voting weight, submit time-bound proposals, cast one weighted vote per
// proposal, and execute proposals that reach quorum and a strict majority
// once their window has closed.

#ifndef STAKEGOV_GOVERNANCE_ENGINE_H
#define STAKEGOV_GOVERNANCE_ENGINE_H

#include "stakegov/core/types.h"
#include "stakegov/governance/collaborators.h"
#include "stakegov/governance/errors.h"
#include "stakegov/governance/params.h"
#include "stakegov/governance/proposal.h"
#include "stakegov/governance/proposal_registry.h"
#include "stakegov/governance/stake_ledger.h"
#include "stakegov/governance/vote_tally.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stakegov {
namespace governance {

/// Plain copy of the whole engine state, used for persistence
struct GovernanceState {
    std::map<Identity, Amount> stakes;
    std::map<ProposalId, ProposalRecord> proposals;
    std::map<VoteKey, VoteRecord> votes;
    ProposalId proposalCount{0};
    Amount totalStaked{0};
};

/**
 * Check the state invariants:
 * - every stake is positive and totalStaked is their sum
 * - proposals are exactly ids 1..proposalCount, keyed by their own id
 * - titles and descriptions are within the creation bounds
 * - executed is set iff status is Executed
 * - each vote is keyed by its own (proposal, voter), references an
 *   existing proposal, and has positive weight
 * - each proposal's yes/no weight equals the sum of its votes' weights
 */
bool ValidateState(const GovernanceState& state, std::string& error);

class GovernanceEngine {
public:
    /// The clock and custody must outlive the engine
    GovernanceEngine(const GovernanceParams& params, const IClock& clock,
                     IValueCustody& custody);

    // === Mutating Operations ===

    /// Lock amount of the caller's value; returns the caller's new total stake
    OpResult<Amount> Stake(const Identity& caller, Amount amount);

    /// Returns the new proposal id
    OpResult<ProposalId> CreateProposal(const Identity& caller,
                                        const std::string& title,
                                        const std::string& description,
                                        Height duration);

    /// support = true votes for, false against
    OpStatus Vote(const Identity& caller, ProposalId id, bool support);

    OpStatus ExecuteProposal(const Identity& caller, ProposalId id);

    // === Queries ===

    std::optional<ProposalRecord> GetProposal(ProposalId id) const;

    /// 0 for a participant who never staked
    Amount GetStake(const Identity& who) const;

    std::optional<VoteRecord> GetVote(ProposalId id, const Identity& voter) const;

    Amount GetTotalStaked() const;

    /// false for an unknown id
    bool IsExecutable(ProposalId id) const;

    ProposalId GetProposalCount() const;

    std::vector<ProposalRecord> ListProposals() const;

    std::vector<ProposalRecord> ListProposalsByCreator(const Identity& creator) const;

    std::vector<VoteRecord> GetVotes(ProposalId id) const;

    /// nullopt for an unknown id
    std::optional<ProposalOutcome> EvaluateOutcome(ProposalId id) const;

    /// SHA-256 over the canonical serialization of the state
    Hash256 StateHash() const;

    const GovernanceParams& GetParams() const { return params_; }

    Height Now() const { return clock_.Now(); }

    // === Persistence ===

    GovernanceState ExportState() const;

    /// Replace the state after ValidateState; unchanged on failure
    bool ImportState(const GovernanceState& state, std::string& error);

private:
    const GovernanceParams params_;
    const IClock& clock_;
    IValueCustody& custody_;

    mutable std::mutex mutex_;

    StakeLedger ledger_;
    ProposalRegistry registry_;
    VoteTally tally_;
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_ENGINE_H

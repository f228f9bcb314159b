// STAKEGOV - Vote Tally
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// One weighted vote per (proposal, voter). Weight is the voter's live
// stake at the moment the vote is cast; later staking does not change
// an existing vote.

#ifndef STAKEGOV_GOVERNANCE_VOTE_TALLY_H
#define STAKEGOV_GOVERNANCE_VOTE_TALLY_H

#include "stakegov/core/types.h"
#include "stakegov/governance/errors.h"
#include "stakegov/governance/proposal.h"

#include <map>
#include <utility>
#include <vector>

namespace stakegov {
namespace governance {

class ProposalRegistry;
class StakeLedger;

/// (proposal id, voter)
using VoteKey = std::pair<ProposalId, Identity>;

class VoteTally {
public:
    /**
     * Validate and record a vote, adding its weight to the proposal tally.
     *
     * Checks, in order: proposal exists (ProposalNotFound), voting window
     * open (ProposalNotActive), caller stake > 0 (InsufficientStake), no
     * earlier vote by caller (AlreadyVoted).
     */
    OpStatus CastVote(const Identity& caller, ProposalId proposalId, bool support,
                      Height now, ProposalRegistry& registry, const StakeLedger& ledger);

    std::optional<VoteRecord> GetVote(ProposalId proposalId, const Identity& voter) const;

    bool HasVoted(ProposalId proposalId, const Identity& voter) const;

    /// Votes on one proposal in voter order
    std::vector<VoteRecord> GetVotes(ProposalId proposalId) const;

    const std::map<VoteKey, VoteRecord>& GetAllVotes() const { return votes_; }

    void Restore(const std::map<VoteKey, VoteRecord>& votes);

    void Clear() { votes_.clear(); }

private:
    std::map<VoteKey, VoteRecord> votes_;
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_VOTE_TALLY_H

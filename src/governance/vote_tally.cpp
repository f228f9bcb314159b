// STAKEGOV - Vote Tally Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/vote_tally.h"
#include "stakegov/governance/proposal_registry.h"
#include "stakegov/governance/stake_ledger.h"

namespace stakegov {
namespace governance {

OpStatus VoteTally::CastVote(const Identity& caller, ProposalId proposalId, bool support,
                             Height now, ProposalRegistry& registry,
                             const StakeLedger& ledger) {
    ProposalRecord* proposal = registry.GetMutableProposal(proposalId);
    if (!proposal) {
        return OpStatus::Failure(GovernanceError::ProposalNotFound);
    }
    if (!proposal->IsVotingOpen(now)) {
        return OpStatus::Failure(GovernanceError::ProposalNotActive);
    }

    Amount weight = ledger.GetStake(caller);
    if (weight <= 0) {
        return OpStatus::Failure(GovernanceError::InsufficientStake);
    }
    if (HasVoted(proposalId, caller)) {
        return OpStatus::Failure(GovernanceError::AlreadyVoted);
    }

    VoteRecord vote;
    vote.proposalId = proposalId;
    vote.voter = caller;
    vote.support = support;
    vote.weight = weight;
    votes_.emplace(VoteKey(proposalId, caller), vote);

    // yes + no <= total_staked, which never overflows
    if (support) {
        proposal->yesWeight += weight;
    } else {
        proposal->noWeight += weight;
    }

    return OpStatus::Success();
}

std::optional<VoteRecord> VoteTally::GetVote(ProposalId proposalId, const Identity& voter) const {
    auto it = votes_.find(VoteKey(proposalId, voter));
    if (it == votes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VoteTally::HasVoted(ProposalId proposalId, const Identity& voter) const {
    return votes_.find(VoteKey(proposalId, voter)) != votes_.end();
}

std::vector<VoteRecord> VoteTally::GetVotes(ProposalId proposalId) const {
    std::vector<VoteRecord> result;
    auto it = votes_.lower_bound(VoteKey(proposalId, Identity()));
    for (; it != votes_.end() && it->first.first == proposalId; ++it) {
        result.push_back(it->second);
    }
    return result;
}

void VoteTally::Restore(const std::map<VoteKey, VoteRecord>& votes) {
    votes_ = votes;
}

} // namespace governance
} // namespace stakegov

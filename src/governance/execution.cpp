// STAKEGOV - Execution Oracle Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/execution.h"
#include "stakegov/governance/proposal_registry.h"

namespace stakegov {
namespace governance {

bool IsExecutable(const ProposalRecord& proposal, Height now) {
    return proposal.HasQuorum() &&
           proposal.HasMajority() &&
           !proposal.executed &&
           now >= proposal.endTime;
}

ProposalOutcome EvaluateOutcome(const ProposalRecord& proposal, Height now) {
    if (proposal.executed) {
        return ProposalOutcome::Executed;
    }
    if (now <= proposal.endTime) {
        // Still inside the window (endTime itself accepts votes)
        return ProposalOutcome::Voting;
    }
    return IsExecutable(proposal, now) ? ProposalOutcome::Passed : ProposalOutcome::Failed;
}

OpStatus ExecuteProposal(ProposalRegistry& registry, ProposalId id, Height now) {
    ProposalRecord* proposal = registry.GetMutableProposal(id);
    if (!proposal || !IsExecutable(*proposal, now)) {
        return OpStatus::Failure(GovernanceError::InvalidState);
    }

    proposal->status = ProposalStatus::Executed;
    proposal->executed = true;
    return OpStatus::Success();
}

} // namespace governance
} // namespace stakegov

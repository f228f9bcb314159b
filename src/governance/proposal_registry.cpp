// STAKEGOV - Proposal Registry Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/proposal_registry.h"
#include "stakegov/governance/stake_ledger.h"

#include <limits>

namespace stakegov {
namespace governance {

OpResult<ProposalId> ProposalRegistry::CreateProposal(const Identity& caller,
                                                      const std::string& title,
                                                      const std::string& description,
                                                      Height duration,
                                                      Height now,
                                                      const StakeLedger& ledger,
                                                      const GovernanceParams& params) {
    using Result = OpResult<ProposalId>;

    if (!IsTextWithinBounds(title, MIN_TITLE_LENGTH, MAX_TITLE_LENGTH)) {
        return Result::Failure(GovernanceError::InvalidTitle);
    }
    if (!IsTextWithinBounds(description, MIN_DESCRIPTION_LENGTH, MAX_DESCRIPTION_LENGTH)) {
        return Result::Failure(GovernanceError::InvalidDescription);
    }
    if (ledger.GetStake(caller) < params.minProposalStake) {
        return Result::Failure(GovernanceError::InsufficientStake);
    }
    if (duration <= 0) {
        return Result::Failure(GovernanceError::InvalidAmount);
    }

    Height endTime = 0;
    if (!CheckedAdd(now, duration, endTime) ||
        proposalCount_ == std::numeric_limits<ProposalId>::max()) {
        return Result::Failure(GovernanceError::InvalidAmount);
    }

    ProposalRecord record;
    record.id = proposalCount_ + 1;
    record.creator = caller;
    record.title = title;
    record.description = description;
    record.startTime = now;
    record.endTime = endTime;
    record.status = ProposalStatus::Active;
    record.minVotesRequired = ledger.GetTotalStaked() / QUORUM_DIVISOR;

    proposalCount_ = record.id;
    proposals_.emplace(record.id, std::move(record));
    return Result::Success(proposalCount_);
}

const ProposalRecord* ProposalRegistry::GetProposal(ProposalId id) const {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

ProposalRecord* ProposalRegistry::GetMutableProposal(ProposalId id) {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

std::vector<ProposalRecord> ProposalRegistry::ListProposals() const {
    std::vector<ProposalRecord> result;
    result.reserve(proposals_.size());
    for (const auto& [id, record] : proposals_) {
        result.push_back(record);
    }
    return result;
}

std::vector<ProposalRecord> ProposalRegistry::ListProposalsByCreator(const Identity& creator) const {
    std::vector<ProposalRecord> result;
    for (const auto& [id, record] : proposals_) {
        if (record.creator == creator) {
            result.push_back(record);
        }
    }
    return result;
}

void ProposalRegistry::Restore(const std::map<ProposalId, ProposalRecord>& proposals,
                               ProposalId count) {
    proposals_ = proposals;
    proposalCount_ = count;
}

void ProposalRegistry::Clear() {
    proposals_.clear();
    proposalCount_ = 0;
}

} // namespace governance
} // namespace stakegov

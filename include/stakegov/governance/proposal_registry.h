// STAKEGOV - Proposal Registry
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#ifndef STAKEGOV_GOVERNANCE_PROPOSAL_REGISTRY_H
#define STAKEGOV_GOVERNANCE_PROPOSAL_REGISTRY_H

#include "stakegov/core/types.h"
#include "stakegov/governance/errors.h"
#include "stakegov/governance/params.h"
#include "stakegov/governance/proposal.h"

#include <map>
#include <vector>

namespace stakegov {
namespace governance {

class StakeLedger;

/**
 * Stores proposal records keyed by sequential id.
 * Records are never deleted.
 */
class ProposalRegistry {
public:
    /**
     * Create a new proposal.
     *
     * Checks, in order: title length (InvalidTitle), description length
     * (InvalidDescription), caller stake >= params.minProposalStake
     * (InsufficientStake), duration > 0 (InvalidAmount). The quorum is
     * snapshotted from the ledger's total at this instant.
     *
     * @return The new proposal id (proposal_count + 1)
     */
    OpResult<ProposalId> CreateProposal(const Identity& caller,
                                        const std::string& title,
                                        const std::string& description,
                                        Height duration,
                                        Height now,
                                        const StakeLedger& ledger,
                                        const GovernanceParams& params);

    const ProposalRecord* GetProposal(ProposalId id) const;

    /// Mutable access for the tally and the execution step
    ProposalRecord* GetMutableProposal(ProposalId id);

    /// Highest id handed out so far
    ProposalId GetProposalCount() const { return proposalCount_; }

    /// All proposals in ascending id order
    std::vector<ProposalRecord> ListProposals() const;

    std::vector<ProposalRecord> ListProposalsByCreator(const Identity& creator) const;

    const std::map<ProposalId, ProposalRecord>& GetProposals() const { return proposals_; }

    /// Replace contents with persisted records
    void Restore(const std::map<ProposalId, ProposalRecord>& proposals, ProposalId count);

    void Clear();

private:
    std::map<ProposalId, ProposalRecord> proposals_;
    ProposalId proposalCount_{0};
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_PROPOSAL_REGISTRY_H

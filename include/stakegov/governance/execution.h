// STAKEGOV - Execution Oracle
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Pure decisions over a proposal record and the clock, plus the terminal
// execution transition.

#ifndef STAKEGOV_GOVERNANCE_EXECUTION_H
#define STAKEGOV_GOVERNANCE_EXECUTION_H

#include "stakegov/governance/errors.h"
#include "stakegov/governance/proposal.h"

namespace stakegov {
namespace governance {

class ProposalRegistry;

/**
 * True iff quorum is met (yes + no >= minVotesRequired), yes > no,
 * the proposal has not been executed, and now >= endTime.
 */
bool IsExecutable(const ProposalRecord& proposal, Height now);

/// Outcome at time now, derived from the record; never persisted
ProposalOutcome EvaluateOutcome(const ProposalRecord& proposal, Height now);

/**
 * Mark a qualifying proposal executed. Anyone may trigger it.
 * Fails with InvalidState if the proposal is unknown or not executable.
 */
OpStatus ExecuteProposal(ProposalRegistry& registry, ProposalId id, Height now);

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_EXECUTION_H

// STAKEGOV - Governance Engine Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/engine.h"
#include "stakegov/governance/execution.h"
#include "stakegov/core/serialize.h"
#include "stakegov/crypto/sha256.h"
#include "stakegov/util/logging.h"

namespace stakegov {
namespace governance {

// ============================================================================
// State Validation
// ============================================================================

bool ValidateState(const GovernanceState& state, std::string& error) {
    Amount total = 0;
    for (const auto& [who, amount] : state.stakes) {
        if (amount <= 0 || !CheckedAdd(total, amount, total)) {
            error = "invalid stake for " + who.ToHex();
            return false;
        }
    }
    if (total != state.totalStaked) {
        error = "total staked " + std::to_string(state.totalStaked) +
                " does not match sum of stakes " + std::to_string(total);
        return false;
    }

    if (state.proposals.size() != state.proposalCount) {
        error = "proposal count " + std::to_string(state.proposalCount) +
                " does not match " + std::to_string(state.proposals.size()) + " records";
        return false;
    }

    std::map<ProposalId, std::pair<Amount, Amount>> tallies;
    ProposalId expected = 1;
    for (const auto& [id, record] : state.proposals) {
        if (id != expected || record.id != id) {
            error = "unexpected proposal id " + std::to_string(id);
            return false;
        }
        ++expected;
        if (!IsTextWithinBounds(record.title, MIN_TITLE_LENGTH, MAX_TITLE_LENGTH) ||
            !IsTextWithinBounds(record.description, MIN_DESCRIPTION_LENGTH,
                                MAX_DESCRIPTION_LENGTH)) {
            error = "proposal " + std::to_string(id) + " has out-of-bounds text";
            return false;
        }
        if (record.executed != (record.status == ProposalStatus::Executed)) {
            error = "proposal " + std::to_string(id) + " has inconsistent execution state";
            return false;
        }
        tallies[id] = {0, 0};
    }

    for (const auto& [key, vote] : state.votes) {
        if (key.first != vote.proposalId || key.second != vote.voter) {
            error = "vote key does not match its record";
            return false;
        }
        auto it = tallies.find(vote.proposalId);
        if (it == tallies.end()) {
            error = "vote references unknown proposal " + std::to_string(vote.proposalId);
            return false;
        }
        Amount& side = vote.support ? it->second.first : it->second.second;
        if (vote.weight <= 0 || !CheckedAdd(side, vote.weight, side)) {
            error = "invalid vote weight on proposal " + std::to_string(vote.proposalId);
            return false;
        }
    }

    for (const auto& [id, record] : state.proposals) {
        const auto& [yes, no] = tallies[id];
        if (record.yesWeight != yes || record.noWeight != no) {
            error = "tally of proposal " + std::to_string(id) + " does not match its votes";
            return false;
        }
    }

    return true;
}

// ============================================================================
// GovernanceEngine
// ============================================================================

GovernanceEngine::GovernanceEngine(const GovernanceParams& params, const IClock& clock,
                                   IValueCustody& custody)
    : params_(params), clock_(clock), custody_(custody) {}

OpResult<Amount> GovernanceEngine::Stake(const Identity& caller, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = ledger_.CommitStake(caller, amount, custody_, params_.custodyAccount);
    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "stake of " << amount << " by "
                                          << caller.ToHex() << " rejected: "
                                          << GovernanceErrorToString(result.error);
        return result;
    }

    LOG_INFO(util::LogCategory::GOV) << caller.ToHex() << " staked " << amount
                                     << " (now " << result.value << ", total "
                                     << ledger_.GetTotalStaked() << ")";
    return result;
}

OpResult<ProposalId> GovernanceEngine::CreateProposal(const Identity& caller,
                                                      const std::string& title,
                                                      const std::string& description,
                                                      Height duration) {
    std::lock_guard<std::mutex> lock(mutex_);

    Height now = clock_.Now();
    auto result = registry_.CreateProposal(caller, title, description, duration,
                                           now, ledger_, params_);
    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "proposal by " << caller.ToHex()
                                          << " rejected: "
                                          << GovernanceErrorToString(result.error);
        return result;
    }

    const ProposalRecord* record = registry_.GetProposal(result.value);
    LogInfoF(util::LogCategory::GOV,
             "proposal %llu created by %s, voting %lld..%lld, quorum %lld",
             static_cast<unsigned long long>(result.value), caller.ToHex().c_str(),
             static_cast<long long>(record->startTime),
             static_cast<long long>(record->endTime),
             static_cast<long long>(record->minVotesRequired));
    return result;
}

OpStatus GovernanceEngine::Vote(const Identity& caller, ProposalId id, bool support) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = tally_.CastVote(caller, id, support, clock_.Now(), registry_, ledger_);
    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "vote by " << caller.ToHex()
                                          << " on proposal " << id << " rejected: "
                                          << GovernanceErrorToString(result.error);
        return result;
    }

    const ProposalRecord* record = registry_.GetProposal(id);
    LOG_INFO(util::LogCategory::GOV) << caller.ToHex() << " voted "
                                     << (support ? "yes" : "no") << " on proposal " << id
                                     << " (yes " << record->yesWeight
                                     << ", no " << record->noWeight << ")";
    return result;
}

OpStatus GovernanceEngine::ExecuteProposal(const Identity& caller, ProposalId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = governance::ExecuteProposal(registry_, id, clock_.Now());
    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << "execution of proposal " << id << " by "
                                          << caller.ToHex() << " rejected: "
                                          << GovernanceErrorToString(result.error);
        return result;
    }

    LOG_INFO(util::LogCategory::GOV) << "proposal " << id << " executed by " << caller.ToHex();
    return result;
}

std::optional<ProposalRecord> GovernanceEngine::GetProposal(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProposalRecord* record = registry_.GetProposal(id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

Amount GovernanceEngine::GetStake(const Identity& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetStake(who);
}

std::optional<VoteRecord> GovernanceEngine::GetVote(ProposalId id, const Identity& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tally_.GetVote(id, voter);
}

Amount GovernanceEngine::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetTotalStaked();
}

bool GovernanceEngine::IsExecutable(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProposalRecord* record = registry_.GetProposal(id);
    return record && governance::IsExecutable(*record, clock_.Now());
}

ProposalId GovernanceEngine::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.GetProposalCount();
}

std::vector<ProposalRecord> GovernanceEngine::ListProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.ListProposals();
}

std::vector<ProposalRecord> GovernanceEngine::ListProposalsByCreator(const Identity& creator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.ListProposalsByCreator(creator);
}

std::vector<VoteRecord> GovernanceEngine::GetVotes(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tally_.GetVotes(id);
}

std::optional<ProposalOutcome> GovernanceEngine::EvaluateOutcome(ProposalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProposalRecord* record = registry_.GetProposal(id);
    if (!record) {
        return std::nullopt;
    }
    return governance::EvaluateOutcome(*record, clock_.Now());
}

Hash256 GovernanceEngine::StateHash() const {
    std::lock_guard<std::mutex> lock(mutex_);

    DataStream ss;
    WriteCompactSize(ss, ledger_.GetStakes().size());
    for (const auto& [who, amount] : ledger_.GetStakes()) {
        ss << who << amount;
    }
    ss << ledger_.GetTotalStaked() << registry_.GetProposalCount();

    WriteCompactSize(ss, registry_.GetProposals().size());
    for (const auto& [id, record] : registry_.GetProposals()) {
        std::vector<Byte> bytes = record.Serialize();
        WriteCompactSize(ss, bytes.size());
        ss.Write(bytes.data(), bytes.size());
    }

    WriteCompactSize(ss, tally_.GetAllVotes().size());
    for (const auto& [key, vote] : tally_.GetAllVotes()) {
        std::vector<Byte> bytes = vote.Serialize();
        WriteCompactSize(ss, bytes.size());
        ss.Write(bytes.data(), bytes.size());
    }

    return SHA256Hash(ss.data(), ss.size());
}

GovernanceState GovernanceEngine::ExportState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    GovernanceState state;
    state.stakes = ledger_.GetStakes();
    state.proposals = registry_.GetProposals();
    state.votes = tally_.GetAllVotes();
    state.proposalCount = registry_.GetProposalCount();
    state.totalStaked = ledger_.GetTotalStaked();
    return state;
}

bool GovernanceEngine::ImportState(const GovernanceState& state, std::string& error) {
    if (!ValidateState(state, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.Restore(state.stakes)) {
        error = "stake records overflow";
        return false;
    }
    registry_.Restore(state.proposals, state.proposalCount);
    tally_.Restore(state.votes);

    LOG_DEBUG(util::LogCategory::GOV) << "loaded " << state.stakes.size() << " stakes, "
                                      << state.proposals.size() << " proposals, "
                                      << state.votes.size() << " votes";
    return true;
}

} // namespace governance
} // namespace stakegov

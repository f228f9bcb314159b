// STAKEGOV - Proposal and Vote Records
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#ifndef STAKEGOV_GOVERNANCE_PROPOSAL_H
#define STAKEGOV_GOVERNANCE_PROPOSAL_H

#include "stakegov/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakegov {
namespace governance {

/// Sequential proposal identifier, starting at 1
using ProposalId = uint64_t;

// ============================================================================
// Proposal Status
// ============================================================================

/// Persisted lifecycle state. There is no failed state: a proposal that
/// closes without passing stays Active (see ProposalOutcome).
enum class ProposalStatus : uint8_t {
    Active = 0,
    Executed = 1,
};

const char* ProposalStatusToString(ProposalStatus status);

/// Outcome derived at query time from a record and the clock; never stored
enum class ProposalOutcome {
    /// Window still open
    Voting,

    /// Window closed and executable, awaiting execution
    Passed,

    /// Window closed without quorum or majority
    Failed,

    Executed,
};

const char* ProposalOutcomeToString(ProposalOutcome outcome);

// ============================================================================
// Proposal Record
// ============================================================================

struct ProposalRecord {
    ProposalId id{0};

    Identity creator;

    std::string title;
    std::string description;

    /// Voting window [startTime, endTime], both inclusive
    Height startTime{0};
    Height endTime{0};

    ProposalStatus status{ProposalStatus::Active};

    Amount yesWeight{0};
    Amount noWeight{0};

    bool executed{false};

    /// Quorum fixed at creation: total_staked / 10 at that instant
    Amount minVotesRequired{0};

    /// yes + no
    Amount GetTotalVotes() const { return yesWeight + noWeight; }

    bool HasQuorum() const { return GetTotalVotes() >= minVotesRequired; }

    /// Strict majority; a tie fails
    bool HasMajority() const { return yesWeight > noWeight; }

    /// Active status and startTime <= now <= endTime
    bool IsVotingOpen(Height now) const;

    std::vector<Byte> Serialize() const;

    static std::optional<ProposalRecord> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Vote Record
// ============================================================================

/// One voter's ballot on one proposal. Immutable once cast.
struct VoteRecord {
    ProposalId proposalId{0};
    Identity voter;

    /// true = for, false = against
    bool support{false};

    /// Voter's stake when the vote was cast
    Amount weight{0};

    std::vector<Byte> Serialize() const;

    static std::optional<VoteRecord> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Text Bounds
// ============================================================================

/// Number of UTF-8 code points in text, or nullopt if it is not valid UTF-8
std::optional<size_t> Utf8Length(const std::string& text);

/// True if text is valid UTF-8 with minLen <= length <= maxLen code points
bool IsTextWithinBounds(const std::string& text, size_t minLen, size_t maxLen);

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_PROPOSAL_H

// STAKEGOV - Governance Errors
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#ifndef STAKEGOV_GOVERNANCE_ERRORS_H
#define STAKEGOV_GOVERNANCE_ERRORS_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace stakegov {
namespace governance {

/// Reason a governance operation was rejected
enum class GovernanceError {
    Ok,

    /// Reserved; no operation currently requires authorization
    NotAuthorized,

    /// Unknown proposal id
    ProposalNotFound,

    /// Non-positive stake or duration, or a value that would overflow
    InvalidAmount,

    /// A vote already exists for (proposal, voter)
    AlreadyVoted,

    /// Reserved; closed windows are reported as ProposalNotActive
    ProposalExpired,

    /// Below the proposal minimum, or no stake at all when voting
    InsufficientStake,

    /// Outside the voting window or already executed
    ProposalNotActive,

    /// Execution preconditions not met
    InvalidState,

    InvalidTitle,
    InvalidDescription,

    /// Reserved; a boolean direction is always well formed
    InvalidVote,
};

/// Convert error to its name ("ProposalNotFound", ...)
const char* GovernanceErrorToString(GovernanceError error);

/// Stable numeric code: 0 for Ok, 100..110 for the error kinds in declaration order
uint32_t GovernanceErrorCode(GovernanceError error);

/// Empty payload for operations that only acknowledge success
struct Ack {};

/**
 * Outcome of a mutating governance operation.
 *
 * Either ok() with a value, or a failure carrying the first violated
 * precondition. A failed operation has no observable effect.
 */
template<typename T>
struct OpResult {
    GovernanceError error{GovernanceError::Ok};
    T value{};

    bool ok() const { return error == GovernanceError::Ok; }
    explicit operator bool() const { return ok(); }

    static OpResult Success(T v = T{}) {
        OpResult r;
        r.value = std::move(v);
        return r;
    }

    static OpResult Failure(GovernanceError e) {
        OpResult r;
        r.error = e;
        return r;
    }
};

using OpStatus = OpResult<Ack>;

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_ERRORS_H

// STAKEGOV - Governance Errors Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/errors.h"

namespace stakegov {
namespace governance {

const char* GovernanceErrorToString(GovernanceError error) {
    switch (error) {
        case GovernanceError::Ok: return "Ok";
        case GovernanceError::NotAuthorized: return "NotAuthorized";
        case GovernanceError::ProposalNotFound: return "ProposalNotFound";
        case GovernanceError::InvalidAmount: return "InvalidAmount";
        case GovernanceError::AlreadyVoted: return "AlreadyVoted";
        case GovernanceError::ProposalExpired: return "ProposalExpired";
        case GovernanceError::InsufficientStake: return "InsufficientStake";
        case GovernanceError::ProposalNotActive: return "ProposalNotActive";
        case GovernanceError::InvalidState: return "InvalidState";
        case GovernanceError::InvalidTitle: return "InvalidTitle";
        case GovernanceError::InvalidDescription: return "InvalidDescription";
        case GovernanceError::InvalidVote: return "InvalidVote";
    }
    return "Unknown";
}

uint32_t GovernanceErrorCode(GovernanceError error) {
    if (error == GovernanceError::Ok) {
        return 0;
    }
    return 99 + static_cast<uint32_t>(error);
}

} // namespace governance
} // namespace stakegov

// STAKEGOV - Governance Parameters
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Deployment constants, fixed for the lifetime of an engine.

#ifndef STAKEGOV_GOVERNANCE_PARAMS_H
#define STAKEGOV_GOVERNANCE_PARAMS_H

#include "stakegov/core/types.h"

#include <string>

namespace stakegov {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Default minimum stake required to create a proposal
constexpr Amount DEFAULT_MIN_PROPOSAL_STAKE = 100000;

/// Default voting window length (blocks)
constexpr Height DEFAULT_PROPOSAL_DURATION = 144;

/// Quorum is total_staked / QUORUM_DIVISOR (10%), rounded down
constexpr Amount QUORUM_DIVISOR = 10;

/// Title length bounds, in characters
constexpr size_t MIN_TITLE_LENGTH = 1;
constexpr size_t MAX_TITLE_LENGTH = 50;

/// Description length bounds, in characters
constexpr size_t MIN_DESCRIPTION_LENGTH = 1;
constexpr size_t MAX_DESCRIPTION_LENGTH = 500;

/// Label hashed into the default custody account identity
constexpr const char* DEFAULT_CUSTODY_LABEL = "stakegov.custody";

struct GovernanceParams {
    Amount minProposalStake{DEFAULT_MIN_PROPOSAL_STAKE};

    /// Duration used by tooling when the caller does not give one
    Height defaultDuration{DEFAULT_PROPOSAL_DURATION};

    /// Account that receives staked value
    Identity custodyAccount{Identity::FromLabel(DEFAULT_CUSTODY_LABEL)};

    /// Read minproposalstake, proposalduration and custodyaccount.
    /// Missing keys keep their defaults; a malformed or out-of-range
    /// value makes this return false with a message in error.
    static bool FromConfig(const util::ConfigManager& config,
                           GovernanceParams& out, std::string& error);
};

} // namespace governance
} // namespace stakegov

#endif // STAKEGOV_GOVERNANCE_PARAMS_H

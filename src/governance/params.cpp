// STAKEGOV - Governance Parameters Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/params.h"
#include "stakegov/util/config.h"

namespace stakegov {
namespace governance {

bool GovernanceParams::FromConfig(const util::ConfigManager& config,
                                  GovernanceParams& out, std::string& error) {
    GovernanceParams params;

    if (auto raw = config.TryGetString(util::ConfigKeys::MINPROPOSALSTAKE)) {
        auto value = util::ConfigManager::ParseInt(*raw);
        if (!value || *value <= 0) {
            error = "Invalid minproposalstake '" + *raw + "': expected a positive integer";
            return false;
        }
        params.minProposalStake = *value;
    }

    if (auto raw = config.TryGetString(util::ConfigKeys::PROPOSALDURATION)) {
        auto value = util::ConfigManager::ParseInt(*raw);
        if (!value || *value <= 0) {
            error = "Invalid proposalduration '" + *raw + "': expected a positive integer";
            return false;
        }
        params.defaultDuration = *value;
    }

    if (auto raw = config.TryGetString(util::ConfigKeys::CUSTODYACCOUNT)) {
        try {
            params.custodyAccount = Identity::FromHex(*raw);
        } catch (const std::invalid_argument& e) {
            error = "Invalid custodyaccount '" + *raw + "': " + e.what();
            return false;
        }
    }

    out = params;
    return true;
}

} // namespace governance
} // namespace stakegov

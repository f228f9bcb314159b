// STAKEGOV - Proposal and Vote Records Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/proposal.h"
#include "stakegov/core/serialize.h"

#include <sstream>

namespace stakegov {
namespace governance {

// ============================================================================
// Enum Strings
// ============================================================================

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Active: return "active";
        case ProposalStatus::Executed: return "executed";
    }
    return "unknown";
}

const char* ProposalOutcomeToString(ProposalOutcome outcome) {
    switch (outcome) {
        case ProposalOutcome::Voting: return "voting";
        case ProposalOutcome::Passed: return "passed";
        case ProposalOutcome::Failed: return "failed";
        case ProposalOutcome::Executed: return "executed";
    }
    return "unknown";
}

// ============================================================================
// ProposalRecord
// ============================================================================

bool ProposalRecord::IsVotingOpen(Height now) const {
    return status == ProposalStatus::Active &&
           startTime <= now && now <= endTime;
}

std::vector<Byte> ProposalRecord::Serialize() const {
    DataStream ss;
    ss << id << creator << title << description
       << startTime << endTime
       << static_cast<uint8_t>(status)
       << yesWeight << noWeight
       << executed
       << minVotesRequired;
    return std::vector<Byte>(ss.data(), ss.data() + ss.size());
}

std::optional<ProposalRecord> ProposalRecord::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        ProposalRecord record;
        uint8_t status = 0;

        ss >> record.id >> record.creator >> record.title >> record.description
           >> record.startTime >> record.endTime
           >> status
           >> record.yesWeight >> record.noWeight
           >> record.executed
           >> record.minVotesRequired;

        if (!ss.empty()) return std::nullopt;
        if (status > static_cast<uint8_t>(ProposalStatus::Executed)) return std::nullopt;
        record.status = static_cast<ProposalStatus>(status);

        if (record.id == 0) return std::nullopt;
        if (record.endTime < record.startTime) return std::nullopt;
        if (record.yesWeight < 0 || record.noWeight < 0 || record.minVotesRequired < 0) {
            return std::nullopt;
        }
        return record;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string ProposalRecord::ToString() const {
    std::ostringstream ss;
    ss << "Proposal { id: " << id
       << ", creator: " << creator.ToHex()
       << ", title: \"" << title << "\""
       << ", window: [" << startTime << ", " << endTime << "]"
       << ", status: " << ProposalStatusToString(status)
       << ", yes: " << yesWeight
       << ", no: " << noWeight
       << ", quorum: " << minVotesRequired
       << " }";
    return ss.str();
}

// ============================================================================
// VoteRecord
// ============================================================================

std::vector<Byte> VoteRecord::Serialize() const {
    DataStream ss;
    ss << proposalId << voter << support << weight;
    return std::vector<Byte>(ss.data(), ss.data() + ss.size());
}

std::optional<VoteRecord> VoteRecord::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return std::nullopt;
    }

    try {
        DataStream ss(data, len);
        VoteRecord vote;
        ss >> vote.proposalId >> vote.voter >> vote.support >> vote.weight;
        if (!ss.empty() || vote.proposalId == 0 || vote.weight <= 0) {
            return std::nullopt;
        }
        return vote;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string VoteRecord::ToString() const {
    std::ostringstream ss;
    ss << "Vote { proposal: " << proposalId
       << ", voter: " << voter.ToHex()
       << ", direction: " << (support ? "yes" : "no")
       << ", weight: " << weight
       << " }";
    return ss.str();
}

// ============================================================================
// Text Bounds
// ============================================================================

std::optional<size_t> Utf8Length(const std::string& text) {
    size_t count = 0;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return std::nullopt;
        }

        if (i + extra >= n) {
            return std::nullopt;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return std::nullopt;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return std::nullopt;
        }

        i += extra + 1;
        ++count;
    }
    return count;
}

bool IsTextWithinBounds(const std::string& text, size_t minLen, size_t maxLen) {
    auto length = Utf8Length(text);
    return length && *length >= minLen && *length <= maxLen;
}

} // namespace governance
} // namespace stakegov

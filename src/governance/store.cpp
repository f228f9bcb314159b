// STAKEGOV - Governance Store Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/governance/store.h"
#include "stakegov/core/serialize.h"
#include "stakegov/util/logging.h"

namespace stakegov {
namespace governance {

namespace {

constexpr char GOVERNANCE_PREFIXES[] = {
    db::prefix::STAKE,
    db::prefix::PROPOSAL,
    db::prefix::VOTE,
    db::prefix::GLOBAL,
    db::prefix::CUSTODY,
    db::prefix::CLOCK,
};

void AppendBigEndian64(std::string& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

uint64_t ReadBigEndian64(const char* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data[i]);
    }
    return value;
}

Identity ReadIdentity(const char* data) {
    return Identity(Hash160(reinterpret_cast<const Byte*>(data), Hash160::SIZE));
}

template<typename T>
std::string EncodeValue(const T& value) {
    DataStream ss;
    ss << value;
    return ss.ToString();
}

/// Decode a value that must consume the whole slice
template<typename T>
bool DecodeValue(const db::Slice& raw, T& out) {
    try {
        DataStream ss(reinterpret_cast<const Byte*>(raw.data()), raw.size());
        ss >> out;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

db::Status Corrupt(const std::string& what) {
    LOG_ERROR(util::LogCategory::DB) << "governance store corrupted: " << what;
    return db::Status::Corruption(what);
}

} // namespace

// ============================================================================
// Key Helpers
// ============================================================================

std::string GovernanceStore::StakeKey(const Identity& who) {
    return db::MakeKey(db::prefix::STAKE, who);
}

std::string GovernanceStore::ProposalKey(ProposalId id) {
    std::string key(1, db::prefix::PROPOSAL);
    AppendBigEndian64(key, id);
    return key;
}

std::string GovernanceStore::VoteKey(ProposalId id, const Identity& voter) {
    std::string key(1, db::prefix::VOTE);
    AppendBigEndian64(key, id);
    key.append(reinterpret_cast<const char*>(voter.data()), Identity::SIZE);
    return key;
}

std::string GovernanceStore::CustodyKey(const Identity& who) {
    return db::MakeKey(db::prefix::CUSTODY, who);
}

std::string GovernanceStore::CounterKey(const std::string& name) {
    return db::MakeKey(db::prefix::GLOBAL, db::Slice(name));
}

std::string GovernanceStore::HeightKey() {
    return db::MakeKey(db::prefix::CLOCK);
}

// ============================================================================
// Save
// ============================================================================

void GovernanceStore::DeletePrefix(char prefix, db::WriteBatch& batch) {
    std::string start(1, prefix);
    auto it = db_.NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        batch.Delete(it->key());
    }
}

db::Status GovernanceStore::Save(const GovernanceEngine& engine, const BalanceCustody& custody,
                                 Height height) {
    GovernanceState state = engine.ExportState();

    db::WriteBatch batch;
    for (char prefix : GOVERNANCE_PREFIXES) {
        DeletePrefix(prefix, batch);
    }

    for (const auto& [who, amount] : state.stakes) {
        batch.Put(StakeKey(who), EncodeValue(amount));
    }

    for (const auto& [id, record] : state.proposals) {
        std::vector<Byte> bytes = record.Serialize();
        batch.Put(ProposalKey(id),
                  db::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }

    for (const auto& [key, vote] : state.votes) {
        std::vector<Byte> bytes = vote.Serialize();
        batch.Put(VoteKey(key.first, key.second),
                  db::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }

    batch.Put(CounterKey(counter::PROPOSAL_COUNT), EncodeValue(state.proposalCount));
    batch.Put(CounterKey(counter::TOTAL_STAKED), EncodeValue(state.totalStaked));

    for (const auto& [who, balance] : custody.GetBalances()) {
        if (balance > 0) {
            batch.Put(CustodyKey(who), EncodeValue(balance));
        }
    }

    batch.Put(HeightKey(), EncodeValue(height));

    db::WriteOptions options;
    options.sync = true;
    db::Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "failed to save governance state: "
                                         << status.ToString();
        return status;
    }

    LOG_DEBUG(util::LogCategory::DB) << "saved governance state (" << batch.Count()
                                     << " operations) at height " << height;
    return status;
}

// ============================================================================
// Load
// ============================================================================

db::Status GovernanceStore::Load(GovernanceEngine& engine, BalanceCustody& custody,
                                 Height& height) {
    GovernanceState state;
    BalanceCustody balances;
    Height loadedHeight = 0;

    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        db::Slice value = it->value();
        if (key.empty()) {
            continue;
        }

        switch (key[0]) {
            case db::prefix::STAKE: {
                Amount amount = 0;
                if (key.size() != 1 + Identity::SIZE || !DecodeValue(value, amount)) {
                    return Corrupt("bad stake record");
                }
                state.stakes[ReadIdentity(key.data() + 1)] = amount;
                break;
            }
            case db::prefix::PROPOSAL: {
                if (key.size() != 1 + 8) {
                    return Corrupt("bad proposal key");
                }
                ProposalId id = ReadBigEndian64(key.data() + 1);
                auto record = ProposalRecord::Deserialize(
                    reinterpret_cast<const Byte*>(value.data()), value.size());
                if (!record || record->id != id) {
                    return Corrupt("bad proposal record " + std::to_string(id));
                }
                state.proposals[id] = *record;
                break;
            }
            case db::prefix::VOTE: {
                if (key.size() != 1 + 8 + Identity::SIZE) {
                    return Corrupt("bad vote key");
                }
                ProposalId id = ReadBigEndian64(key.data() + 1);
                Identity voter = ReadIdentity(key.data() + 9);
                auto vote = VoteRecord::Deserialize(
                    reinterpret_cast<const Byte*>(value.data()), value.size());
                if (!vote || vote->proposalId != id || vote->voter != voter) {
                    return Corrupt("bad vote record on proposal " + std::to_string(id));
                }
                state.votes[governance::VoteKey(id, voter)] = *vote;
                break;
            }
            case db::prefix::GLOBAL: {
                std::string name(key.data() + 1, key.size() - 1);
                bool ok = false;
                if (name == counter::PROPOSAL_COUNT) {
                    ok = DecodeValue(value, state.proposalCount);
                } else if (name == counter::TOTAL_STAKED) {
                    ok = DecodeValue(value, state.totalStaked);
                }
                if (!ok) {
                    return Corrupt("bad counter '" + name + "'");
                }
                break;
            }
            case db::prefix::CUSTODY: {
                Amount balance = 0;
                if (key.size() != 1 + Identity::SIZE || !DecodeValue(value, balance) ||
                    !balances.Credit(ReadIdentity(key.data() + 1), balance)) {
                    return Corrupt("bad custody balance");
                }
                break;
            }
            case db::prefix::CLOCK: {
                if (key.size() != 1 || !DecodeValue(value, loadedHeight) || loadedHeight < 0) {
                    return Corrupt("bad clock height");
                }
                break;
            }
            default:
                // Not ours
                break;
        }
    }

    db::Status iterStatus = it->status();
    if (!iterStatus.ok()) {
        return iterStatus;
    }

    const Identity& custodyAccount = engine.GetParams().custodyAccount;
    if (balances.GetBalance(custodyAccount) < state.totalStaked) {
        return Corrupt("custody balance " + std::to_string(balances.GetBalance(custodyAccount)) +
                       " does not cover total staked " + std::to_string(state.totalStaked));
    }

    std::string error;
    if (!engine.ImportState(state, error)) {
        return Corrupt(error);
    }
    custody = balances;
    height = loadedHeight;

    LOG_DEBUG(util::LogCategory::DB) << "loaded governance state at height " << height;
    return db::Status::Ok();
}

} // namespace governance
} // namespace stakegov

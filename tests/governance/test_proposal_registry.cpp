// STAKEGOV - Proposal Registry Tests
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include <gtest/gtest.h>
#include "stakegov/governance/collaborators.h"
#include "stakegov/governance/proposal_registry.h"
#include "stakegov/governance/stake_ledger.h"

#include <string>

using namespace stakegov;
using namespace stakegov::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class ProposalRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = Identity::FromLabel("alice");
        bob_ = Identity::FromLabel("bob");
        custody_.Credit(alice_, 10000000);
        custody_.Credit(bob_, 10000000);
    }

    void Stake(const Identity& who, Amount amount) {
        ASSERT_TRUE(ledger_.CommitStake(who, amount, custody_, params_.custodyAccount).ok());
    }

    OpResult<ProposalId> Create(const Identity& who,
                                const std::string& title = "Raise limit",
                                const std::string& description = "Raise the block limit",
                                Height duration = 144, Height now = 0) {
        return registry_.CreateProposal(who, title, description, duration, now,
                                        ledger_, params_);
    }

    GovernanceParams params_;
    BalanceCustody custody_;
    StakeLedger ledger_;
    ProposalRegistry registry_;
    Identity alice_;
    Identity bob_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(ProposalRegistryTest, CreateFirstProposal) {
    Stake(alice_, 100000);

    auto result = Create(alice_, "Raise limit", "Raise the block limit", 144, 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, 1u);
    EXPECT_EQ(registry_.GetProposalCount(), 1u);

    const ProposalRecord* p = registry_.GetProposal(1);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->id, 1u);
    EXPECT_EQ(p->creator, alice_);
    EXPECT_EQ(p->title, "Raise limit");
    EXPECT_EQ(p->startTime, 1000);
    EXPECT_EQ(p->endTime, 1144);
    EXPECT_EQ(p->status, ProposalStatus::Active);
    EXPECT_EQ(p->yesWeight, 0);
    EXPECT_EQ(p->noWeight, 0);
    EXPECT_FALSE(p->executed);
    EXPECT_EQ(p->minVotesRequired, 10000);
}

TEST_F(ProposalRegistryTest, IdsAreSequential) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_).value, 1u);
    EXPECT_EQ(Create(alice_).value, 2u);
    EXPECT_EQ(Create(alice_).value, 3u);
    EXPECT_EQ(registry_.GetProposalCount(), 3u);
}

TEST_F(ProposalRegistryTest, QuorumIsSnapshotAtCreation) {
    Stake(alice_, 100005);
    ASSERT_TRUE(Create(alice_).ok());
    EXPECT_EQ(registry_.GetProposal(1)->minVotesRequired, 10000);

    Stake(bob_, 900000);
    EXPECT_EQ(registry_.GetProposal(1)->minVotesRequired, 10000);

    ASSERT_TRUE(Create(alice_).ok());
    EXPECT_EQ(registry_.GetProposal(2)->minVotesRequired, 100000);
}

// ============================================================================
// Validation Order
// ============================================================================

TEST_F(ProposalRegistryTest, TitleBounds) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_, "").error, GovernanceError::InvalidTitle);
    EXPECT_EQ(Create(alice_, std::string(51, 't')).error, GovernanceError::InvalidTitle);
    EXPECT_TRUE(Create(alice_, std::string(50, 't')).ok());
    EXPECT_TRUE(Create(alice_, "t").ok());
}

TEST_F(ProposalRegistryTest, DescriptionBounds) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_, "ok", "").error, GovernanceError::InvalidDescription);
    EXPECT_EQ(Create(alice_, "ok", std::string(501, 'd')).error,
              GovernanceError::InvalidDescription);
    EXPECT_TRUE(Create(alice_, "ok", std::string(500, 'd')).ok());
}

TEST_F(ProposalRegistryTest, LengthsCountCharacters) {
    Stake(alice_, 100000);
    // 50 two-byte characters: 100 bytes, 50 characters
    std::string title;
    for (int i = 0; i < 50; ++i) title += "\xC3\xA9";
    EXPECT_TRUE(Create(alice_, title).ok());

    title += "\xC3\xA9";
    EXPECT_EQ(Create(alice_, title).error, GovernanceError::InvalidTitle);
}

TEST_F(ProposalRegistryTest, MalformedUtf8Rejected) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_, "bad\xC3").error, GovernanceError::InvalidTitle);
    EXPECT_EQ(Create(alice_, "ok", "\xFF").error, GovernanceError::InvalidDescription);
}

TEST_F(ProposalRegistryTest, InsufficientStake) {
    Stake(alice_, 99999);
    EXPECT_EQ(Create(alice_).error, GovernanceError::InsufficientStake);
    EXPECT_EQ(Create(bob_).error, GovernanceError::InsufficientStake);
    EXPECT_EQ(registry_.GetProposalCount(), 0u);
}

TEST_F(ProposalRegistryTest, ExactMinimumStakeAllowed) {
    Stake(alice_, params_.minProposalStake);
    EXPECT_TRUE(Create(alice_).ok());
}

TEST_F(ProposalRegistryTest, NonPositiveDuration) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_, "t", "d", 0).error, GovernanceError::InvalidAmount);
    EXPECT_EQ(Create(alice_, "t", "d", -1).error, GovernanceError::InvalidAmount);
    EXPECT_EQ(registry_.GetProposalCount(), 0u);
}

TEST_F(ProposalRegistryTest, EndTimeOverflow) {
    Stake(alice_, 100000);
    EXPECT_EQ(Create(alice_, "t", "d", MAX_AMOUNT, 1).error, GovernanceError::InvalidAmount);
}

TEST_F(ProposalRegistryTest, TitleCheckedBeforeDescription) {
    EXPECT_EQ(Create(bob_, "", "").error, GovernanceError::InvalidTitle);
}

TEST_F(ProposalRegistryTest, DescriptionCheckedBeforeStake) {
    EXPECT_EQ(Create(bob_, "t", "").error, GovernanceError::InvalidDescription);
}

TEST_F(ProposalRegistryTest, StakeCheckedBeforeDuration) {
    EXPECT_EQ(Create(bob_, "t", "d", 0).error, GovernanceError::InsufficientStake);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(ProposalRegistryTest, UnknownIdReturnsNull) {
    EXPECT_EQ(registry_.GetProposal(0), nullptr);
    EXPECT_EQ(registry_.GetProposal(42), nullptr);
}

TEST_F(ProposalRegistryTest, ListByCreator) {
    Stake(alice_, 100000);
    Stake(bob_, 100000);
    Create(alice_);
    Create(bob_);
    Create(alice_);

    auto all = registry_.ListProposals();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 1u);
    EXPECT_EQ(all[2].id, 3u);

    auto mine = registry_.ListProposalsByCreator(alice_);
    ASSERT_EQ(mine.size(), 2u);
    EXPECT_EQ(mine[0].id, 1u);
    EXPECT_EQ(mine[1].id, 3u);
}

// ============================================================================
// Records
// ============================================================================

TEST(ProposalRecordTest, SerializeRoundTrip) {
    ProposalRecord p;
    p.id = 7;
    p.creator = Identity::FromLabel("carol");
    p.title = "Title";
    p.description = "Description";
    p.startTime = 10;
    p.endTime = 20;
    p.status = ProposalStatus::Executed;
    p.executed = true;
    p.yesWeight = 500;
    p.noWeight = 100;
    p.minVotesRequired = 50;

    std::vector<Byte> bytes = p.Serialize();
    auto decoded = ProposalRecord::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, 7u);
    EXPECT_EQ(decoded->creator, p.creator);
    EXPECT_EQ(decoded->description, "Description");
    EXPECT_EQ(decoded->status, ProposalStatus::Executed);
    EXPECT_TRUE(decoded->executed);
    EXPECT_EQ(decoded->yesWeight, 500);
    EXPECT_EQ(decoded->minVotesRequired, 50);
}

TEST(ProposalRecordTest, DeserializeRejectsGarbage) {
    ProposalRecord p;
    p.id = 1;
    p.title = "t";
    p.description = "d";
    std::vector<Byte> bytes = p.Serialize();

    EXPECT_FALSE(ProposalRecord::Deserialize(bytes.data(), bytes.size() - 1).has_value());

    bytes.push_back(0);
    EXPECT_FALSE(ProposalRecord::Deserialize(bytes.data(), bytes.size()).has_value());

    ProposalRecord zero;
    zero.title = "t";
    zero.description = "d";
    std::vector<Byte> zeroBytes = zero.Serialize();
    EXPECT_FALSE(ProposalRecord::Deserialize(zeroBytes.data(), zeroBytes.size()).has_value());
}

TEST(ProposalRecordTest, QuorumAndMajority) {
    ProposalRecord p;
    p.minVotesRequired = 100;
    p.yesWeight = 50;
    p.noWeight = 50;
    EXPECT_TRUE(p.HasQuorum());
    EXPECT_FALSE(p.HasMajority());

    p.yesWeight = 51;
    p.noWeight = 48;
    EXPECT_FALSE(p.HasQuorum());
    EXPECT_TRUE(p.HasMajority());
}

TEST(ProposalRecordTest, VotingWindowIsInclusive) {
    ProposalRecord p;
    p.startTime = 10;
    p.endTime = 20;
    EXPECT_FALSE(p.IsVotingOpen(9));
    EXPECT_TRUE(p.IsVotingOpen(10));
    EXPECT_TRUE(p.IsVotingOpen(20));
    EXPECT_FALSE(p.IsVotingOpen(21));

    p.status = ProposalStatus::Executed;
    EXPECT_FALSE(p.IsVotingOpen(15));
}

TEST(Utf8Test, Length) {
    EXPECT_EQ(Utf8Length(""), 0u);
    EXPECT_EQ(Utf8Length("abc"), 3u);
    EXPECT_EQ(Utf8Length("\xE2\x82\xAC"), 1u);          // euro sign
    EXPECT_EQ(Utf8Length("\xF0\x9F\x98\x80"), 1u);      // emoji
    EXPECT_FALSE(Utf8Length("\xC0\xAF").has_value());    // overlong
    EXPECT_FALSE(Utf8Length("\xED\xA0\x80").has_value()); // surrogate
    EXPECT_FALSE(Utf8Length("\xE2\x82").has_value());    // truncated
}

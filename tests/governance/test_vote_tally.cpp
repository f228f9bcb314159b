// STAKEGOV - Vote Tally Tests
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include <gtest/gtest.h>
#include "stakegov/governance/collaborators.h"
#include "stakegov/governance/proposal_registry.h"
#include "stakegov/governance/stake_ledger.h"
#include "stakegov/governance/vote_tally.h"

using namespace stakegov;
using namespace stakegov::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class VoteTallyTest : public ::testing::Test {
protected:
    void SetUp() override {
        creator_ = Identity::FromLabel("creator");
        alice_ = Identity::FromLabel("alice");
        bob_ = Identity::FromLabel("bob");
        outsider_ = Identity::FromLabel("outsider");

        for (const auto& who : {creator_, alice_, bob_}) {
            custody_.Credit(who, 10000000);
        }
        Stake(creator_, 100000);
        Stake(alice_, 60000);
        Stake(bob_, 40000);

        // Window [100, 110]
        auto result = registry_.CreateProposal(creator_, "Title", "Description", 10, 100,
                                               ledger_, params_);
        ASSERT_TRUE(result.ok());
        id_ = result.value;
    }

    void Stake(const Identity& who, Amount amount) {
        ASSERT_TRUE(ledger_.CommitStake(who, amount, custody_, params_.custodyAccount).ok());
    }

    OpStatus Vote(const Identity& who, bool support, Height now = 105) {
        return tally_.CastVote(who, id_, support, now, registry_, ledger_);
    }

    const ProposalRecord& Proposal() const {
        return *registry_.GetProposal(id_);
    }

    GovernanceParams params_;
    BalanceCustody custody_;
    StakeLedger ledger_;
    ProposalRegistry registry_;
    VoteTally tally_;
    ProposalId id_{0};
    Identity creator_;
    Identity alice_;
    Identity bob_;
    Identity outsider_;
};

// ============================================================================
// Casting
// ============================================================================

TEST_F(VoteTallyTest, VoteForAddsYesWeight) {
    ASSERT_TRUE(Vote(alice_, true).ok());
    EXPECT_EQ(Proposal().yesWeight, 60000);
    EXPECT_EQ(Proposal().noWeight, 0);

    auto vote = tally_.GetVote(id_, alice_);
    ASSERT_TRUE(vote.has_value());
    EXPECT_EQ(vote->proposalId, id_);
    EXPECT_EQ(vote->voter, alice_);
    EXPECT_TRUE(vote->support);
    EXPECT_EQ(vote->weight, 60000);
}

TEST_F(VoteTallyTest, VoteAgainstAddsNoWeight) {
    ASSERT_TRUE(Vote(bob_, false).ok());
    EXPECT_EQ(Proposal().yesWeight, 0);
    EXPECT_EQ(Proposal().noWeight, 40000);
}

TEST_F(VoteTallyTest, WeightIsLiveStake) {
    Stake(alice_, 5000);
    ASSERT_TRUE(Vote(alice_, true).ok());
    EXPECT_EQ(tally_.GetVote(id_, alice_)->weight, 65000);

    // Stake added after voting does not change the recorded weight
    Stake(alice_, 1000);
    EXPECT_EQ(tally_.GetVote(id_, alice_)->weight, 65000);
    EXPECT_EQ(Proposal().yesWeight, 65000);
}

TEST_F(VoteTallyTest, WindowBoundaries) {
    EXPECT_EQ(Vote(alice_, true, 99).error, GovernanceError::ProposalNotActive);
    EXPECT_EQ(Vote(alice_, true, 111).error, GovernanceError::ProposalNotActive);
    EXPECT_TRUE(Vote(alice_, true, 100).ok());
    EXPECT_TRUE(Vote(bob_, false, 110).ok());
}

TEST_F(VoteTallyTest, AlreadyVoted) {
    ASSERT_TRUE(Vote(bob_, false).ok());
    EXPECT_EQ(Vote(bob_, false).error, GovernanceError::AlreadyVoted);
    EXPECT_EQ(Vote(bob_, true).error, GovernanceError::AlreadyVoted);
    EXPECT_EQ(Proposal().noWeight, 40000);
    EXPECT_EQ(Proposal().yesWeight, 0);
    EXPECT_FALSE(tally_.GetVote(id_, bob_)->support);
}

TEST_F(VoteTallyTest, ZeroStakeRejected) {
    EXPECT_EQ(Vote(outsider_, true).error, GovernanceError::InsufficientStake);
    EXPECT_FALSE(tally_.HasVoted(id_, outsider_));
}

TEST_F(VoteTallyTest, UnknownProposal) {
    EXPECT_EQ(tally_.CastVote(alice_, 99, true, 105, registry_, ledger_).error,
              GovernanceError::ProposalNotFound);
}

TEST_F(VoteTallyTest, ExecutedProposalNotActive) {
    registry_.GetMutableProposal(id_)->status = ProposalStatus::Executed;
    registry_.GetMutableProposal(id_)->executed = true;
    EXPECT_EQ(Vote(alice_, true).error, GovernanceError::ProposalNotActive);
}

// ============================================================================
// Check Order
// ============================================================================

TEST_F(VoteTallyTest, NotFoundBeforeEverything) {
    EXPECT_EQ(tally_.CastVote(outsider_, 99, true, 5000, registry_, ledger_).error,
              GovernanceError::ProposalNotFound);
}

TEST_F(VoteTallyTest, NotActiveBeforeStake) {
    EXPECT_EQ(Vote(outsider_, true, 500).error, GovernanceError::ProposalNotActive);
}

TEST_F(VoteTallyTest, NotActiveBeforeAlreadyVoted) {
    ASSERT_TRUE(Vote(alice_, true).ok());
    EXPECT_EQ(Vote(alice_, true, 200).error, GovernanceError::ProposalNotActive);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(VoteTallyTest, GetVotesOnlyReturnsThatProposal) {
    auto second = registry_.CreateProposal(creator_, "Second", "Another", 10, 100,
                                           ledger_, params_);
    ASSERT_TRUE(second.ok());

    ASSERT_TRUE(Vote(alice_, true).ok());
    ASSERT_TRUE(Vote(bob_, false).ok());
    ASSERT_TRUE(tally_.CastVote(alice_, second.value, false, 105, registry_, ledger_).ok());

    EXPECT_EQ(tally_.GetVotes(id_).size(), 2u);
    auto votes = tally_.GetVotes(second.value);
    ASSERT_EQ(votes.size(), 1u);
    EXPECT_EQ(votes[0].voter, alice_);
    EXPECT_EQ(tally_.GetAllVotes().size(), 3u);
}

TEST_F(VoteTallyTest, TallyEqualsSumOfVotes) {
    ASSERT_TRUE(Vote(alice_, true).ok());
    ASSERT_TRUE(Vote(bob_, false).ok());
    ASSERT_TRUE(Vote(creator_, true).ok());

    Amount yes = 0, no = 0;
    for (const auto& vote : tally_.GetVotes(id_)) {
        (vote.support ? yes : no) += vote.weight;
    }
    EXPECT_EQ(Proposal().yesWeight, yes);
    EXPECT_EQ(Proposal().noWeight, no);
}

TEST_F(VoteTallyTest, MissingVoteIsNullopt) {
    EXPECT_FALSE(tally_.GetVote(id_, alice_).has_value());
    EXPECT_FALSE(tally_.GetVote(77, alice_).has_value());
}

TEST(VoteRecordTest, DeserializeRequiresPositiveWeight) {
    VoteRecord vote;
    vote.proposalId = 1;
    vote.voter = Identity::FromLabel("v");
    vote.support = true;
    vote.weight = 10;

    auto bytes = vote.Serialize();
    auto decoded = VoteRecord::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->weight, 10);

    vote.weight = 0;
    bytes = vote.Serialize();
    EXPECT_FALSE(VoteRecord::Deserialize(bytes.data(), bytes.size()).has_value());
}

// STAKEGOV - Governance Store Tests
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include <gtest/gtest.h>
#include "stakegov/governance/store.h"
#include "stakegov/core/serialize.h"

#include <filesystem>
#include <random>

using namespace stakegov;
using namespace stakegov::governance;

// ============================================================================
// Test Fixture
// ============================================================================

class GovernanceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = Identity::FromLabel("alice");
        bob_ = Identity::FromLabel("bob");
        custody_.Credit(alice_, 500000);
        custody_.Credit(bob_, 500000);
        engine_ = std::make_unique<GovernanceEngine>(params_, clock_, custody_);
    }

    /// Two stakers, one proposal with one vote
    ProposalId Populate() {
        EXPECT_TRUE(engine_->Stake(alice_, 100000).ok());
        EXPECT_TRUE(engine_->Stake(bob_, 2500).ok());
        auto created = engine_->CreateProposal(alice_, "Title", "Description", 20);
        EXPECT_TRUE(created.ok());
        EXPECT_TRUE(engine_->Vote(bob_, created.value, false).ok());
        return created.value;
    }

    GovernanceParams params_;
    ManualClock clock_{50};
    BalanceCustody custody_;
    std::unique_ptr<GovernanceEngine> engine_;
    db::MemoryDatabase db_;
    Identity alice_;
    Identity bob_;
};

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(GovernanceStoreTest, EmptyDatabaseLoadsEmptyState) {
    GovernanceStore store(db_);
    BalanceCustody custody;
    Height height = 99;
    ASSERT_TRUE(store.Load(*engine_, custody, height).ok());
    EXPECT_EQ(height, 0);
    EXPECT_EQ(engine_->GetProposalCount(), 0u);
    EXPECT_TRUE(custody.GetBalances().empty());
}

TEST_F(GovernanceStoreTest, SaveAndLoad) {
    ProposalId id = Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, clock_.Now()).ok());

    ManualClock clock2;
    BalanceCustody custody2;
    GovernanceEngine engine2(params_, clock2, custody2);
    Height height = 0;
    ASSERT_TRUE(store.Load(engine2, custody2, height).ok());

    EXPECT_EQ(height, 50);
    EXPECT_EQ(engine2.StateHash(), engine_->StateHash());
    EXPECT_EQ(engine2.GetStake(alice_), 100000);
    EXPECT_EQ(engine2.GetTotalStaked(), 102500);
    EXPECT_EQ(engine2.GetProposal(id)->noWeight, 2500);
    EXPECT_EQ(engine2.GetVote(id, bob_)->weight, 2500);
    EXPECT_EQ(custody2.GetBalance(alice_), 400000);
    EXPECT_EQ(custody2.GetBalance(params_.custodyAccount), 102500);
}

TEST_F(GovernanceStoreTest, SaveReplacesPreviousState) {
    GovernanceStore store(db_);
    Populate();
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    ManualClock freshClock;
    BalanceCustody freshCustody;
    GovernanceEngine fresh(params_, freshClock, freshCustody);
    ASSERT_TRUE(store.Save(fresh, freshCustody, 60).ok());

    GovernanceEngine loaded(params_, freshClock, freshCustody);
    Height height = 0;
    ASSERT_TRUE(store.Load(loaded, freshCustody, height).ok());
    EXPECT_EQ(height, 60);
    EXPECT_EQ(loaded.GetTotalStaked(), 0);
    EXPECT_EQ(loaded.GetProposalCount(), 0u);
}

TEST_F(GovernanceStoreTest, ForeignKeysIgnored) {
    db_.Put(db::Slice("Zunrelated"), db::Slice("x"));
    Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    std::string value;
    EXPECT_TRUE(db_.Get(db::Slice("Zunrelated"), &value).ok());

    Height height = 0;
    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    EXPECT_TRUE(store.Load(loaded, custody, height).ok());
}

TEST_F(GovernanceStoreTest, ProposalKeysSortNumerically) {
    EXPECT_LT(GovernanceStore::ProposalKey(2), GovernanceStore::ProposalKey(10));
    EXPECT_LT(GovernanceStore::ProposalKey(255), GovernanceStore::ProposalKey(256));
    EXPECT_EQ(GovernanceStore::ProposalKey(1).size(), 9u);
    EXPECT_EQ(GovernanceStore::VoteKey(1, alice_).size(), 9u + Identity::SIZE);
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(GovernanceStoreTest, UndecodableRecordIsCorruption) {
    Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());
    db_.Put(db::Slice(GovernanceStore::ProposalKey(1)), db::Slice("garbage"));

    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    Height height = 7;
    db::Status status = store.Load(loaded, custody, height);
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_EQ(height, 7);
    EXPECT_EQ(loaded.GetProposalCount(), 0u);
}

TEST_F(GovernanceStoreTest, InconsistentTotalIsCorruption) {
    Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    DataStream ss;
    ss << static_cast<Amount>(1);
    db_.Put(db::Slice(GovernanceStore::CounterKey(counter::TOTAL_STAKED)),
            db::Slice(ss.ToString()));

    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    Height height = 0;
    EXPECT_TRUE(store.Load(loaded, custody, height).IsCorruption());
    EXPECT_EQ(loaded.GetTotalStaked(), 0);
    EXPECT_TRUE(custody.GetBalances().empty());
}

TEST_F(GovernanceStoreTest, VoteUnderWrongKeyIsCorruption) {
    ProposalId id = Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    std::string value;
    ASSERT_TRUE(db_.Get(db::Slice(GovernanceStore::VoteKey(id, bob_)), &value).ok());
    db_.Put(db::Slice(GovernanceStore::VoteKey(id, alice_)), db::Slice(value));

    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    Height height = 0;
    EXPECT_TRUE(store.Load(loaded, custody, height).IsCorruption());
}

TEST_F(GovernanceStoreTest, OverlongStoredTitleIsCorruption) {
    ProposalId id = Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    ProposalRecord tampered = *engine_->GetProposal(id);
    tampered.title = std::string(51, 'x');
    std::vector<Byte> bytes = tampered.Serialize();
    db_.Put(db::Slice(GovernanceStore::ProposalKey(id)),
            db::Slice(reinterpret_cast<const char*>(bytes.data()), bytes.size()));

    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    Height height = 0;
    EXPECT_TRUE(store.Load(loaded, custody, height).IsCorruption());
    EXPECT_EQ(loaded.GetProposalCount(), 0u);
}

TEST_F(GovernanceStoreTest, CustodyBelowTotalStakedIsCorruption) {
    Populate();
    GovernanceStore store(db_);
    ASSERT_TRUE(store.Save(*engine_, custody_, 50).ok());

    DataStream ss;
    ss << static_cast<Amount>(100);
    db_.Put(db::Slice(GovernanceStore::CustodyKey(params_.custodyAccount)),
            db::Slice(ss.ToString()));

    BalanceCustody custody;
    GovernanceEngine loaded(params_, clock_, custody);
    Height height = 0;
    EXPECT_TRUE(store.Load(loaded, custody, height).IsCorruption());
    EXPECT_EQ(loaded.GetTotalStaked(), 0);
    EXPECT_TRUE(custody.GetBalances().empty());

    db_.Delete(db::Slice(GovernanceStore::CustodyKey(params_.custodyAccount)));
    EXPECT_TRUE(store.Load(loaded, custody, height).IsCorruption());
}

TEST_F(GovernanceStoreTest, NegativeHeightIsCorruption) {
    DataStream ss;
    ss << static_cast<Height>(-1);
    db_.Put(db::Slice(GovernanceStore::HeightKey()), db::Slice(ss.ToString()));

    GovernanceStore store(db_);
    BalanceCustody custody;
    Height height = 0;
    EXPECT_TRUE(store.Load(*engine_, custody, height).IsCorruption());
}

// ============================================================================
// LevelDB Backend
// ============================================================================

TEST_F(GovernanceStoreTest, LevelDBRoundTrip) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("stakegov_store_test_" + std::to_string(rd()));
    Hash256 expected;
    {
        auto [status, database] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        Populate();
        expected = engine_->StateHash();
        GovernanceStore store(*database);
        ASSERT_TRUE(store.Save(*engine_, custody_, 77).ok());
    }
    {
        auto [status, database] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        GovernanceStore store(*database);
        ManualClock clock;
        BalanceCustody custody;
        GovernanceEngine loaded(params_, clock, custody);
        Height height = 0;
        ASSERT_TRUE(store.Load(loaded, custody, height).ok());
        EXPECT_EQ(height, 77);
        EXPECT_EQ(loaded.StateHash(), expected);
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

// STAKEGOV - Database Tests
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include <gtest/gtest.h>
#include "stakegov/db/database.h"
#include "stakegov/db/leveldb.h"
#include "stakegov/core/types.h"
#include <filesystem>
#include <cstring>
#include <random>

using namespace stakegov;
using namespace stakegov::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakegov_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open(const std::string& name = "test_db") {
        auto [status, db] = OpenDatabase(testDir_ / name);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_NE(dynamic_cast<LevelDBDatabase*>(db.get()), nullptr);
}

TEST_F(DatabaseTest, ConcreteClassKeepsShortOverloads) {
    auto db = Open();
    auto* level = dynamic_cast<LevelDBDatabase*>(db.get());
    ASSERT_NE(level, nullptr);

    ASSERT_TRUE(level->Put(Slice("k"), Slice("v")).ok());
    std::string value;
    ASSERT_TRUE(level->Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");

    WriteBatch batch;
    batch.Delete(Slice("k"));
    ASSERT_TRUE(level->Write(&batch).ok());
    EXPECT_TRUE(level->Get(Slice("k"), &value).IsNotFound());

    ASSERT_TRUE(level->Put(Slice("k2"), Slice("v2")).ok());
    ASSERT_TRUE(level->Delete(Slice("k2")).ok());
    auto iter = level->NewIterator();
    iter->SeekToFirst();
    EXPECT_FALSE(iter->Valid());
}

TEST_F(DatabaseTest, PutAndGet) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    Status s = db->Get(Slice("key1"), &value);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(value, "value1");
}

TEST_F(DatabaseTest, GetNotFound) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    std::string value;
    EXPECT_TRUE(db->Get(Slice("nonexistent"), &value).IsNotFound());
    EXPECT_FALSE(db->Exists(Slice("nonexistent")));
}

TEST_F(DatabaseTest, Delete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    db->Put(Slice("key1"), Slice("value1"));
    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_FALSE(db->Exists(Slice("key1")));
}

TEST_F(DatabaseTest, WriteBatch) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    db->Put(Slice("stale"), Slice("x"));

    db::WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("stale"));
    EXPECT_EQ(batch.Count(), 3u);

    WriteOptions options;
    options.sync = true;
    ASSERT_TRUE(db->Write(options, &batch).ok());

    EXPECT_TRUE(db->Exists(Slice("a")));
    EXPECT_TRUE(db->Exists(Slice("b")));
    EXPECT_FALSE(db->Exists(Slice("stale")));
}

TEST_F(DatabaseTest, IteratorIsOrdered) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    db->Put(Slice("c"), Slice("3"));
    db->Put(Slice("a"), Slice("1"));
    db->Put(Slice("b"), Slice("2"));

    std::vector<std::string> keys;
    auto iter = db->NewIterator();
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        keys.push_back(iter->key().ToString());
    }
    EXPECT_TRUE(iter->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        db->Put(Slice("persist"), Slice("yes"));
    }
    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, OpenTwiceFails) {
    auto first = Open();
    ASSERT_NE(first, nullptr);

    auto [status, second] = OpenDatabase(testDir_ / "test_db");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(second, nullptr);
}

TEST_F(DatabaseTest, DestroyDatabase) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        db->Put(Slice("k"), Slice("v"));
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "test_db").ok());

    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists(Slice("k")));
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST(MemoryDatabaseTest, Basic) {
    MemoryDatabase db;
    db.Put(Slice("key"), Slice("value"));
    EXPECT_EQ(db.Size(), 1u);

    std::string value;
    ASSERT_TRUE(db.Get(Slice("key"), &value).ok());
    EXPECT_EQ(value, "value");

    db.Delete(Slice("key"));
    EXPECT_TRUE(db.Get(Slice("key"), &value).IsNotFound());
}

TEST(MemoryDatabaseTest, SeekWithPrefix) {
    MemoryDatabase db;
    db.Put(Slice("A1"), Slice(""));
    db.Put(Slice("P1"), Slice(""));
    db.Put(Slice("P2"), Slice(""));
    db.Put(Slice("S1"), Slice(""));

    std::vector<std::string> keys;
    auto iter = db.NewIterator();
    for (iter->Seek(Slice("P")); iter->Valid() && iter->key().starts_with(Slice("P"));
         iter->Next()) {
        keys.push_back(iter->key().ToString());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"P1", "P2"}));
}

TEST(MemoryDatabaseTest, WriteBatchAppliesInOrder) {
    MemoryDatabase db;
    db::WriteBatch batch;
    batch.Put(Slice("k"), Slice("first"));
    batch.Delete(Slice("k"));
    batch.Put(Slice("k"), Slice("second"));
    ASSERT_TRUE(db.Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(db.Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "second");
}

// ============================================================================
// Key Helpers
// ============================================================================

TEST(KeyTest, MakeKeyWithIdentity) {
    Identity id = Identity::FromLabel("alice");
    std::string key = MakeKey(prefix::STAKE, id);
    ASSERT_EQ(key.size(), 1 + Identity::SIZE);
    EXPECT_EQ(key[0], prefix::STAKE);
    EXPECT_EQ(std::memcmp(key.data() + 1, id.data(), Identity::SIZE), 0);
}

TEST(KeyTest, MakeKeyWithSlice) {
    EXPECT_EQ(MakeKey(prefix::GLOBAL, Slice("total")), "Gtotal");
    EXPECT_EQ(MakeKey(prefix::CLOCK), "H");
}

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_NE(Status::Corruption("bad").ToString().find("bad"), std::string::npos);
}

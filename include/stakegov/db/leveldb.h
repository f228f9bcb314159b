// STAKEGOV - LevelDB Wrapper
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// LevelDB implementation of the database interface.

#ifndef STAKEGOV_DB_LEVELDB_H
#define STAKEGOV_DB_LEVELDB_H

#include "stakegov/db/database.h"

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace stakegov {
namespace db {

/// Map a LevelDB status onto our own
Status FromLevelDB(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDB(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    // Declaration order matters: db_ must be destroyed before the cache
    // and filter policy it references.
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : filter_policy_(filter), cache_(cache), db_(db), path_(path) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const std::filesystem::path& GetPath() const { return path_; }
};

} // namespace db
} // namespace stakegov

#endif // STAKEGOV_DB_LEVELDB_H

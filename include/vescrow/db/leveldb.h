// VESCROW - LevelDB Wrapper
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// LevelDB implementation of the database interface.

#ifndef VESCROW_DB_LEVELDB_H
#define VESCROW_DB_LEVELDB_H

#include "vescrow/db/database.h"

#include <filesystem>
#include <leveldb/db.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace vescrow {
namespace db {

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
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter);
    ~LevelDBDatabase() override;

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

    void Compact() override;
    std::string GetStats() const override;

private:
    // Declared before db_ so they are destroyed after it
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::DB> db_;
};

/// Translate a LevelDB status into the project status type
Status ConvertStatus(const leveldb::Status& s);

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open (or create) a LevelDB database at path.
 * @return Pair of (status, database); the database is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenLevelDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all LevelDB files at path
Status DestroyLevelDatabase(const std::filesystem::path& path);

} // namespace db
} // namespace vescrow

#endif // VESCROW_DB_LEVELDB_H

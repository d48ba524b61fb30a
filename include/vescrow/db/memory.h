// VESCROW - In-Memory Database
// Copyright (c) 2024 VESCROW Developers
// MIT License

#ifndef VESCROW_DB_MEMORY_H
#define VESCROW_DB_MEMORY_H

#include "vescrow/db/database.h"
#include <map>
#include <mutex>

namespace vescrow {
namespace db {

/**
 * Ordered in-process key-value store. Used by tests and for ledgers that
 * do not need to survive a restart.
 */
class MemoryDatabase : public Database {
public:
    using Map = std::map<std::string, std::string>;

    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

    size_t Size() const;

    void Clear();

    /// Fail every subsequent write with IOError (for failure-path tests)
    void SetFailWrites(bool fail);

private:
    Map data_;
    mutable std::mutex mutex_;
    bool failWrites_{false};
};

/**
 * Iterator over an immutable copy of a MemoryDatabase.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::shared_ptr<const MemoryDatabase::Map> data);

    bool Valid() const override { return valid_; }
    void SeekToFirst() override;
    void SeekToLast() override;
    void Seek(const Slice& target) override;
    void Next() override;
    void Prev() override;

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }

private:
    std::shared_ptr<const MemoryDatabase::Map> data_;
    MemoryDatabase::Map::const_iterator iter_;
    bool valid_;
};

} // namespace db
} // namespace vescrow

#endif // VESCROW_DB_MEMORY_H

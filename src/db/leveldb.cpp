// VESCROW - LevelDB Wrapper Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/db/leveldb.h"
#include "vescrow/util/logging.h"

#include <leveldb/write_batch.h>

namespace vescrow {
namespace db {

namespace {

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // anonymous namespace

Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBIterator::status() const {
    return ConvertStatus(iter_->status());
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter)
    : cache_(cache), filter_policy_(filter), db_(db) {}

LevelDBDatabase::~LevelDBDatabase() = default;

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(MakeReadOptions(options),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(MakeWriteOptions(options),
                                  leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return ConvertStatus(db_->Delete(MakeWriteOptions(options),
                                     leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

void LevelDBDatabase::Compact() {
    db_->CompactRange(nullptr, nullptr);
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    if (!db_->GetProperty("leveldb.stats", &stats)) {
        return "";
    }
    return stats;
}

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenLevelDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {ConvertStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
}

Status DestroyLevelDatabase(const std::filesystem::path& path) {
    return ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace vescrow

// VESCROW - Ledger Persistence
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Maps the ledger onto a key-value Database:
//
//   'G' + epoch(BE64)            -> Point
//   'U' + address + epoch(BE64)  -> Point
//   'L' + address                -> LockedBalance
//   'S' + timestamp(BE64)        -> slope delta
//   'T'                          -> locked supply
//   'P'                          -> EscrowParams
//   'V'                          -> schema version
//
// Each change set is written as a single batch.

#ifndef VESCROW_ESCROW_LEDGER_STORE_H
#define VESCROW_ESCROW_LEDGER_STORE_H

#include "vescrow/db/database.h"
#include "vescrow/escrow/checkpoint.h"
#include "vescrow/escrow/params.h"
#include "vescrow/escrow/state.h"

#include <cstdint>
#include <memory>
#include <string>

namespace vescrow {
namespace escrow {

class LedgerStore {
public:
    /// Bumped whenever the key layout or value encoding changes
    static constexpr uint32_t SCHEMA_VERSION = 1;

    explicit LedgerStore(std::shared_ptr<db::Database> db);

    /// True if no ledger has been written yet
    bool IsEmpty();

    /// Write a complete state along with params and schema version
    db::Status Initialize(const EscrowParams& params, const LedgerState& state);

    /**
     * Load the complete state. Fails with InvalidArgument if the stored
     * parameters differ from params, Corruption on malformed records or
     * gaps in a history.
     */
    db::Status Load(const EscrowParams& params, LedgerState& state);

    db::Status LoadParams(EscrowParams& params);

    /// Persist changes on top of before (the state they were computed from)
    db::Status Write(const ChangeSet& changes, const LedgerState& before);

    /// Undo a previous Write of changes over before
    db::Status Revert(const ChangeSet& changes, const LedgerState& before);

    /// Flush every write to disk before returning
    void SetSync(bool sync) { writeOptions_.sync = sync; }

    db::Database& GetDatabase() { return *db_; }

    static std::string GlobalPointKey(uint64_t epoch);
    static std::string UserPointKey(const Address& account, uint64_t epoch);
    static std::string LockKey(const Address& account);
    static std::string SlopeChangeKey(Timestamp ts);

private:
    db::Status LoadRecord(const db::Slice& key, const db::Slice& value, LedgerState& state);

    std::shared_ptr<db::Database> db_;
    db::WriteOptions writeOptions_;
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_LEDGER_STORE_H

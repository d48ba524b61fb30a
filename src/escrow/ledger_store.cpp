// VESCROW - Ledger Persistence
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/ledger_store.h"
#include "vescrow/core/serialize.h"
#include "vescrow/util/logging.h"

#include <stdexcept>

namespace vescrow {
namespace escrow {

namespace {

constexpr size_t ADDRESS_SIZE = Address::SIZE;

std::string EncodeBE64(uint64_t value) {
    DataStream ss;
    ser_writedata64be(ss, value);
    return ss.str();
}

uint64_t DecodeBE64(const char* data) {
    DataStream ss(reinterpret_cast<const uint8_t*>(data), 8);
    return ser_readdata64be(ss);
}

Address DecodeAddress(const char* data) {
    return Address(reinterpret_cast<const Byte*>(data), ADDRESS_SIZE);
}

template<typename T>
db::Status Decode(const db::Slice& key, const db::Slice& value, T& out) {
    if (!db::DeserializeFromString(value.ToString(), out)) {
        return db::Status::Corruption("malformed record under key prefix '" +
                                      std::string(1, key[0]) + "'");
    }
    return db::Status::Ok();
}

void PutState(db::WriteBatch& batch, const LedgerState& state) {
    for (uint64_t epoch = 0; epoch < state.globalHistory.size(); ++epoch) {
        batch.Put(LedgerStore::GlobalPointKey(epoch),
                  db::SerializeToString(state.globalHistory[epoch]));
    }
    for (const auto& entry : state.userHistory) {
        // Index 0 is the implicit zero point
        for (uint64_t idx = 1; idx < entry.second.size(); ++idx) {
            batch.Put(LedgerStore::UserPointKey(entry.first, idx),
                      db::SerializeToString(entry.second[idx]));
        }
    }
    for (const auto& entry : state.locks) {
        batch.Put(LedgerStore::LockKey(entry.first), db::SerializeToString(entry.second));
    }
    for (const auto& entry : state.slopeChanges) {
        batch.Put(LedgerStore::SlopeChangeKey(entry.first), db::SerializeToString(entry.second));
    }
    batch.Put(db::MakeKey(db::prefix::SUPPLY), db::SerializeToString(state.supply));
}

} // namespace

LedgerStore::LedgerStore(std::shared_ptr<db::Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("LedgerStore requires a database");
    }
}

std::string LedgerStore::GlobalPointKey(uint64_t epoch) {
    return db::MakeKey(db::prefix::GLOBAL_POINT, EncodeBE64(epoch));
}

std::string LedgerStore::UserPointKey(const Address& account, uint64_t epoch) {
    std::string suffix(reinterpret_cast<const char*>(account.data()), ADDRESS_SIZE);
    suffix += EncodeBE64(epoch);
    return db::MakeKey(db::prefix::USER_POINT, suffix);
}

std::string LedgerStore::LockKey(const Address& account) {
    return db::MakeKey(db::prefix::LOCK,
                       db::Slice(reinterpret_cast<const char*>(account.data()), ADDRESS_SIZE));
}

std::string LedgerStore::SlopeChangeKey(Timestamp ts) {
    return db::MakeKey(db::prefix::SLOPE_CHANGE, EncodeBE64(static_cast<uint64_t>(ts)));
}

bool LedgerStore::IsEmpty() {
    return !db_->Exists(db::MakeKey(db::prefix::VERSION));
}

db::Status LedgerStore::Initialize(const EscrowParams& params, const LedgerState& state) {
    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::VERSION), db::SerializeToString(SCHEMA_VERSION));
    batch.Put(db::MakeKey(db::prefix::PARAMS), db::SerializeToString(params));
    PutState(batch, state);

    db::Status status = db_->Write(writeOptions_, &batch);
    if (status.ok()) {
        LOG_INFO(util::LogCategory::DB) << "Initialized ledger store ("
                                        << batch.Count() << " records)";
    }
    return status;
}

db::Status LedgerStore::LoadParams(EscrowParams& params) {
    std::string value;
    db::Status status = db_->Get(db::MakeKey(db::prefix::PARAMS), &value);
    if (!status.ok()) {
        return status;
    }
    if (!db::DeserializeFromString(value, params)) {
        return db::Status::Corruption("malformed escrow parameters");
    }
    return db::Status::Ok();
}

db::Status LedgerStore::Load(const EscrowParams& params, LedgerState& state) {
    std::string value;
    db::Status status = db_->Get(db::MakeKey(db::prefix::VERSION), &value);
    if (!status.ok()) {
        return status;
    }
    uint32_t version = 0;
    if (!db::DeserializeFromString(value, version)) {
        return db::Status::Corruption("malformed schema version");
    }
    if (version != SCHEMA_VERSION) {
        return db::Status::NotSupported("unsupported schema version " + std::to_string(version));
    }

    EscrowParams stored;
    status = LoadParams(stored);
    if (!status.ok()) {
        return status;
    }
    if (stored != params) {
        return db::Status::InvalidArgument("stored parameters " + stored.ToString() +
                                           " differ from configured " + params.ToString());
    }

    state.Clear();
    auto it = db_->NewIterator(db::ReadOptions());
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        status = LoadRecord(it->key(), it->value(), state);
        if (!status.ok()) {
            state.Clear();
            return status;
        }
    }
    if (!it->status().ok()) {
        state.Clear();
        return it->status();
    }

    if (!state.IsSeeded()) {
        return db::Status::Corruption("ledger has no genesis point");
    }

    LOG_INFO(util::LogCategory::DB) << "Loaded " << state.ToString();
    return db::Status::Ok();
}

db::Status LedgerStore::LoadRecord(const db::Slice& key, const db::Slice& value,
                                   LedgerState& state) {
    if (key.empty()) {
        return db::Status::Corruption("empty key");
    }

    switch (key[0]) {
        case db::prefix::GLOBAL_POINT: {
            if (key.size() != 1 + 8) {
                return db::Status::Corruption("bad global point key");
            }
            // Keys iterate in epoch order, so each epoch must be the next one
            if (DecodeBE64(key.data() + 1) != state.globalHistory.size()) {
                return db::Status::Corruption("gap in global history");
            }
            Point point;
            db::Status status = Decode(key, value, point);
            if (status.ok()) {
                state.globalHistory.push_back(point);
            }
            return status;
        }

        case db::prefix::USER_POINT: {
            if (key.size() != 1 + ADDRESS_SIZE + 8) {
                return db::Status::Corruption("bad user point key");
            }
            Address account = DecodeAddress(key.data() + 1);
            auto& history = state.userHistory[account];
            if (history.empty()) {
                history.emplace_back();
            }
            if (DecodeBE64(key.data() + 1 + ADDRESS_SIZE) != history.size()) {
                return db::Status::Corruption("gap in history of " + account.ToHex());
            }
            Point point;
            db::Status status = Decode(key, value, point);
            if (status.ok()) {
                history.push_back(point);
            }
            return status;
        }

        case db::prefix::LOCK: {
            if (key.size() != 1 + ADDRESS_SIZE) {
                return db::Status::Corruption("bad lock key");
            }
            LockedBalance lock;
            db::Status status = Decode(key, value, lock);
            if (status.ok()) {
                state.locks[DecodeAddress(key.data() + 1)] = lock;
            }
            return status;
        }

        case db::prefix::SLOPE_CHANGE: {
            if (key.size() != 1 + 8) {
                return db::Status::Corruption("bad slope change key");
            }
            Power delta = 0;
            db::Status status = Decode(key, value, delta);
            if (status.ok()) {
                state.slopeChanges[static_cast<Timestamp>(DecodeBE64(key.data() + 1))] = delta;
            }
            return status;
        }

        case db::prefix::SUPPLY:
            return Decode(key, value, state.supply);

        case db::prefix::PARAMS:
        case db::prefix::VERSION:
            return db::Status::Ok();

        default:
            return db::Status::Corruption("unknown key prefix '" + std::string(1, key[0]) + "'");
    }
}

db::Status LedgerStore::Write(const ChangeSet& changes, const LedgerState& before) {
    db::WriteBatch batch;

    uint64_t epoch = before.globalHistory.size();
    for (const auto& point : changes.globalPoints) {
        batch.Put(GlobalPointKey(epoch++), db::SerializeToString(point));
    }

    if (changes.account) {
        const Address& account = *changes.account;
        batch.Put(UserPointKey(account, before.UserEpoch(account) + 1),
                  db::SerializeToString(changes.userPoint));
        if (changes.newLock) {
            batch.Put(LockKey(account), db::SerializeToString(*changes.newLock));
        }
    }

    for (const auto& write : changes.slopeWrites) {
        batch.Put(SlopeChangeKey(write.first), db::SerializeToString(write.second));
    }

    if (changes.newSupply) {
        batch.Put(db::MakeKey(db::prefix::SUPPLY), db::SerializeToString(*changes.newSupply));
    }

    if (batch.Empty()) {
        return db::Status::Ok();
    }

    db::Status status = db_->Write(writeOptions_, &batch);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to write change set: " << status.ToString();
    }
    return status;
}

db::Status LedgerStore::Revert(const ChangeSet& changes, const LedgerState& before) {
    db::WriteBatch batch;

    uint64_t epoch = before.globalHistory.size();
    for (size_t i = 0; i < changes.globalPoints.size(); ++i) {
        batch.Delete(GlobalPointKey(epoch++));
    }

    if (changes.account) {
        const Address& account = *changes.account;
        batch.Delete(UserPointKey(account, before.UserEpoch(account) + 1));
        if (changes.newLock) {
            auto it = before.locks.find(account);
            if (it != before.locks.end()) {
                batch.Put(LockKey(account), db::SerializeToString(it->second));
            } else {
                batch.Delete(LockKey(account));
            }
        }
    }

    for (const auto& write : changes.slopeWrites) {
        auto it = before.slopeChanges.find(write.first);
        if (it != before.slopeChanges.end()) {
            batch.Put(SlopeChangeKey(write.first), db::SerializeToString(it->second));
        } else {
            batch.Delete(SlopeChangeKey(write.first));
        }
    }

    if (changes.newSupply) {
        batch.Put(db::MakeKey(db::prefix::SUPPLY), db::SerializeToString(before.supply));
    }

    if (batch.Empty()) {
        return db::Status::Ok();
    }

    db::Status status = db_->Write(writeOptions_, &batch);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to revert change set: " << status.ToString();
    } else {
        LOG_DEBUG(util::LogCategory::DB) << "Reverted change set (" << batch.Count() << " records)";
    }
    return status;
}

} // namespace escrow
} // namespace vescrow

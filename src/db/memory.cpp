// VESCROW - In-Memory Database Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/db/memory.h"

namespace vescrow {
namespace db {

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("write failure injected");
    }
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("write failure injected");
    }
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return Status::IOError("write failure injected");
    }
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(std::make_shared<const Map>(data_));
}

std::string MemoryDatabase::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t bytes = 0;
    for (const auto& [key, value] : data_) {
        bytes += key.size() + value.size();
    }
    return "keys=" + std::to_string(data_.size()) + " bytes=" + std::to_string(bytes);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void MemoryDatabase::SetFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

// ============================================================================
// MemoryIterator
// ============================================================================

MemoryIterator::MemoryIterator(std::shared_ptr<const MemoryDatabase::Map> data)
    : data_(std::move(data)), iter_(data_->end()), valid_(false) {}

void MemoryIterator::SeekToFirst() {
    iter_ = data_->begin();
    valid_ = iter_ != data_->end();
}

void MemoryIterator::SeekToLast() {
    if (data_->empty()) {
        iter_ = data_->end();
        valid_ = false;
    } else {
        iter_ = std::prev(data_->end());
        valid_ = true;
    }
}

void MemoryIterator::Seek(const Slice& target) {
    iter_ = data_->lower_bound(target.ToString());
    valid_ = iter_ != data_->end();
}

void MemoryIterator::Next() {
    if (!valid_) {
        return;
    }
    ++iter_;
    valid_ = iter_ != data_->end();
}

void MemoryIterator::Prev() {
    if (!valid_) {
        return;
    }
    if (iter_ == data_->begin()) {
        valid_ = false;
    } else {
        --iter_;
    }
}

} // namespace db
} // namespace vescrow

// VESCROW - Core Types Header
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// This file defines fundamental types used throughout VESCROW.

#ifndef VESCROW_CORE_TYPES_H
#define VESCROW_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace vescrow {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount of the locked asset in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// External sequence marker (block height)
using BlockHeight = uint64_t;

/// Constants
constexpr Amount COIN = 100000000LL;  // 1 token = 100 million base units
constexpr Amount MAX_MONEY = 21000000000LL * COIN;  // 21 billion tokens max

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic hash template
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        // Compare in reverse order (most significant byte last in storage)
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Convert to hex string (displayed in reverse byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex).data(), SIZE);
    }
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;

    static Hash160 FromHex(const std::string& hex) {
        auto base = BaseHash<160>::FromHex(hex);
        return Hash160(base.data(), SIZE);
    }
};

/// Account address holding a lock
using Address = Hash160;

} // namespace vescrow

#endif // VESCROW_CORE_TYPES_H

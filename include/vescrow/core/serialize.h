// VESCROW - Serialization Header
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// This file defines serialization primitives for VESCROW.
// Values are little-endian; database keys use the big-endian helpers so
// that lexicographic key order matches numeric order.

#ifndef VESCROW_CORE_SERIALIZE_H
#define VESCROW_CORE_SERIALIZE_H

#include "vescrow/core/types.h"
#include "vescrow/core/arith.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <ios>

namespace vescrow {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint32_t HostToLE32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t HostToLE64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint32_t LE32ToHost(uint32_t little) { return HostToLE32(little); }
inline uint64_t LE64ToHost(uint64_t little) { return HostToLE64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Raw buffer as a string (for database values)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::HostToLE32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::HostToLE64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::LE32ToHost(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::LE64ToHost(obj);
}

/// Big-endian 64-bit write, for order-preserving database keys
template<typename Stream>
inline void ser_writedata64be(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 7; i >= 0; --i) {
        buf[i] = static_cast<uint8_t>(obj & 0xff);
        obj >>= 8;
    }
    s.Write(buf, 8);
}

template<typename Stream>
inline uint64_t ser_readdata64be(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t obj = 0;
    for (int i = 0; i < 8; ++i) {
        obj = (obj << 8) | buf[i];
    }
    return obj;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 254) {
        size = ser_readdata32(s);
    } else if (marker == 255) {
        size = ser_readdata64(s);
    } else {
        throw std::ios_base::failure("ReadCompactSize(): bad marker");
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }

    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, int32_t a) { ser_writedata32(s, static_cast<uint32_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ser_readdata32(s)); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

// 128-bit fixed-point values: low word first, then high word
template<typename Stream>
inline void Serialize(Stream& s, int128 a) {
    unsigned __int128 bits = static_cast<unsigned __int128>(a);
    ser_writedata64(s, static_cast<uint64_t>(bits));
    ser_writedata64(s, static_cast<uint64_t>(bits >> 64));
}

template<typename Stream>
inline void Unserialize(Stream& s, int128& a) {
    unsigned __int128 low = ser_readdata64(s);
    unsigned __int128 high = ser_readdata64(s);
    a = static_cast<int128>((high << 64) | low);
}

// ============================================================================
// Serialize/Unserialize for Strings and Hashes
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const Hash160& hash) {
    s.Write(hash.data(), 20);
}

template<typename Stream>
void Unserialize(Stream& s, Hash160& hash) {
    s.Read(hash.data(), 20);
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), 32);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), 32);
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace vescrow

#endif // VESCROW_CORE_SERIALIZE_H

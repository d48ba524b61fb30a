// VESCROW - SHA256 Hash Function
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// SHA-256 over the OpenSSL EVP digest interface.

#ifndef VESCROW_CRYPTO_SHA256_H
#define VESCROW_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "vescrow/core/types.h"

namespace vescrow {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace vescrow

#endif // VESCROW_CRYPTO_SHA256_H

// STAKEGOV - SHA256 Hash Function
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP interface.

#ifndef STAKEGOV_CRYPTO_SHA256_H
#define STAKEGOV_CRYPTO_SHA256_H

#include "stakegov/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stakegov {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output (OUTPUT_SIZE bytes)
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

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace stakegov

#endif // STAKEGOV_CRYPTO_SHA256_H

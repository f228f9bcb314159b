// STAKEGOV - Core Types Header
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// This file defines fundamental types used throughout STAKEGOV.

#ifndef STAKEGOV_CORE_TYPES_H
#define STAKEGOV_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <limits>

namespace stakegov {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount of staked or transferable value in base units
using Amount = int64_t;

/// Block height, the value of the global sequential clock
using Height = int64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Check if amount is in valid range
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

/// Add two non-negative amounts, returning false on overflow
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a < 0 || b < 0 || a > MAX_AMOUNT - b) {
        return false;
    }
    out = a + b;
    return true;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size byte string
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

    /// Construct from raw bytes (truncated or zero padded to SIZE)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order, so ordered containers iterate in hex order
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (storage byte order)
    std::string ToHex() const;

    /// Create from hex string, throws std::invalid_argument on malformed input
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
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}
};

/**
 * Principal identity of a caller.
 *
 * Identities are supplied by the runtime and are unforgeable from the
 * engine's point of view; the engine only compares and stores them.
 */
class Identity : public Hash160 {
public:
    using Hash160::Hash160;
    Identity() = default;
    explicit Identity(const Hash160& h) : Hash160(h) {}

    static Identity FromHex(const std::string& hex) {
        return Identity(Hash160(BaseHash<160>::FromHex(hex)));
    }

    /// Derive a deterministic identity from a label (first 20 bytes of SHA-256)
    static Identity FromLabel(const std::string& label);
};

} // namespace stakegov

#endif // STAKEGOV_CORE_TYPES_H

// STAKEGOV - Core Types Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/core/types.h"
#include "stakegov/core/hex.h"
#include "stakegov/crypto/sha256.h"

namespace stakegov {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Identity
// ============================================================================

Identity Identity::FromLabel(const std::string& label) {
    Hash256 digest = SHA256Hash(label);
    return Identity(Hash160(digest.data(), Hash160::SIZE));
}

} // namespace stakegov

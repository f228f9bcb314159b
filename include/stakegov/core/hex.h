// STAKEGOV - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#ifndef STAKEGOV_CORE_HEX_H
#define STAKEGOV_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace stakegov {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes, throws std::invalid_argument on bad input
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace stakegov

#endif // STAKEGOV_CORE_HEX_H

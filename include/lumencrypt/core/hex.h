// LUMENCRYPT - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#ifndef LUMENCRYPT_CORE_HEX_H
#define LUMENCRYPT_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace lumencrypt {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Hex with a leading "0x", the form used for UTXO private keys
std::string BytesToPrefixedHex(const HexByte* data, size_t len);

/// Drop a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& hex);

/// Convert hex string to bytes (an optional "0x" prefix is accepted)
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes
std::optional<std::vector<HexByte>> TryHexToBytes(const std::string& hex);

/// Check if string is valid hex (an optional "0x" prefix is accepted)
bool IsValidHex(const std::string& str);

} // namespace lumencrypt

#endif // LUMENCRYPT_CORE_HEX_H

// LUMENCRYPT - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/core/hex.h"

#include <utility>

namespace lumencrypt {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline bool HasHexPrefix(const std::string& hex) {
        return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::string BytesToPrefixedHex(const HexByte* data, size_t len) {
    return "0x" + BytesToHex(data, len);
}

std::string StripHexPrefix(const std::string& hex) {
    return HasHexPrefix(hex) ? hex.substr(2) : hex;
}

std::optional<std::vector<HexByte>> TryHexToBytes(const std::string& hex) {
    size_t start = HasHexPrefix(hex) ? 2 : 0;
    if ((hex.length() - start) % 2 != 0) {
        return std::nullopt;
    }

    std::vector<HexByte> result;
    result.reserve((hex.length() - start) / 2);

    for (size_t i = start; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);

        if (high < 0 || low < 0) {
            return std::nullopt;
        }

        result.push_back(static_cast<HexByte>((high << 4) | low));
    }

    return result;
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    if (StripHexPrefix(hex).length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        throw std::invalid_argument("Invalid hex character");
    }
    return std::move(*bytes);
}

bool IsValidHex(const std::string& str) {
    std::string body = StripHexPrefix(str);
    if (body.empty() || body.length() % 2 != 0) {
        return false;
    }

    for (char c : body) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }

    return true;
}

} // namespace lumencrypt

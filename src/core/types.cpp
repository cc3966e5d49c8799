// LUMENCRYPT - Core Types Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/core/types.h"
#include "lumencrypt/core/hex.h"

namespace lumencrypt {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (StripHexPrefix(hex).length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for fixed-size value");
    }

    auto bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;

} // namespace lumencrypt

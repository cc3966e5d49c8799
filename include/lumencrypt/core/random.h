// LUMENCRYPT - Secure Random Number Generation Header
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Cryptographically secure random bytes from OS entropy sources. Used for
// every nonce and ephemeral key. There is no software fallback: if the OS
// cannot supply entropy the call throws and the caller must not retry.

#ifndef LUMENCRYPT_CORE_RANDOM_H
#define LUMENCRYPT_CORE_RANDOM_H

#include "lumencrypt/core/types.h"
#include <cstdint>
#include <cstddef>

namespace lumencrypt {

/// Fill buffer with cryptographically secure random bytes
/// @throws std::runtime_error if the OS entropy source fails
void GetRandBytes(uint8_t* buf, size_t len);

/// Fill buffer with random bytes (Span version)
inline void GetRandBytes(Span<uint8_t> buf) {
    GetRandBytes(buf.data(), buf.size());
}

/// Fixed-size array of random bytes
template<size_t N>
std::array<Byte, N> GetRandArray() {
    std::array<Byte, N> out{};
    GetRandBytes(out.data(), N);
    return out;
}

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace lumencrypt

#endif // LUMENCRYPT_CORE_RANDOM_H

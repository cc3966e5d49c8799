// LUMENCRYPT - HMAC (Hash-based Message Authentication Code)
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// HMAC-SHA256 following RFC 2104, backed by OpenSSL's EVP_MAC interface.

#ifndef LUMENCRYPT_CRYPTO_HMAC_H
#define LUMENCRYPT_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <memory>
#include <vector>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

// ============================================================================
// HMAC Constants
// ============================================================================

namespace hmac {
    /// HMAC-SHA256 output size
    constexpr size_t SHA256_SIZE = 32;
}

// ============================================================================
// HMAC-SHA256
// ============================================================================

/**
 * HMAC-SHA256 message authentication code.
 *
 * Provides incremental authentication for data written in several pieces
 * (e.g. nonce then ciphertext).
 */
class HMAC_SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = hmac::SHA256_SIZE;

    /// Create HMAC with key (any length, including empty)
    /// @throws std::runtime_error if OpenSSL cannot set up the MAC
    explicit HMAC_SHA256(const Byte* key, size_t keyLen);

    explicit HMAC_SHA256(ByteSpan key)
        : HMAC_SHA256(key.data(), key.size()) {}

    /// Destructor - releases the MAC context (OpenSSL cleanses the key)
    ~HMAC_SHA256();

    /// Non-copyable (contains key material)
    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    HMAC_SHA256(HMAC_SHA256&& other) noexcept;
    HMAC_SHA256& operator=(HMAC_SHA256&& other) noexcept;

    /// Write data to HMAC
    /// @return Reference to this HMAC (for chaining)
    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(ByteSpan data) {
        return Write(data.data(), data.size());
    }

    /// Finalize and get the MAC
    Hash256 Finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Compute HMAC-SHA256 in one call
Hash256 ComputeHMAC_SHA256(ByteSpan key, ByteSpan data);

// ============================================================================
// Verification Helper
// ============================================================================

/**
 * Constant-time comparison of two byte strings of equal length.
 * Running time depends only on len, never on where the inputs differ.
 *
 * @return true if equal
 */
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

/// Compare two byte views in constant time; different lengths never match
inline bool ConstantTimeCompare(ByteSpan a, ByteSpan b) {
    if (a.size() != b.size()) {
        return false;
    }
    return ConstantTimeCompare(a.data(), b.data(), a.size());
}

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_HMAC_H

// LUMENCRYPT - AES Symmetric Encryption
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// AES-128-CTR (legacy stream mode) and AES-256-GCM (authenticated mode),
// both backed by OpenSSL EVP.

#ifndef LUMENCRYPT_CRYPTO_AES_H
#define LUMENCRYPT_CRYPTO_AES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <vector>
#include <stdexcept>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

// ============================================================================
// AES Constants
// ============================================================================

namespace aes {
    /// Block size is always 16 bytes for AES
    constexpr size_t BLOCK_SIZE = 16;

    /// Key sizes
    constexpr size_t KEY_SIZE_128 = 16;
    constexpr size_t KEY_SIZE_256 = 32;

    /// CTR initial counter block size
    constexpr size_t CTR_IV_SIZE = 16;

    /// GCM nonce size (96 bits)
    constexpr size_t GCM_NONCE_SIZE = 12;

    /// GCM authentication tag size (128 bits)
    constexpr size_t GCM_TAG_SIZE = 16;
}

// ============================================================================
// AES-128-CTR
// ============================================================================

/**
 * Encrypt or decrypt with AES-128-CTR.
 * CTR mode produces output the same length as input and is its own inverse.
 * The whole 16-byte IV is the initial counter block (big-endian increment).
 *
 * @param key 16-byte key
 * @param iv 16-byte initial counter block
 * @param data Input bytes
 * @return Output bytes (same length as input)
 * @throws std::invalid_argument on wrong key/IV length
 * @throws std::runtime_error on cipher failure
 */
std::vector<Byte> AES128CTRCrypt(ByteSpan key, ByteSpan iv, ByteSpan data);

// ============================================================================
// AES-256-GCM
// ============================================================================

/// Ciphertext and detached tag produced by AES-256-GCM
struct GCMSealed {
    std::vector<Byte> ciphertext;
    std::array<Byte, aes::GCM_TAG_SIZE> tag{};
};

/**
 * Encrypt data using AES-256-GCM.
 *
 * @param key Encryption key (32 bytes)
 * @param nonce Nonce (12 bytes, must be unique per encryption under a key)
 * @param plaintext Data to encrypt
 * @return Ciphertext (same length as plaintext) and 16-byte tag
 * @throws std::invalid_argument on wrong key/nonce length
 * @throws std::runtime_error on cipher failure
 */
GCMSealed AES256GCMEncrypt(ByteSpan key, ByteSpan nonce, ByteSpan plaintext);

/**
 * Decrypt data using AES-256-GCM and verify its tag.
 *
 * @return Plaintext, or nullopt on authentication failure or bad lengths.
 *         No plaintext is ever returned for unauthenticated input.
 */
std::optional<std::vector<Byte>> AES256GCMDecrypt(ByteSpan key, ByteSpan nonce,
                                                  ByteSpan ciphertext, ByteSpan tag);

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_AES_H

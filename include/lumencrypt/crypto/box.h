// LUMENCRYPT - Public-Key Authenticated Encryption (NaCl box)
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// curve25519-xsalsa20-poly1305 via libsodium. Output of BoxSeal is
// MAC(16) || ciphertext, byte-compatible with NaCl/TweetNaCl `box`.

#ifndef LUMENCRYPT_CRYPTO_BOX_H
#define LUMENCRYPT_CRYPTO_BOX_H

#include <array>
#include <cstddef>
#include <optional>
#include <vector>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

namespace box {
    /// Curve25519 public key size
    constexpr size_t PUBLIC_KEY_SIZE = 32;

    /// Curve25519 secret scalar size
    constexpr size_t SECRET_KEY_SIZE = 32;

    /// XSalsa20 nonce size
    constexpr size_t NONCE_SIZE = 24;

    /// Poly1305 tag size
    constexpr size_t MAC_SIZE = 16;
}

/**
 * Curve25519 keypair for box encryption.
 * The secret half is wiped when the keypair is destroyed.
 */
struct BoxKeypair {
    std::array<Byte, box::PUBLIC_KEY_SIZE> publicKey{};
    std::array<Byte, box::SECRET_KEY_SIZE> secretKey{};

    BoxKeypair() = default;
    BoxKeypair(const BoxKeypair&) = default;
    BoxKeypair& operator=(const BoxKeypair&) = default;
    ~BoxKeypair();
};

/// Initialize libsodium once per process (thread-safe)
/// @throws std::runtime_error if libsodium cannot initialize
void EnsureSodiumInitialized();

/**
 * Keypair whose secret is the given 32 bytes and whose public key is the
 * Curve25519 base-point multiple of that secret.
 *
 * @throws std::invalid_argument if secretKey is not 32 bytes
 */
BoxKeypair BoxKeypairFromSecretKey(ByteSpan secretKey);

/// Fresh random keypair
BoxKeypair GenerateBoxKeypair();

/**
 * Encrypt and authenticate message from sender to recipient.
 *
 * @return MAC || ciphertext (message size + 16 bytes)
 * @throws std::invalid_argument on wrong key/nonce sizes or when the
 *         recipient key yields an all-zero shared secret (low-order point)
 */
std::vector<Byte> BoxSeal(ByteSpan message, ByteSpan nonce,
                          ByteSpan recipientPublicKey, ByteSpan senderSecretKey);

/**
 * Verify and decrypt a sealed box.
 *
 * @return Plaintext, or nullopt on any authentication or size failure
 */
std::optional<std::vector<Byte>> BoxOpen(ByteSpan sealed, ByteSpan nonce,
                                         ByteSpan senderPublicKey,
                                         ByteSpan recipientSecretKey);

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_BOX_H

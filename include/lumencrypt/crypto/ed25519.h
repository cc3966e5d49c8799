// LUMENCRYPT - Ed25519 Signatures
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Detached Ed25519 signing via libsodium. Secret keys use the 64-byte
// seed || publicKey layout shared by libsodium, NaCl and Solana wallets.

#ifndef LUMENCRYPT_CRYPTO_ED25519_H
#define LUMENCRYPT_CRYPTO_ED25519_H

#include <array>
#include <cstddef>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

namespace ed25519 {
    constexpr size_t SEED_SIZE = 32;
    constexpr size_t PUBLIC_KEY_SIZE = 32;
    constexpr size_t SECRET_KEY_SIZE = 64;
    constexpr size_t SIGNATURE_SIZE = 64;
}

using Ed25519Signature = std::array<Byte, ed25519::SIGNATURE_SIZE>;

/// Ed25519 keypair; the secret half is wiped on destruction
struct Ed25519Keypair {
    std::array<Byte, ed25519::PUBLIC_KEY_SIZE> publicKey{};
    std::array<Byte, ed25519::SECRET_KEY_SIZE> secretKey{};

    Ed25519Keypair() = default;
    Ed25519Keypair(const Ed25519Keypair&) = default;
    Ed25519Keypair& operator=(const Ed25519Keypair&) = default;
    ~Ed25519Keypair();
};

/// Expand a 32-byte seed into a keypair
/// @throws std::invalid_argument if seed is not 32 bytes
Ed25519Keypair Ed25519KeypairFromSeed(ByteSpan seed);

/**
 * Produce a detached signature.
 *
 * @param secretKey 64-byte secret key (seed || publicKey)
 * @throws std::invalid_argument if secretKey is not 64 bytes
 */
Ed25519Signature Ed25519Sign(ByteSpan secretKey, ByteSpan message);

/// Verify a detached signature
bool Ed25519Verify(ByteSpan signature, ByteSpan message, ByteSpan publicKey);

} // namespace lumencrypt

#endif // LUMENCRYPT_CRYPTO_ED25519_H

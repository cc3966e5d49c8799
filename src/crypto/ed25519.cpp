// LUMENCRYPT - Ed25519 Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/ed25519.h"
#include "lumencrypt/crypto/box.h"

#include <stdexcept>

#include <sodium.h>

namespace lumencrypt {

static_assert(ed25519::SEED_SIZE == crypto_sign_SEEDBYTES, "ed25519 seed size");
static_assert(ed25519::PUBLIC_KEY_SIZE == crypto_sign_PUBLICKEYBYTES, "ed25519 public key size");
static_assert(ed25519::SECRET_KEY_SIZE == crypto_sign_SECRETKEYBYTES, "ed25519 secret key size");
static_assert(ed25519::SIGNATURE_SIZE == crypto_sign_BYTES, "ed25519 signature size");

Ed25519Keypair::~Ed25519Keypair() {
    sodium_memzero(secretKey.data(), secretKey.size());
}

Ed25519Keypair Ed25519KeypairFromSeed(ByteSpan seed) {
    if (seed.size() != ed25519::SEED_SIZE) {
        throw std::invalid_argument("Ed25519 seed must be 32 bytes");
    }
    EnsureSodiumInitialized();

    Ed25519Keypair kp;
    if (crypto_sign_seed_keypair(kp.publicKey.data(), kp.secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("Ed25519 key expansion failed");
    }
    return kp;
}

Ed25519Signature Ed25519Sign(ByteSpan secretKey, ByteSpan message) {
    if (secretKey.size() != ed25519::SECRET_KEY_SIZE) {
        throw std::invalid_argument("Ed25519 secret key must be 64 bytes");
    }
    EnsureSodiumInitialized();

    Ed25519Signature sig{};
    if (crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(),
                             secretKey.data()) != 0) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    return sig;
}

bool Ed25519Verify(ByteSpan signature, ByteSpan message, ByteSpan publicKey) {
    if (signature.size() != ed25519::SIGNATURE_SIZE ||
        publicKey.size() != ed25519::PUBLIC_KEY_SIZE) {
        return false;
    }
    EnsureSodiumInitialized();

    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       publicKey.data()) == 0;
}

} // namespace lumencrypt

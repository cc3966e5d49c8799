// LUMENCRYPT - NaCl Box Implementation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/crypto/box.h"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace lumencrypt {

static_assert(box::PUBLIC_KEY_SIZE == crypto_box_PUBLICKEYBYTES, "box public key size");
static_assert(box::SECRET_KEY_SIZE == crypto_box_SECRETKEYBYTES, "box secret key size");
static_assert(box::NONCE_SIZE == crypto_box_NONCEBYTES, "box nonce size");
static_assert(box::MAC_SIZE == crypto_box_MACBYTES, "box MAC size");
static_assert(box::SECRET_KEY_SIZE == crypto_scalarmult_SCALARBYTES, "scalar size");

BoxKeypair::~BoxKeypair() {
    sodium_memzero(secretKey.data(), secretKey.size());
}

void EnsureSodiumInitialized() {
    static std::once_flag once;
    static int status = -1;
    std::call_once(once, [] { status = sodium_init(); });
    // 0 = initialized now, 1 = already initialized elsewhere
    if (status < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

BoxKeypair BoxKeypairFromSecretKey(ByteSpan secretKey) {
    if (secretKey.size() != box::SECRET_KEY_SIZE) {
        throw std::invalid_argument("Box secret key must be 32 bytes");
    }
    EnsureSodiumInitialized();

    BoxKeypair kp;
    std::copy(secretKey.begin(), secretKey.end(), kp.secretKey.begin());
    if (crypto_scalarmult_base(kp.publicKey.data(), kp.secretKey.data()) != 0) {
        throw std::runtime_error("Curve25519 base-point multiplication failed");
    }
    return kp;
}

BoxKeypair GenerateBoxKeypair() {
    EnsureSodiumInitialized();

    BoxKeypair kp;
    if (crypto_box_keypair(kp.publicKey.data(), kp.secretKey.data()) != 0) {
        throw std::runtime_error("Failed to generate box keypair");
    }
    return kp;
}

std::vector<Byte> BoxSeal(ByteSpan message, ByteSpan nonce,
                          ByteSpan recipientPublicKey, ByteSpan senderSecretKey) {
    if (nonce.size() != box::NONCE_SIZE) {
        throw std::invalid_argument("Box nonce must be 24 bytes");
    }
    if (recipientPublicKey.size() != box::PUBLIC_KEY_SIZE ||
        senderSecretKey.size() != box::SECRET_KEY_SIZE) {
        throw std::invalid_argument("Box keys must be 32 bytes");
    }
    EnsureSodiumInitialized();

    std::vector<Byte> sealed(message.size() + box::MAC_SIZE);
    if (crypto_box_easy(sealed.data(), message.data(), message.size(), nonce.data(),
                        recipientPublicKey.data(), senderSecretKey.data()) != 0) {
        throw std::invalid_argument("Box encryption rejected the recipient public key");
    }
    return sealed;
}

std::optional<std::vector<Byte>> BoxOpen(ByteSpan sealed, ByteSpan nonce,
                                         ByteSpan senderPublicKey,
                                         ByteSpan recipientSecretKey) {
    if (sealed.size() < box::MAC_SIZE ||
        nonce.size() != box::NONCE_SIZE ||
        senderPublicKey.size() != box::PUBLIC_KEY_SIZE ||
        recipientSecretKey.size() != box::SECRET_KEY_SIZE) {
        return std::nullopt;
    }
    EnsureSodiumInitialized();

    std::vector<Byte> plaintext(sealed.size() - box::MAC_SIZE);
    if (crypto_box_open_easy(plaintext.data(), sealed.data(), sealed.size(), nonce.data(),
                             senderPublicKey.data(), recipientSecretKey.data()) != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    return plaintext;
}

} // namespace lumencrypt

// LUMENCRYPT - Asymmetric (Box) Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/box_codec.h"
#include "lumencrypt/core/hex.h"
#include "lumencrypt/core/random.h"
#include "lumencrypt/crypto/keccak.h"
#include "lumencrypt/encryption/errors.h"
#include "lumencrypt/encryption/format.h"
#include "lumencrypt/util/logging.h"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace lumencrypt {

static_assert(format::BOX_EPHEMERAL_KEY_SIZE == box::PUBLIC_KEY_SIZE, "box key size");
static_assert(format::BOX_NONCE_SIZE == box::NONCE_SIZE, "box nonce size");
static_assert(format::BOX_MAC_SIZE == box::MAC_SIZE, "box MAC size");

BoxKeypair BoxCodec::DeriveBoxKeypair() const {
    if (!keys_.HasV2()) {
        throw EncryptionError(ErrorKind::KeyNotDerived,
                              "box keypair requires derived v2 key material");
    }

    Keccak256 hasher;
    hasher.Write(keys_.V2());
    hasher.Write(reinterpret_cast<const Byte*>(BOX_KEY_DOMAIN), std::strlen(BOX_KEY_DOMAIN));

    SecureArray<Byte, box::SECRET_KEY_SIZE> secret;
    hasher.Finalize(secret.data());

    return BoxKeypairFromSecretKey(secret.View());
}

std::string BoxCodec::GetPublicKeyHex() const {
    return BytesToHex(DeriveBoxKeypair().publicKey);
}

Bytes BoxCodec::EncryptForRecipient(ByteSpan plaintext, ByteSpan recipientPublicKey) {
    if (recipientPublicKey.size() != box::PUBLIC_KEY_SIZE) {
        throw EncryptionError(ErrorKind::InvalidKeyLength,
                              "recipient public key must be 32 bytes");
    }

    BoxKeypair ephemeral = lumencrypt::GenerateBoxKeypair();
    auto nonce = GetRandArray<box::NONCE_SIZE>();

    Bytes sealed;
    try {
        sealed = BoxSeal(plaintext, nonce, recipientPublicKey, ephemeral.secretKey);
    } catch (const std::invalid_argument&) {
        // Low-order points produce an all-zero shared secret
        throw EncryptionError(ErrorKind::InvalidKeyLength,
                              "recipient public key is not a usable Curve25519 key");
    }

    Bytes blob;
    blob.reserve(format::BOX_HEADER_SIZE + sealed.size());
    blob.insert(blob.end(), format::VERSION_TAG_BOX.begin(), format::VERSION_TAG_BOX.end());
    blob.insert(blob.end(), ephemeral.publicKey.begin(), ephemeral.publicKey.end());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), sealed.begin(), sealed.end());

    LOG_DEBUG(util::LogCategory::BOX) << "Sealed " << plaintext.size()
                                      << "-byte payload for recipient";
    return blob;
}

Bytes BoxCodec::DecryptOwn(ByteSpan blob) const {
    if (!keys_.HasV2()) {
        throw EncryptionError(ErrorKind::KeyNotSet, "V2 encryption key not set");
    }

    if (!lumencrypt::IsBoxEncrypted(blob) ||
        blob.size() < format::BOX_HEADER_SIZE + format::BOX_MAC_SIZE) {
        LOG_DEBUG(util::LogCategory::BOX) << "box decryption rejected: malformed blob";
        throw EncryptionError(ErrorKind::DecryptionFailed,
                              "Invalid encryption key or corrupted data");
    }

    ByteSpan ephemeralPk = blob.subspan(format::VERSION_TAG_SIZE, format::BOX_EPHEMERAL_KEY_SIZE);
    ByteSpan nonce = blob.subspan(format::VERSION_TAG_SIZE + format::BOX_EPHEMERAL_KEY_SIZE,
                                  format::BOX_NONCE_SIZE);
    ByteSpan sealed = blob.subspan(format::BOX_HEADER_SIZE);

    BoxKeypair own = DeriveBoxKeypair();
    auto plaintext = BoxOpen(sealed, nonce, ephemeralPk, own.secretKey);
    if (!plaintext) {
        LOG_DEBUG(util::LogCategory::BOX) << "box decryption rejected: authentication failed";
        throw EncryptionError(ErrorKind::DecryptionFailed,
                              "Invalid encryption key or corrupted data");
    }
    return std::move(*plaintext);
}

bool BoxCodec::IsBoxEncrypted(ByteSpan blob) {
    return lumencrypt::IsBoxEncrypted(blob);
}

BoxKeypair BoxCodec::GenerateBoxKeypair() {
    return lumencrypt::GenerateBoxKeypair();
}

} // namespace lumencrypt

// LUMENCRYPT - Asymmetric (Box) Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Pay-link encryption: anyone holding a recipient's box public key can
// encrypt to it; only the recipient's session can decrypt.

#ifndef LUMENCRYPT_ENCRYPTION_BOX_CODEC_H
#define LUMENCRYPT_ENCRYPTION_BOX_CODEC_H

#include <string>
#include "lumencrypt/core/types.h"
#include "lumencrypt/crypto/box.h"
#include "lumencrypt/encryption/keys.h"

namespace lumencrypt {

/// Domain separation suffix for the box secret: keccak256(v2 || "box")
constexpr const char* BOX_KEY_DOMAIN = "box";

class BoxCodec {
public:
    /// The KeyMaterial must outlive the codec
    explicit BoxCodec(const KeyMaterial& keys) : keys_(keys) {}

    /**
     * Deterministic keypair of this session: the secret is
     * keccak256(v2 || "box") and the public key its Curve25519 base-point
     * multiple.
     *
     * @throws EncryptionError(KeyNotDerived) without v2 key material
     */
    BoxKeypair DeriveBoxKeypair() const;

    /// Hex of the box public key, safe to embed in a pay link
    std::string GetPublicKeyHex() const;

    /**
     * Encrypt for a recipient with a fresh ephemeral keypair and nonce.
     * Output: 00*7 03 || ephemeralPk(32) || nonce(24) || mac(16) || ciphertext
     *
     * @throws EncryptionError(InvalidKeyLength) unless the key is a usable
     *         32-byte Curve25519 public key
     */
    static Bytes EncryptForRecipient(ByteSpan plaintext, ByteSpan recipientPublicKey);

    /**
     * Open a box blob addressed to this session.
     *
     * @throws EncryptionError(KeyNotSet) without v2 key material
     * @throws EncryptionError(DecryptionFailed) on any other failure
     */
    Bytes DecryptOwn(ByteSpan blob) const;

    /// True if the blob carries the box version tag
    static bool IsBoxEncrypted(ByteSpan blob);

    /// Fresh random keypair, unrelated to any wallet
    static BoxKeypair GenerateBoxKeypair();

private:
    const KeyMaterial& keys_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_BOX_CODEC_H

// LUMENCRYPT - Symmetric Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#ifndef LUMENCRYPT_ENCRYPTION_SYMMETRIC_H
#define LUMENCRYPT_ENCRYPTION_SYMMETRIC_H

#include "lumencrypt/core/types.h"
#include "lumencrypt/encryption/keys.h"

namespace lumencrypt {

/**
 * Symmetric encryption under a session's KeyMaterial.
 *
 * V2 (current): AES-256-GCM with the 32-byte v2 key and a fresh random
 * 96-bit nonce per call.
 *
 * V1 (legacy): AES-128-CTR keyed with v1[0:16], authenticated by
 * HMAC-SHA256 keyed with v1[16:31] over nonce || ciphertext, truncated to
 * 16 bytes. Kept bit-exact so existing on-chain data stays readable; new
 * data is never written with it outside of fixtures.
 *
 * The codec holds a reference to the KeyMaterial, which must outlive it.
 */
class SymmetricCodec {
public:
    explicit SymmetricCodec(const KeyMaterial& keys) : keys_(keys) {}

    /// @throws EncryptionError(KeyNotSet) without v2 key material
    Bytes EncryptV2(ByteSpan plaintext) const;

    /// Legacy writer for backward-compatibility fixtures only
    /// @throws EncryptionError(KeyNotSet) without v1 key material
    Bytes EncryptV1(ByteSpan plaintext) const;

    /**
     * Decrypt a V1 or V2 blob, routed by the 8-byte V2 tag.
     *
     * @throws EncryptionError(KeyNotSet) if the routed version's key is absent
     * @throws EncryptionError(DecryptionFailed) on authentication failure or
     *         truncated input
     */
    Bytes Decrypt(ByteSpan blob) const;

    /**
     * V2-format encryption under a caller-supplied key, for data addressed
     * to someone else. Never pass a key derived from wallet secrets.
     *
     * @throws EncryptionError(InvalidKeyLength) unless key is 32 bytes
     */
    static Bytes EncryptWithExternalKey(ByteSpan plaintext, ByteSpan key);

private:
    Bytes DecryptV1(ByteSpan blob) const;
    Bytes DecryptV2(ByteSpan blob) const;

    const KeyMaterial& keys_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_SYMMETRIC_H

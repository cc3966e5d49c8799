// LUMENCRYPT - Symmetric Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/symmetric.h"
#include "lumencrypt/core/random.h"
#include "lumencrypt/crypto/aes.h"
#include "lumencrypt/crypto/hmac.h"
#include "lumencrypt/encryption/errors.h"
#include "lumencrypt/encryption/format.h"
#include "lumencrypt/util/logging.h"

#include <utility>

namespace lumencrypt {

namespace {

Bytes SealV2(ByteSpan plaintext, ByteSpan key) {
    auto nonce = GetRandArray<format::V2_NONCE_SIZE>();
    GCMSealed sealed = AES256GCMEncrypt(key, nonce, plaintext);

    Bytes blob;
    blob.reserve(format::V2_HEADER_SIZE + sealed.ciphertext.size());
    blob.insert(blob.end(), format::VERSION_TAG_V2.begin(), format::VERSION_TAG_V2.end());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), sealed.tag.begin(), sealed.tag.end());
    blob.insert(blob.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
    return blob;
}

/// Truncated HMAC-SHA256(macKey, nonce || ciphertext)
std::array<Byte, format::V1_TAG_SIZE> LegacyTag(ByteSpan macKey, ByteSpan nonce,
                                                ByteSpan ciphertext) {
    HMAC_SHA256 mac(macKey.data(), macKey.size());
    mac.Write(nonce).Write(ciphertext);
    Hash256 full = mac.Finalize();

    std::array<Byte, format::V1_TAG_SIZE> tag{};
    std::copy(full.begin(), full.begin() + format::V1_TAG_SIZE, tag.begin());
    SecureZero(full.data(), full.size());
    return tag;
}

[[noreturn]] void FailDecryption(WireFormat format, const char* reason) {
    LOG_DEBUG(util::LogCategory::CODEC) << WireFormatToString(format)
                                        << " decryption rejected: " << reason;
    throw EncryptionError(ErrorKind::DecryptionFailed,
                          "Invalid encryption key or corrupted data");
}

} // anonymous namespace

// ============================================================================
// Encryption
// ============================================================================

Bytes SymmetricCodec::EncryptV2(ByteSpan plaintext) const {
    return SealV2(plaintext, keys_.V2());
}

Bytes SymmetricCodec::EncryptV1(ByteSpan plaintext) const {
    ByteSpan v1 = keys_.V1();
    ByteSpan cipherKey = v1.first(KeyMaterial::V1_CIPHER_KEY_SIZE);
    ByteSpan macKey = v1.subspan(KeyMaterial::V1_MAC_KEY_OFFSET, KeyMaterial::V1_MAC_KEY_SIZE);

    auto nonce = GetRandArray<format::V1_NONCE_SIZE>();
    Bytes ciphertext = AES128CTRCrypt(cipherKey, nonce, plaintext);
    auto tag = LegacyTag(macKey, nonce, ciphertext);

    Bytes blob;
    blob.reserve(format::V1_HEADER_SIZE + ciphertext.size());
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), tag.begin(), tag.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
    return blob;
}

Bytes SymmetricCodec::EncryptWithExternalKey(ByteSpan plaintext, ByteSpan key) {
    if (key.size() != KeyMaterial::V2_SIZE) {
        throw EncryptionError(ErrorKind::InvalidKeyLength, "external key must be 32 bytes");
    }
    return SealV2(plaintext, key);
}

// ============================================================================
// Decryption
// ============================================================================

Bytes SymmetricCodec::Decrypt(ByteSpan blob) const {
    if (HasV2Tag(blob)) {
        if (!keys_.HasV2()) {
            throw EncryptionError(ErrorKind::KeyNotSet, "V2 encryption key not set");
        }
        return DecryptV2(blob);
    }

    if (!keys_.HasV1()) {
        throw EncryptionError(ErrorKind::KeyNotSet, "V1 encryption key not set");
    }
    return DecryptV1(blob);
}

Bytes SymmetricCodec::DecryptV1(ByteSpan blob) const {
    if (blob.size() < format::V1_HEADER_SIZE) {
        FailDecryption(WireFormat::V1, "truncated");
    }

    ByteSpan nonce = blob.first(format::V1_NONCE_SIZE);
    ByteSpan tag = blob.subspan(format::V1_NONCE_SIZE, format::V1_TAG_SIZE);
    ByteSpan ciphertext = blob.subspan(format::V1_HEADER_SIZE);

    ByteSpan v1 = keys_.V1();
    ByteSpan macKey = v1.subspan(KeyMaterial::V1_MAC_KEY_OFFSET, KeyMaterial::V1_MAC_KEY_SIZE);

    // Authenticate before any plaintext is produced
    auto expected = LegacyTag(macKey, nonce, ciphertext);
    if (!ConstantTimeCompare(tag.data(), expected.data(), expected.size())) {
        FailDecryption(WireFormat::V1, "tag mismatch");
    }

    return AES128CTRCrypt(v1.first(KeyMaterial::V1_CIPHER_KEY_SIZE), nonce, ciphertext);
}

Bytes SymmetricCodec::DecryptV2(ByteSpan blob) const {
    if (blob.size() < format::V2_HEADER_SIZE) {
        FailDecryption(WireFormat::V2, "truncated");
    }

    ByteSpan nonce = blob.subspan(format::VERSION_TAG_SIZE, format::V2_NONCE_SIZE);
    ByteSpan tag = blob.subspan(format::VERSION_TAG_SIZE + format::V2_NONCE_SIZE,
                                format::V2_TAG_SIZE);
    ByteSpan ciphertext = blob.subspan(format::V2_HEADER_SIZE);

    auto plaintext = AES256GCMDecrypt(keys_.V2(), nonce, ciphertext, tag);
    if (!plaintext) {
        FailDecryption(WireFormat::V2, "tag mismatch");
    }
    return std::move(*plaintext);
}

} // namespace lumencrypt

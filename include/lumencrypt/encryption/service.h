// LUMENCRYPT - Encryption Service
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Public surface of the library: derive a wallet session's keys once,
// then encrypt and decrypt raw buffers and UTXO records for that session
// or for pay-link recipients.

#ifndef LUMENCRYPT_ENCRYPTION_SERVICE_H
#define LUMENCRYPT_ENCRYPTION_SERVICE_H

#include <string>
#include "lumencrypt/core/types.h"
#include "lumencrypt/crypto/box.h"
#include "lumencrypt/encryption/box_codec.h"
#include "lumencrypt/encryption/errors.h"
#include "lumencrypt/encryption/format.h"
#include "lumencrypt/encryption/keys.h"
#include "lumencrypt/encryption/options.h"
#include "lumencrypt/encryption/symmetric.h"
#include "lumencrypt/encryption/utxo.h"

namespace lumencrypt {

/**
 * One wallet session.
 *
 * Every failure is raised as EncryptionError. Instances share no mutable
 * state. Within an instance, key material is read-only after derivation:
 * any number of threads may encrypt and decrypt concurrently, but the
 * Derive*, Import* and Reset calls are writers and the caller must
 * serialize them against all other calls (single writer, multiple readers).
 */
class EncryptionService {
public:
    EncryptionService();
    explicit EncryptionService(const EncryptionOptions& options);

    EncryptionService(const EncryptionService&) = delete;
    EncryptionService& operator=(const EncryptionService&) = delete;

    // ========================================================================
    // Key Derivation
    // ========================================================================

    /// Derive both key sets from a wallet signature
    const KeyMaterial& DeriveFromSignature(ByteSpan signature);

    /// Have the wallet sign the configured message, then derive
    const KeyMaterial& DeriveFromWalletSigner(const KeyDerivation::SignFunction& sign);

    /// Sign the configured message with a local Ed25519 key, then derive
    const KeyMaterial& DeriveFromWalletKeypair(ByteSpan secretKey);

    /// Install a raw legacy V1 key set only
    void ImportKeyV1(ByteSpan v1) { keys_.ImportKeyV1(v1); }

    /// Install a raw V2 key set only
    void ImportKeyV2(ByteSpan v2) { keys_.ImportKeyV2(v2); }

    const std::string& GetUtxoPrivateKey(KeyVersion version) const {
        return keys_.GetUtxoPrivateKey(version);
    }

    bool HasUtxoPrivateKey(KeyVersion version) const {
        return keys_.HasUtxoPrivateKey(version);
    }

    /// V2 key for V2-tagged blobs, V1 key otherwise
    const std::string& DeriveUtxoPrivateKey(ByteSpan blob) const {
        return keys_.DeriveUtxoPrivateKey(blob);
    }

    const KeyMaterial& Material() const { return keys_.Material(); }

    /// Wipe all key material and cached private keys
    void Reset() { keys_.Reset(); }

    // ========================================================================
    // Raw Buffers
    // ========================================================================

    /// V2 encryption under this session's key
    Bytes Encrypt(ByteSpan plaintext) const { return symmetric_.EncryptV2(plaintext); }
    Bytes Encrypt(const std::string& plaintext) const { return Encrypt(AsBytes(plaintext)); }

    /// Legacy V1 writer for fixtures only
    Bytes EncryptV1(ByteSpan plaintext) const { return symmetric_.EncryptV1(plaintext); }

    /// Decrypt a V1 or V2 blob
    Bytes Decrypt(ByteSpan blob) const { return symmetric_.Decrypt(blob); }
    Bytes Decrypt(const std::string& hexBlob) const;

    /// V2 encryption under a caller-supplied 32-byte key
    Bytes EncryptWithExternalKey(ByteSpan plaintext, ByteSpan key) const {
        return SymmetricCodec::EncryptWithExternalKey(plaintext, key);
    }

    // ========================================================================
    // Pay Links (Box)
    // ========================================================================

    BoxKeypair DeriveBoxKeypair() const { return box_.DeriveBoxKeypair(); }

    /// Box public key as hex, safe to share
    std::string GetPublicKeyHex() const { return box_.GetPublicKeyHex(); }

    Bytes EncryptForRecipient(ByteSpan plaintext, ByteSpan recipientPublicKey) const {
        return BoxCodec::EncryptForRecipient(plaintext, recipientPublicKey);
    }

    /// Open a box blob addressed to this session
    Bytes DecryptBox(ByteSpan blob) const { return box_.DecryptOwn(blob); }
    Bytes DecryptBox(const std::string& hexBlob) const;

    static BoxKeypair GenerateBoxKeypair() { return BoxCodec::GenerateBoxKeypair(); }

    // ========================================================================
    // UTXO Records
    // ========================================================================

    Bytes EncryptRecord(const UtxoRecord& record) const { return utxo_.EncryptRecord(record); }

    /// Legacy V1 writer for fixtures only
    Bytes EncryptRecordV1(const UtxoRecord& record) const {
        return utxo_.EncryptRecordV1(record);
    }

    Bytes EncryptRecordForRecipient(const UtxoRecord& record,
                                    ByteSpan recipientPublicKey) const {
        return UtxoCodec::EncryptRecordForRecipient(record, recipientPublicKey);
    }

    UtxoRecord DecryptRecord(ByteSpan blob) const { return utxo_.DecryptRecord(blob); }
    UtxoRecord DecryptRecord(const std::string& hexBlob) const;

    // ========================================================================
    // Format Detection
    // ========================================================================

    static WireFormat DetectFormat(ByteSpan blob) { return ClassifyBlob(blob); }
    static bool IsBoxEncrypted(ByteSpan blob) { return BoxCodec::IsBoxEncrypted(blob); }
    static KeyVersion DeriveKeyVersionForBlob(ByteSpan blob) {
        return UtxoCodec::DeriveKeyVersionForBlob(blob);
    }
    static KeyVersion DeriveKeyVersionForBlob(const std::string& hexBlob);

    const EncryptionOptions& Options() const { return options_; }

private:
    EncryptionOptions options_;
    KeyDerivation keys_;
    SymmetricCodec symmetric_;
    BoxCodec box_;
    UtxoCodec utxo_;
};

/**
 * Decode a hex blob (optional 0x prefix).
 *
 * @throws EncryptionError(DecryptionFailed) if the text is not valid hex
 */
Bytes DecodeBlobHex(const std::string& hexBlob);

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_SERVICE_H

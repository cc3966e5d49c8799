// LUMENCRYPT - Encryption Service
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/service.h"
#include "lumencrypt/core/hex.h"
#include "lumencrypt/util/logging.h"

#include <utility>

namespace lumencrypt {

Bytes DecodeBlobHex(const std::string& hexBlob) {
    auto bytes = TryHexToBytes(hexBlob);
    if (!bytes) {
        LOG_DEBUG(util::LogCategory::CODEC) << "rejected blob: invalid hex";
        throw EncryptionError(ErrorKind::DecryptionFailed,
                              "Invalid encryption key or corrupted data");
    }
    return std::move(*bytes);
}

EncryptionService::EncryptionService()
    : EncryptionService(EncryptionOptions{}) {}

EncryptionService::EncryptionService(const EncryptionOptions& options)
    : options_(options)
    , keys_(options_.signMessage)
    , symmetric_(keys_.Material())
    , box_(keys_.Material())
    , utxo_(keys_, symmetric_, box_) {}

const KeyMaterial& EncryptionService::DeriveFromSignature(ByteSpan signature) {
    return keys_.DeriveFromSignature(signature);
}

const KeyMaterial& EncryptionService::DeriveFromWalletSigner(
    const KeyDerivation::SignFunction& sign) {
    return keys_.DeriveFromWalletSigner(sign);
}

const KeyMaterial& EncryptionService::DeriveFromWalletKeypair(ByteSpan secretKey) {
    return keys_.DeriveFromWalletKeypair(secretKey);
}

Bytes EncryptionService::Decrypt(const std::string& hexBlob) const {
    return Decrypt(DecodeBlobHex(hexBlob));
}

Bytes EncryptionService::DecryptBox(const std::string& hexBlob) const {
    return DecryptBox(DecodeBlobHex(hexBlob));
}

UtxoRecord EncryptionService::DecryptRecord(const std::string& hexBlob) const {
    return DecryptRecord(DecodeBlobHex(hexBlob));
}

KeyVersion EncryptionService::DeriveKeyVersionForBlob(const std::string& hexBlob) {
    return DeriveKeyVersionForBlob(DecodeBlobHex(hexBlob));
}

} // namespace lumencrypt

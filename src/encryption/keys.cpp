// LUMENCRYPT - Key Derivation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/keys.h"
#include "lumencrypt/core/hex.h"
#include "lumencrypt/crypto/ed25519.h"
#include "lumencrypt/crypto/keccak.h"
#include "lumencrypt/crypto/sha256.h"
#include "lumencrypt/encryption/errors.h"
#include "lumencrypt/util/logging.h"

#include <stdexcept>
#include <utility>

namespace lumencrypt {

namespace {

std::string PrivateKeyHex(Hash256& digest) {
    std::string hex = BytesToPrefixedHex(digest.data(), digest.size());
    SecureZero(digest.data(), digest.size());
    return hex;
}

} // anonymous namespace

// ============================================================================
// KeyMaterial
// ============================================================================

void KeyMaterial::SetV1(ByteSpan key) {
    if (key.size() != V1_SIZE) {
        throw EncryptionError(ErrorKind::InvalidKeyLength, "V1 key must be 31 bytes");
    }
    std::copy(key.begin(), key.end(), v1_.data());
    hasV1_ = true;
}

void KeyMaterial::SetV2(ByteSpan key) {
    if (key.size() != V2_SIZE) {
        throw EncryptionError(ErrorKind::InvalidKeyLength, "V2 key must be 32 bytes");
    }
    std::copy(key.begin(), key.end(), v2_.data());
    hasV2_ = true;
}

ByteSpan KeyMaterial::V1() const {
    if (!hasV1_) {
        throw EncryptionError(ErrorKind::KeyNotSet, "V1 encryption key not set");
    }
    return v1_.View();
}

ByteSpan KeyMaterial::V2() const {
    if (!hasV2_) {
        throw EncryptionError(ErrorKind::KeyNotSet, "V2 encryption key not set");
    }
    return v2_.View();
}

void KeyMaterial::Clear() {
    v1_.Wipe();
    v2_.Wipe();
    hasV1_ = false;
    hasV2_ = false;
}

// ============================================================================
// KeyDerivation
// ============================================================================

KeyDerivation::KeyDerivation(std::string signMessage)
    : signMessage_(std::move(signMessage)) {}

KeyDerivation::~KeyDerivation() {
    Reset();
}

const KeyMaterial& KeyDerivation::DeriveFromSignature(ByteSpan signature) {
    if (signature.size() < KeyMaterial::V1_SIZE) {
        throw EncryptionError(ErrorKind::InvalidKeyLength,
                              "signature must be at least 31 bytes");
    }

    Hash256 v2 = Keccak256Hash(signature);

    material_.SetV1(signature.first(KeyMaterial::V1_SIZE));
    material_.SetV2(ByteSpan(v2.data(), v2.size()));
    SecureZero(v2.data(), v2.size());

    CacheUtxoKeyV1();
    CacheUtxoKeyV2();

    LOG_DEBUG(util::LogCategory::KEYS) << "Derived v1 and v2 key material from a "
                                       << signature.size() << "-byte signature";
    return material_;
}

const KeyMaterial& KeyDerivation::DeriveFromWalletSigner(const SignFunction& sign) {
    if (!sign) {
        throw std::invalid_argument("Wallet signing function is empty");
    }

    Bytes signature = sign(AsBytes(signMessage_));
    try {
        DeriveFromSignature(signature);
    } catch (...) {
        SecureWipe(signature);
        throw;
    }
    SecureWipe(signature);
    return material_;
}

const KeyMaterial& KeyDerivation::DeriveFromWalletKeypair(ByteSpan secretKey) {
    Ed25519Signature signature;
    if (secretKey.size() == ed25519::SECRET_KEY_SIZE) {
        signature = Ed25519Sign(secretKey, AsBytes(signMessage_));
    } else if (secretKey.size() == ed25519::SEED_SIZE) {
        Ed25519Keypair wallet = Ed25519KeypairFromSeed(secretKey);
        signature = Ed25519Sign(wallet.secretKey, AsBytes(signMessage_));
    } else {
        throw EncryptionError(ErrorKind::InvalidKeyLength,
                              "wallet secret key must be 64 bytes or a 32-byte seed");
    }

    DeriveFromSignature(signature);
    SecureZero(signature.data(), signature.size());
    return material_;
}

void KeyDerivation::ImportKeyV1(ByteSpan v1) {
    material_.SetV1(v1);
    CacheUtxoKeyV1();
    LOG_DEBUG(util::LogCategory::KEYS) << "Imported v1 key material";
}

void KeyDerivation::ImportKeyV2(ByteSpan v2) {
    material_.SetV2(v2);
    CacheUtxoKeyV2();
    LOG_DEBUG(util::LogCategory::KEYS) << "Imported v2 key material";
}

void KeyDerivation::CacheUtxoKeyV1() {
    Hash256 digest = SHA256Hash(material_.V1());
    SecureWipe(utxoPrivateKeyV1_);
    utxoPrivateKeyV1_ = PrivateKeyHex(digest);
}

void KeyDerivation::CacheUtxoKeyV2() {
    Hash256 digest = Keccak256Hash(material_.V2());
    SecureWipe(utxoPrivateKeyV2_);
    utxoPrivateKeyV2_ = PrivateKeyHex(digest);
}

const std::string& KeyDerivation::GetUtxoPrivateKey(KeyVersion version) const {
    const std::string& key = version == KeyVersion::V1 ? utxoPrivateKeyV1_ : utxoPrivateKeyV2_;
    if (key.empty()) {
        throw EncryptionError(ErrorKind::KeyNotDerived,
                              std::string("UTXO private key ") + KeyVersionToString(version) +
                              " has not been derived");
    }
    return key;
}

bool KeyDerivation::HasUtxoPrivateKey(KeyVersion version) const {
    return version == KeyVersion::V1 ? !utxoPrivateKeyV1_.empty()
                                     : !utxoPrivateKeyV2_.empty();
}

const std::string& KeyDerivation::DeriveUtxoPrivateKey(ByteSpan blob) const {
    return GetUtxoPrivateKey(SymmetricKeyVersion(blob));
}

void KeyDerivation::Reset() {
    material_.Clear();
    SecureWipe(utxoPrivateKeyV1_);
    SecureWipe(utxoPrivateKeyV2_);
}

} // namespace lumencrypt

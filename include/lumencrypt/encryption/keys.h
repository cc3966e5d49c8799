// LUMENCRYPT - Key Derivation
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Turns a wallet signature over a fixed message into two independent
// symmetric key sets and the UTXO private keys derived from them:
//
//   v1           = signature[0:31]
//   v2           = keccak256(signature)
//   utxoKey(v1)  = "0x" || hex(sha256(v1))
//   utxoKey(v2)  = "0x" || hex(keccak256(v2))

#ifndef LUMENCRYPT_ENCRYPTION_KEYS_H
#define LUMENCRYPT_ENCRYPTION_KEYS_H

#include <functional>
#include <string>
#include "lumencrypt/core/types.h"
#include "lumencrypt/crypto/secure.h"
#include "lumencrypt/encryption/format.h"

namespace lumencrypt {

/// Message a wallet signs to unlock its encryption keys
constexpr const char* DEFAULT_SIGN_MESSAGE = "Privacy Money account sign in";

// ============================================================================
// Key Material
// ============================================================================

/**
 * The two symmetric key sets of one wallet session.
 *
 * Storage is locked in memory where possible and zeroed on Clear() and on
 * destruction. Not copyable.
 */
class KeyMaterial {
public:
    static constexpr size_t V1_SIZE = 31;
    static constexpr size_t V2_SIZE = 32;

    /// AES-128-CTR key: v1[0:16]
    static constexpr size_t V1_CIPHER_KEY_SIZE = 16;
    /// HMAC-SHA256 key: v1[16:31]
    static constexpr size_t V1_MAC_KEY_OFFSET = 16;
    static constexpr size_t V1_MAC_KEY_SIZE = V1_SIZE - V1_MAC_KEY_OFFSET;

    KeyMaterial() = default;
    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    /// @throws EncryptionError(InvalidKeyLength) unless key is 31 bytes
    void SetV1(ByteSpan key);

    /// @throws EncryptionError(InvalidKeyLength) unless key is 32 bytes
    void SetV2(ByteSpan key);

    bool HasV1() const { return hasV1_; }
    bool HasV2() const { return hasV2_; }
    bool Has(KeyVersion version) const {
        return version == KeyVersion::V1 ? hasV1_ : hasV2_;
    }

    /// @throws EncryptionError(KeyNotSet) if absent
    ByteSpan V1() const;

    /// @throws EncryptionError(KeyNotSet) if absent
    ByteSpan V2() const;

    /// Zero both key sets
    void Clear();

private:
    SecureArray<Byte, V1_SIZE> v1_;
    SecureArray<Byte, V2_SIZE> v2_;
    bool hasV1_{false};
    bool hasV2_{false};
};

// ============================================================================
// Key Derivation
// ============================================================================

/**
 * Owns one session's KeyMaterial and the cached UTXO private keys.
 *
 * Thread safety: after derivation the cached state is read-only, so
 * concurrent readers are safe. Derive*, Import* and Reset are writers and
 * must not overlap any other call on the same instance.
 */
class KeyDerivation {
public:
    /// Wallet signing capability: returns the signature over message
    using SignFunction = std::function<Bytes(ByteSpan message)>;

    explicit KeyDerivation(std::string signMessage = DEFAULT_SIGN_MESSAGE);
    ~KeyDerivation();

    KeyDerivation(const KeyDerivation&) = delete;
    KeyDerivation& operator=(const KeyDerivation&) = delete;

    /**
     * Derive both key sets from a wallet signature and cache the UTXO
     * private keys. Deterministic; calling twice with the same signature
     * leaves identical state.
     *
     * Signatures are expected to be 64 bytes but any length of at least
     * 31 bytes is accepted.
     *
     * @throws EncryptionError(InvalidKeyLength) if shorter than 31 bytes
     */
    const KeyMaterial& DeriveFromSignature(ByteSpan signature);

    /// Sign the configured message with a wallet and derive from the result
    const KeyMaterial& DeriveFromWalletSigner(const SignFunction& sign);

    /**
     * Sign the configured message with a local Ed25519 wallet key and
     * derive from the detached signature.
     *
     * @param secretKey 64-byte secret key (seed || publicKey) or 32-byte seed
     * @throws EncryptionError(InvalidKeyLength) for any other length
     */
    const KeyMaterial& DeriveFromWalletKeypair(ByteSpan secretKey);

    /// Install a single raw V1 key set (legacy sessions, fixtures)
    void ImportKeyV1(ByteSpan v1);

    /// Install a single raw V2 key set
    void ImportKeyV2(ByteSpan v2);

    /// @throws EncryptionError(KeyNotDerived) if that version was never derived
    const std::string& GetUtxoPrivateKey(KeyVersion version) const;

    bool HasUtxoPrivateKey(KeyVersion version) const;

    /// V2 private key for blobs carrying the V2 tag, V1 key otherwise
    const std::string& DeriveUtxoPrivateKey(ByteSpan blob) const;

    const KeyMaterial& Material() const { return material_; }

    const std::string& SignMessage() const { return signMessage_; }

    /// Wipe all key material and cached private keys
    void Reset();

private:
    void CacheUtxoKeyV1();
    void CacheUtxoKeyV2();

    std::string signMessage_;
    KeyMaterial material_;
    std::string utxoPrivateKeyV1_;
    std::string utxoPrivateKeyV2_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_KEYS_H

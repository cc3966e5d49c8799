// LUMENCRYPT - Key Derivation Tests
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include <gtest/gtest.h>
#include "lumencrypt/encryption/keys.h"
#include "lumencrypt/core/hex.h"
#include "lumencrypt/crypto/ed25519.h"
#include "lumencrypt/crypto/keccak.h"
#include "lumencrypt/crypto/sha256.h"
#include "encryption_test_util.h"

#include <stdexcept>
#include <string>

namespace lumencrypt {
namespace test {

// ============================================================================
// KeyMaterial
// ============================================================================

TEST(KeyMaterialTest, StartsEmpty) {
    KeyMaterial material;
    EXPECT_FALSE(material.HasV1());
    EXPECT_FALSE(material.HasV2());
    EXPECT_ENCRYPTION_ERROR(material.V1(), ErrorKind::KeyNotSet);
    EXPECT_ENCRYPTION_ERROR(material.V2(), ErrorKind::KeyNotSet);
}

TEST(KeyMaterialTest, RejectsWrongLengths) {
    KeyMaterial material;
    EXPECT_ENCRYPTION_ERROR(material.SetV1(Bytes(32, 1)), ErrorKind::InvalidKeyLength);
    EXPECT_ENCRYPTION_ERROR(material.SetV2(Bytes(31, 1)), ErrorKind::InvalidKeyLength);
    EXPECT_FALSE(material.HasV1());
    EXPECT_FALSE(material.HasV2());
}

TEST(KeyMaterialTest, ClearForgetsBothSets) {
    KeyMaterial material;
    material.SetV1(Bytes(31, 1));
    material.SetV2(Bytes(32, 2));
    EXPECT_TRUE(material.Has(KeyVersion::V1));
    EXPECT_TRUE(material.Has(KeyVersion::V2));

    material.Clear();
    EXPECT_FALSE(material.Has(KeyVersion::V1));
    EXPECT_FALSE(material.Has(KeyVersion::V2));
}

// ============================================================================
// Derivation From Signature
// ============================================================================

class KeyDerivationTest : public ::testing::Test {
protected:
    KeyDerivation keys_;
    Bytes signature_ = MakeSignature(0x11);
};

TEST_F(KeyDerivationTest, SplitsSignatureIntoKeySets) {
    const KeyMaterial& material = keys_.DeriveFromSignature(signature_);

    EXPECT_EQ(material.V1().ToVector(), Bytes(31, 0x11));
    EXPECT_EQ(material.V2().ToVector(), Keccak256Hash(signature_).ToBytes());
}

TEST_F(KeyDerivationTest, UtxoPrivateKeys) {
    keys_.DeriveFromSignature(signature_);

    Hash256 v2 = Keccak256Hash(signature_);
    std::string expectedV2 = "0x" + Keccak256Hash(v2.data(), v2.size()).ToHex();
    std::string expectedV1 = "0x" + SHA256Hash(Bytes(31, 0x11)).ToHex();

    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V2), expectedV2);
    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V1), expectedV1);
    EXPECT_EQ(expectedV2.size(), 66u);
    EXPECT_NE(expectedV1, expectedV2);
}

TEST_F(KeyDerivationTest, Deterministic) {
    KeyDerivation other;
    keys_.DeriveFromSignature(signature_);
    other.DeriveFromSignature(signature_);

    EXPECT_EQ(keys_.Material().V1().ToVector(), other.Material().V1().ToVector());
    EXPECT_EQ(keys_.Material().V2().ToVector(), other.Material().V2().ToVector());
    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V2),
              other.GetUtxoPrivateKey(KeyVersion::V2));
}

TEST_F(KeyDerivationTest, DifferentSignaturesDifferentKeys) {
    KeyDerivation other;
    keys_.DeriveFromSignature(signature_);
    other.DeriveFromSignature(MakeSignature(0x12));

    EXPECT_NE(keys_.Material().V2().ToVector(), other.Material().V2().ToVector());
    EXPECT_NE(keys_.GetUtxoPrivateKey(KeyVersion::V1),
              other.GetUtxoPrivateKey(KeyVersion::V1));
}

TEST_F(KeyDerivationTest, MinimumSignatureLength) {
    EXPECT_ENCRYPTION_ERROR(keys_.DeriveFromSignature(MakeSignature(0x11, 30)),
                            ErrorKind::InvalidKeyLength);
    EXPECT_FALSE(keys_.Material().HasV1());

    // Exactly 31 bytes is enough for both sets
    keys_.DeriveFromSignature(MakeSignature(0x11, 31));
    EXPECT_TRUE(keys_.Material().HasV1());
    EXPECT_TRUE(keys_.Material().HasV2());
}

TEST_F(KeyDerivationTest, RederiveReplacesKeys) {
    keys_.DeriveFromSignature(signature_);
    std::string first = keys_.GetUtxoPrivateKey(KeyVersion::V2);

    keys_.DeriveFromSignature(MakeSignature(0x22));
    EXPECT_NE(keys_.GetUtxoPrivateKey(KeyVersion::V2), first);
}

TEST_F(KeyDerivationTest, NotDerivedBeforeDerivation) {
    EXPECT_FALSE(keys_.HasUtxoPrivateKey(KeyVersion::V1));
    EXPECT_FALSE(keys_.HasUtxoPrivateKey(KeyVersion::V2));
    EXPECT_ENCRYPTION_ERROR(keys_.GetUtxoPrivateKey(KeyVersion::V1), ErrorKind::KeyNotDerived);
    EXPECT_ENCRYPTION_ERROR(keys_.GetUtxoPrivateKey(KeyVersion::V2), ErrorKind::KeyNotDerived);
}

TEST_F(KeyDerivationTest, ResetWipesEverything) {
    keys_.DeriveFromSignature(signature_);
    keys_.Reset();

    EXPECT_FALSE(keys_.Material().HasV1());
    EXPECT_FALSE(keys_.Material().HasV2());
    EXPECT_ENCRYPTION_ERROR(keys_.GetUtxoPrivateKey(KeyVersion::V2), ErrorKind::KeyNotDerived);
}

TEST_F(KeyDerivationTest, DeriveUtxoPrivateKeyFollowsTag) {
    keys_.DeriveFromSignature(signature_);

    Bytes v2Blob(format::VERSION_TAG_V2.begin(), format::VERSION_TAG_V2.end());
    v2Blob.resize(64, 0);
    Bytes boxBlob(format::VERSION_TAG_BOX.begin(), format::VERSION_TAG_BOX.end());
    boxBlob.resize(96, 0);
    Bytes legacy(48, 0x42);

    EXPECT_EQ(keys_.DeriveUtxoPrivateKey(v2Blob), keys_.GetUtxoPrivateKey(KeyVersion::V2));
    EXPECT_EQ(keys_.DeriveUtxoPrivateKey(legacy), keys_.GetUtxoPrivateKey(KeyVersion::V1));
    // Only the symmetric V2 tag selects the V2 key
    EXPECT_EQ(keys_.DeriveUtxoPrivateKey(boxBlob), keys_.GetUtxoPrivateKey(KeyVersion::V1));
}

// ============================================================================
// Wallet Signing
// ============================================================================

TEST_F(KeyDerivationTest, SignerReceivesSignMessage) {
    std::string seen;
    keys_.DeriveFromWalletSigner([&](ByteSpan message) {
        seen.assign(message.begin(), message.end());
        return MakeSignature(0x11);
    });

    EXPECT_EQ(seen, "Privacy Money account sign in");
    EXPECT_EQ(keys_.SignMessage(), DEFAULT_SIGN_MESSAGE);

    KeyDerivation direct;
    direct.DeriveFromSignature(signature_);
    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V2),
              direct.GetUtxoPrivateKey(KeyVersion::V2));
}

TEST_F(KeyDerivationTest, CustomSignMessage) {
    KeyDerivation custom("Sign in to test vault");
    std::string seen;
    custom.DeriveFromWalletSigner([&](ByteSpan message) {
        seen.assign(message.begin(), message.end());
        return MakeSignature(0x11);
    });
    EXPECT_EQ(seen, "Sign in to test vault");
}

TEST_F(KeyDerivationTest, EmptySignerRejected) {
    KeyDerivation::SignFunction none;
    EXPECT_THROW(keys_.DeriveFromWalletSigner(none), std::invalid_argument);
}

TEST_F(KeyDerivationTest, SignerWithShortSignature) {
    EXPECT_ENCRYPTION_ERROR(
        keys_.DeriveFromWalletSigner([](ByteSpan) { return MakeSignature(0x11, 8); }),
        ErrorKind::InvalidKeyLength);
}

TEST_F(KeyDerivationTest, WalletSeedAndSecretKeyAgree) {
    Bytes seed(32, 0x07);
    Ed25519Keypair wallet = Ed25519KeypairFromSeed(seed);

    KeyDerivation fromSecret;
    keys_.DeriveFromWalletKeypair(seed);
    fromSecret.DeriveFromWalletKeypair(wallet.secretKey);

    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V2),
              fromSecret.GetUtxoPrivateKey(KeyVersion::V2));

    // Same as signing by hand
    Ed25519Signature sig = Ed25519Sign(wallet.secretKey,
                                       AsBytes(std::string(DEFAULT_SIGN_MESSAGE)));
    KeyDerivation manual;
    manual.DeriveFromSignature(sig);
    EXPECT_EQ(manual.GetUtxoPrivateKey(KeyVersion::V1),
              keys_.GetUtxoPrivateKey(KeyVersion::V1));
}

TEST_F(KeyDerivationTest, WalletKeypairBadLength) {
    EXPECT_ENCRYPTION_ERROR(keys_.DeriveFromWalletKeypair(Bytes(48, 1)),
                            ErrorKind::InvalidKeyLength);
}

// ============================================================================
// Import
// ============================================================================

TEST_F(KeyDerivationTest, ImportSingleVersion) {
    keys_.ImportKeyV2(Bytes(32, 0x33));
    EXPECT_TRUE(keys_.HasUtxoPrivateKey(KeyVersion::V2));
    EXPECT_FALSE(keys_.HasUtxoPrivateKey(KeyVersion::V1));
    EXPECT_EQ(keys_.GetUtxoPrivateKey(KeyVersion::V2),
              "0x" + Keccak256Hash(Bytes(32, 0x33)).ToHex());

    EXPECT_ENCRYPTION_ERROR(keys_.ImportKeyV1(Bytes(16, 0)), ErrorKind::InvalidKeyLength);
}

} // namespace test
} // namespace lumencrypt

// LUMENCRYPT - NaCl Box and Ed25519 Tests
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include <gtest/gtest.h>
#include "lumencrypt/crypto/box.h"
#include "lumencrypt/crypto/ed25519.h"
#include "lumencrypt/core/hex.h"
#include "lumencrypt/core/random.h"

#include <string>
#include <vector>

namespace lumencrypt {
namespace test {

// ============================================================================
// Curve25519 Keypairs
// ============================================================================

TEST(BoxKeypairTest, FromSecretKeyRFC7748) {
    auto alice = HexToBytes("77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a");
    BoxKeypair kp = BoxKeypairFromSecretKey(alice);
    EXPECT_EQ(BytesToHex(kp.publicKey),
              "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
    EXPECT_EQ(BytesToHex(kp.secretKey), BytesToHex(alice));
}

TEST(BoxKeypairTest, FromSecretKeyRejectsWrongSize) {
    std::vector<Byte> shortKey(31, 1);
    EXPECT_THROW(BoxKeypairFromSecretKey(shortKey), std::invalid_argument);
}

TEST(BoxKeypairTest, GeneratedKeypairsDiffer) {
    BoxKeypair a = GenerateBoxKeypair();
    BoxKeypair b = GenerateBoxKeypair();
    EXPECT_NE(a.publicKey, b.publicKey);
    EXPECT_NE(a.secretKey, b.secretKey);
}

TEST(BoxKeypairTest, GeneratedPublicKeyMatchesSecret) {
    BoxKeypair kp = GenerateBoxKeypair();
    BoxKeypair again = BoxKeypairFromSecretKey(kp.secretKey);
    EXPECT_EQ(kp.publicKey, again.publicKey);
}

// ============================================================================
// Seal / Open
// ============================================================================

class BoxSealTest : public ::testing::Test {
protected:
    BoxKeypair sender_ = GenerateBoxKeypair();
    BoxKeypair recipient_ = GenerateBoxKeypair();
    std::array<Byte, box::NONCE_SIZE> nonce_ = GetRandArray<box::NONCE_SIZE>();
    std::string message_ = "1000|42|0|So11111111111111111111111111111111111111112";
};

TEST_F(BoxSealTest, RoundTrip) {
    auto sealed = BoxSeal(AsBytes(message_), nonce_, recipient_.publicKey, sender_.secretKey);
    EXPECT_EQ(sealed.size(), message_.size() + box::MAC_SIZE);

    auto opened = BoxOpen(sealed, nonce_, sender_.publicKey, recipient_.secretKey);
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(std::string(opened->begin(), opened->end()), message_);
}

TEST_F(BoxSealTest, EmptyMessage) {
    auto sealed = BoxSeal(ByteSpan(), nonce_, recipient_.publicKey, sender_.secretKey);
    EXPECT_EQ(sealed.size(), box::MAC_SIZE);
    auto opened = BoxOpen(sealed, nonce_, sender_.publicKey, recipient_.secretKey);
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(opened->empty());
}

TEST_F(BoxSealTest, EveryFlippedByteRejected) {
    auto sealed = BoxSeal(AsBytes(message_), nonce_, recipient_.publicKey, sender_.secretKey);
    for (size_t i = 0; i < sealed.size(); ++i) {
        auto tampered = sealed;
        tampered[i] ^= 0x01;
        EXPECT_FALSE(BoxOpen(tampered, nonce_, sender_.publicKey, recipient_.secretKey))
            << "byte " << i;
    }
}

TEST_F(BoxSealTest, WrongRecipientRejected) {
    BoxKeypair stranger = GenerateBoxKeypair();
    auto sealed = BoxSeal(AsBytes(message_), nonce_, recipient_.publicKey, sender_.secretKey);
    EXPECT_FALSE(BoxOpen(sealed, nonce_, sender_.publicKey, stranger.secretKey));
}

TEST_F(BoxSealTest, WrongNonceRejected) {
    auto sealed = BoxSeal(AsBytes(message_), nonce_, recipient_.publicKey, sender_.secretKey);
    auto otherNonce = nonce_;
    otherNonce[0] ^= 0xff;
    EXPECT_FALSE(BoxOpen(sealed, otherNonce, sender_.publicKey, recipient_.secretKey));
}

TEST_F(BoxSealTest, TooShortIsRejected) {
    std::vector<Byte> tiny(box::MAC_SIZE - 1, 0);
    EXPECT_FALSE(BoxOpen(tiny, nonce_, sender_.publicKey, recipient_.secretKey));
}

TEST_F(BoxSealTest, LowOrderRecipientRejected) {
    std::array<Byte, box::PUBLIC_KEY_SIZE> zero{};
    EXPECT_THROW(BoxSeal(AsBytes(message_), nonce_, zero, sender_.secretKey),
                 std::invalid_argument);
}

// ============================================================================
// Ed25519 (RFC 8032 test 1)
// ============================================================================

TEST(Ed25519Test, RFC8032Test1) {
    auto seed = HexToBytes("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    Ed25519Keypair kp = Ed25519KeypairFromSeed(seed);
    EXPECT_EQ(BytesToHex(kp.publicKey),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    Ed25519Signature sig = Ed25519Sign(kp.secretKey, ByteSpan());
    EXPECT_EQ(BytesToHex(sig),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
              "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
    EXPECT_TRUE(Ed25519Verify(sig, ByteSpan(), kp.publicKey));
}

TEST(Ed25519Test, SecretKeyLayoutIsSeedThenPublic) {
    auto seed = HexToBytes("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    Ed25519Keypair kp = Ed25519KeypairFromSeed(seed);
    EXPECT_TRUE(std::equal(seed.begin(), seed.end(), kp.secretKey.begin()));
    EXPECT_TRUE(std::equal(kp.publicKey.begin(), kp.publicKey.end(),
                           kp.secretKey.begin() + ed25519::SEED_SIZE));
}

TEST(Ed25519Test, SigningIsDeterministic) {
    std::vector<Byte> seed(32, 0x42);
    Ed25519Keypair kp = Ed25519KeypairFromSeed(seed);
    auto msg = AsBytes(std::string("Privacy Money account sign in"));
    EXPECT_EQ(Ed25519Sign(kp.secretKey, msg), Ed25519Sign(kp.secretKey, msg));
}

TEST(Ed25519Test, VerifyRejectsAlteredMessage) {
    std::vector<Byte> seed(32, 0x42);
    Ed25519Keypair kp = Ed25519KeypairFromSeed(seed);
    auto sig = Ed25519Sign(kp.secretKey, AsBytes(std::string("hello")));
    EXPECT_FALSE(Ed25519Verify(sig, AsBytes(std::string("hellp")), kp.publicKey));
}

TEST(Ed25519Test, RejectsWrongKeySizes) {
    std::vector<Byte> shortSeed(31, 0);
    std::vector<Byte> shortSecret(63, 0);
    EXPECT_THROW(Ed25519KeypairFromSeed(shortSeed), std::invalid_argument);
    EXPECT_THROW(Ed25519Sign(shortSecret, ByteSpan()), std::invalid_argument);
}

} // namespace test
} // namespace lumencrypt

// LUMENCRYPT - SHA-256 / Keccak-256 Tests
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include <gtest/gtest.h>
#include "lumencrypt/crypto/sha256.h"
#include "lumencrypt/crypto/keccak.h"
#include "lumencrypt/core/hex.h"

#include <array>
#include <string>
#include <vector>

namespace lumencrypt {
namespace test {

namespace {

std::string Sha256Hex(const std::string& input) {
    return SHA256Hash(AsBytes(input)).ToHex();
}

std::string KeccakHex(const std::string& input) {
    return Keccak256Hash(AsBytes(input)).ToHex();
}

} // anonymous namespace

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(Sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    const std::string message = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    SHA256 hasher;
    hasher.Write(AsBytes(message.substr(0, 7)));
    hasher.Write(AsBytes(message.substr(7)));
    std::array<Byte, SHA256::OUTPUT_SIZE> out{};
    hasher.Finalize(out.data());

    EXPECT_EQ(BytesToHex(out), Sha256Hex(message));
}

TEST(SHA256Test, FinalizeResetsState) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> first{};
    std::array<Byte, SHA256::OUTPUT_SIZE> second{};

    hasher.Write(AsBytes(std::string("abc")));
    hasher.Finalize(first.data());
    hasher.Write(AsBytes(std::string("abc")));
    hasher.Finalize(second.data());

    EXPECT_EQ(first, second);
}

// ============================================================================
// Keccak-256 (original Keccak padding, as used by Ethereum)
// ============================================================================

TEST(Keccak256Test, EmptyString) {
    EXPECT_EQ(KeccakHex(""),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, Abc) {
    EXPECT_EQ(KeccakHex("abc"),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, QuickBrownFox) {
    EXPECT_EQ(KeccakHex("The quick brown fox jumps over the lazy dog"),
              "4d741b6f1eb29cb2a9b9911c82f56fa8d73b04959d3d9d222895df6c0b28aa15");
}

TEST(Keccak256Test, DiffersFromSha3Padding) {
    // SHA3-256("") is a7ffc6f8...; Keccak-256 must not produce it
    EXPECT_NE(KeccakHex(""),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(Keccak256Test, IncrementalAcrossRateBoundary) {
    std::vector<Byte> data(300);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<Byte>(i * 7 + 1);
    }
    Hash256 oneShot = Keccak256Hash(ByteSpan(data));

    // Split points straddle the 136-byte rate
    for (size_t split : {1u, 135u, 136u, 137u, 272u, 299u}) {
        Keccak256 hasher;
        hasher.Write(data.data(), split);
        hasher.Write(data.data() + split, data.size() - split);
        Hash256 incremental;
        hasher.Finalize(incremental.data());
        EXPECT_EQ(incremental, oneShot) << "split at " << split;
    }
}

TEST(Keccak256Test, ExactlyOneBlock) {
    std::vector<Byte> block(Keccak256::RATE, 0x61);
    Keccak256 a;
    a.Write(block.data(), block.size());
    Hash256 h1;
    a.Finalize(h1.data());

    Keccak256 b;
    for (Byte byte : block) {
        b.Write(&byte, 1);
    }
    Hash256 h2;
    b.Finalize(h2.data());

    EXPECT_EQ(h1, h2);
    EXPECT_FALSE(h1.IsNull());
}

TEST(Keccak256Test, EmptyWriteIsNoop) {
    Keccak256 hasher;
    hasher.Write(nullptr, 0);
    hasher.Write(AsBytes(std::string("abc")));
    Hash256 out;
    hasher.Finalize(out.data());
    EXPECT_EQ(out.ToHex(), KeccakHex("abc"));
}

} // namespace test
} // namespace lumencrypt

// LUMENCRYPT - Core Types Tests
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include <gtest/gtest.h>
#include "lumencrypt/core/types.h"

#include <array>
#include <string>
#include <vector>

using namespace lumencrypt;

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(hash[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    Hash256 hash;
    EXPECT_EQ(hash.size(), 32u);
}

TEST(Hash256Test, ConstructFromShortBytesZeroPads) {
    std::vector<Byte> bytes = {0xde, 0xad};
    Hash256 hash(bytes.data(), bytes.size());
    EXPECT_EQ(hash[0], 0xde);
    EXPECT_EQ(hash[1], 0xad);
    EXPECT_EQ(hash[2], 0);
    EXPECT_FALSE(hash.IsNull());
}

TEST(Hash256Test, EqualityAndSetNull) {
    std::array<Byte, 32> raw{};
    raw[31] = 1;
    Hash256 a(raw);
    Hash256 b(raw);
    EXPECT_EQ(a, b);

    b.SetNull();
    EXPECT_NE(a, b);
    EXPECT_TRUE(b.IsNull());
}

TEST(Hash256Test, HexIsStorageOrder) {
    std::array<Byte, 32> raw{};
    raw[0] = 0x01;
    raw[31] = 0xff;
    Hash256 hash(raw);

    std::string hex = hash.ToHex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "01");
    EXPECT_EQ(hex.substr(62), "ff");
    EXPECT_EQ(Hash256::FromHex(hex), hash);
    EXPECT_EQ(Hash256::FromHex("0x" + hex), hash);
}

TEST(Hash256Test, FromHexInvalid) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(Hash256Test, ToBytes) {
    std::array<Byte, 32> raw{};
    raw[5] = 0x55;
    EXPECT_EQ(Hash256(raw).ToBytes(), std::vector<Byte>(raw.begin(), raw.end()));
}

// ============================================================================
// Span Tests
// ============================================================================

TEST(SpanTest, CreateFromVector) {
    std::vector<Byte> vec = {1, 2, 3, 4, 5};
    ByteSpan span(vec);
    EXPECT_EQ(span.size(), 5u);
    EXPECT_EQ(span.data(), vec.data());
    EXPECT_EQ(span[4], 5);
}

TEST(SpanTest, CreateFromArray) {
    std::array<Byte, 3> arr = {7, 8, 9};
    ByteSpan span(arr);
    EXPECT_EQ(span.size(), 3u);
    EXPECT_EQ(span[0], 7);
}

TEST(SpanTest, Subspan) {
    std::vector<Byte> vec = {1, 2, 3, 4, 5};
    ByteSpan span(vec);
    EXPECT_EQ(span.subspan(1, 3).ToVector(), (std::vector<Byte>{2, 3, 4}));
    EXPECT_EQ(span.subspan(3).ToVector(), (std::vector<Byte>{4, 5}));
    EXPECT_EQ(span.first(2).ToVector(), (std::vector<Byte>{1, 2}));
}

TEST(SpanTest, EmptyDefault) {
    ByteSpan span;
    EXPECT_TRUE(span.empty());
    EXPECT_EQ(span.begin(), span.end());
    EXPECT_TRUE(span.ToVector().empty());
}

TEST(SpanTest, AsBytesViewsString) {
    const std::string text = "a|b";
    ByteSpan span = AsBytes(text);
    ASSERT_EQ(span.size(), 3u);
    EXPECT_EQ(span[1], '|');
}

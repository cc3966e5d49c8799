// LUMENCRYPT - UTXO Record Tests
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include <gtest/gtest.h>
#include "lumencrypt/encryption/service.h"
#include "lumencrypt/core/hex.h"
#include "encryption_test_util.h"

#include <string>

namespace lumencrypt {
namespace test {

namespace {

UtxoRecord SampleRecord() {
    UtxoRecord record;
    record.amount = "1000";
    record.blinding = "42";
    record.index = 0;
    record.mintAddress = SampleMint();
    return record;
}

} // anonymous namespace

// ============================================================================
// Serialization
// ============================================================================

TEST(UtxoSerializeTest, PipeDelimited) {
    EXPECT_EQ(SerializeUtxo(SampleRecord()),
              "1000|42|0|So11111111111111111111111111111111111111112");
}

TEST(UtxoSerializeTest, LargeIndex) {
    UtxoRecord record = SampleRecord();
    record.index = 18446744073709551615ull;
    EXPECT_EQ(SerializeUtxo(record),
              "1000|42|18446744073709551615|So11111111111111111111111111111111111111112");
}

TEST(UtxoSerializeTest, RejectsBadFields) {
    UtxoRecord record = SampleRecord();
    record.amount = "";
    EXPECT_ENCRYPTION_ERROR(SerializeUtxo(record), ErrorKind::InvalidField);

    record = SampleRecord();
    record.blinding = "4|2";
    EXPECT_ENCRYPTION_ERROR(SerializeUtxo(record), ErrorKind::InvalidField);

    record = SampleRecord();
    record.mintAddress = "";
    EXPECT_ENCRYPTION_ERROR(SerializeUtxo(record), ErrorKind::InvalidField);
}

TEST(UtxoParseTest, ParsesFields) {
    UtxoRecord record = ParseUtxo("5|6|7|mint");
    EXPECT_EQ(record.amount, "5");
    EXPECT_EQ(record.blinding, "6");
    EXPECT_EQ(record.index, 7u);
    EXPECT_EQ(record.mintAddress, "mint");
    EXPECT_TRUE(record.SameFields(ParseUtxo(SerializeUtxo(record))));
}

TEST(UtxoParseTest, RejectsMalformed) {
    for (const char* text : {"", "a|b|c", "a|b|1|d|e", "|b|1|d", "a||1|d", "a|b||d",
                             "a|b|1|", "a|b|x|d", "a|b|-1|d", "a|b|1.5|d",
                             "a|b|18446744073709551616|d"}) {
        EXPECT_ENCRYPTION_ERROR(ParseUtxo(text), ErrorKind::MalformedRecord);
    }
}

TEST(UtxoParseTest, MaxIndex) {
    EXPECT_EQ(ParseUtxo("a|b|18446744073709551615|d").index, 18446744073709551615ull);
}

// ============================================================================
// Encrypted Records
// ============================================================================

class UtxoCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        owner_.DeriveFromSignature(MakeSignature(0x11));
        other_.DeriveFromSignature(MakeSignature(0x22));
    }

    EncryptionService owner_;
    EncryptionService other_;
};

TEST_F(UtxoCodecTest, V2RoundTrip) {
    Bytes blob = owner_.EncryptRecord(SampleRecord());
    EXPECT_EQ(EncryptionService::DetectFormat(blob), WireFormat::V2);

    UtxoRecord record = owner_.DecryptRecord(blob);
    EXPECT_TRUE(record.SameFields(SampleRecord()));
    EXPECT_EQ(record.version, KeyVersion::V2);
    EXPECT_EQ(record.privateKey, owner_.GetUtxoPrivateKey(KeyVersion::V2));
}

TEST_F(UtxoCodecTest, V1RoundTrip) {
    Bytes blob = owner_.EncryptRecordV1(SampleRecord());
    EXPECT_EQ(EncryptionService::DetectFormat(blob), WireFormat::V1);

    UtxoRecord record = owner_.DecryptRecord(blob);
    EXPECT_TRUE(record.SameFields(SampleRecord()));
    EXPECT_EQ(record.version, KeyVersion::V1);
    EXPECT_EQ(record.privateKey, owner_.GetUtxoPrivateKey(KeyVersion::V1));
}

TEST_F(UtxoCodecTest, BoxRoundTrip) {
    Bytes pk = HexToBytes(owner_.GetPublicKeyHex());
    Bytes blob = other_.EncryptRecordForRecipient(SampleRecord(), pk);
    EXPECT_TRUE(EncryptionService::IsBoxEncrypted(blob));

    UtxoRecord record = owner_.DecryptRecord(blob);
    EXPECT_TRUE(record.SameFields(SampleRecord()));
    EXPECT_EQ(record.version, KeyVersion::V2);
    EXPECT_EQ(record.privateKey, owner_.GetUtxoPrivateKey(KeyVersion::V2));

    EXPECT_ENCRYPTION_ERROR(other_.DecryptRecord(blob), ErrorKind::DecryptionFailed);
}

TEST_F(UtxoCodecTest, HexOverload) {
    Bytes blob = owner_.EncryptRecord(SampleRecord());
    std::string hex = BytesToHex(blob);

    EXPECT_TRUE(owner_.DecryptRecord(hex).SameFields(SampleRecord()));
    EXPECT_TRUE(owner_.DecryptRecord("0x" + hex).SameFields(SampleRecord()));
    EXPECT_ENCRYPTION_ERROR(owner_.DecryptRecord(std::string("zz") + hex),
                            ErrorKind::DecryptionFailed);
}

TEST_F(UtxoCodecTest, ForeignRecordRejected) {
    Bytes blob = other_.EncryptRecord(SampleRecord());
    EXPECT_ENCRYPTION_ERROR(owner_.DecryptRecord(blob), ErrorKind::DecryptionFailed);
}

TEST_F(UtxoCodecTest, MalformedPlaintext) {
    EXPECT_ENCRYPTION_ERROR(owner_.DecryptRecord(owner_.Encrypt(std::string("a|b|c"))),
                            ErrorKind::MalformedRecord);
    EXPECT_ENCRYPTION_ERROR(owner_.DecryptRecord(owner_.Encrypt(std::string("1|2|x|m"))),
                            ErrorKind::MalformedRecord);
    EXPECT_ENCRYPTION_ERROR(owner_.DecryptRecord(owner_.EncryptV1(ByteSpan())),
                            ErrorKind::MalformedRecord);
}

TEST_F(UtxoCodecTest, InvalidFieldOnEncrypt) {
    UtxoRecord record = SampleRecord();
    record.mintAddress = "So1|1";
    EXPECT_ENCRYPTION_ERROR(owner_.EncryptRecord(record), ErrorKind::InvalidField);
}

TEST_F(UtxoCodecTest, KeyVersionForBlob) {
    Bytes pk = HexToBytes(owner_.GetPublicKeyHex());
    Bytes v2 = owner_.EncryptRecord(SampleRecord());
    Bytes v1 = owner_.EncryptRecordV1(SampleRecord());
    Bytes box = other_.EncryptRecordForRecipient(SampleRecord(), pk);

    EXPECT_EQ(EncryptionService::DeriveKeyVersionForBlob(v2), KeyVersion::V2);
    EXPECT_EQ(EncryptionService::DeriveKeyVersionForBlob(v1), KeyVersion::V1);
    EXPECT_EQ(EncryptionService::DeriveKeyVersionForBlob(box), KeyVersion::V2);
    EXPECT_EQ(EncryptionService::DeriveKeyVersionForBlob(BytesToHex(v2)), KeyVersion::V2);
}

TEST_F(UtxoCodecTest, DeriveUtxoPrivateKey) {
    Bytes v2 = owner_.EncryptRecord(SampleRecord());
    Bytes v1 = owner_.EncryptRecordV1(SampleRecord());

    EXPECT_EQ(owner_.DeriveUtxoPrivateKey(v2), owner_.GetUtxoPrivateKey(KeyVersion::V2));
    EXPECT_EQ(owner_.DeriveUtxoPrivateKey(v1), owner_.GetUtxoPrivateKey(KeyVersion::V1));
}

TEST_F(UtxoCodecTest, V1RecordNeedsV1Key) {
    Bytes v1 = owner_.EncryptRecordV1(SampleRecord());

    EncryptionService v2Only;
    v2Only.ImportKeyV2(owner_.Material().V2());
    EXPECT_ENCRYPTION_ERROR(v2Only.DecryptRecord(v1), ErrorKind::KeyNotSet);
}

TEST_F(UtxoCodecTest, V1RecordSpendableWithV1KeyOnly) {
    Bytes v1 = owner_.EncryptRecordV1(SampleRecord());

    EncryptionService v1Only;
    v1Only.ImportKeyV1(owner_.Material().V1());
    EXPECT_FALSE(v1Only.HasUtxoPrivateKey(KeyVersion::V2));

    UtxoRecord record = v1Only.DecryptRecord(v1);
    EXPECT_TRUE(record.SameFields(SampleRecord()));
    EXPECT_EQ(record.version, KeyVersion::V1);
    EXPECT_EQ(record.privateKey, owner_.GetUtxoPrivateKey(KeyVersion::V1));
}

TEST(UtxoCodecKeysTest, NothingDerived) {
    EncryptionService service;
    EXPECT_ENCRYPTION_ERROR(service.EncryptRecord(SampleRecord()), ErrorKind::KeyNotSet);
    EXPECT_ENCRYPTION_ERROR(service.DecryptRecord(Bytes(64, 1)), ErrorKind::KeyNotSet);
}

} // namespace test
} // namespace lumencrypt

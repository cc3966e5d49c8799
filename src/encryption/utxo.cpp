// LUMENCRYPT - UTXO Record Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/utxo.h"
#include "lumencrypt/crypto/secure.h"
#include "lumencrypt/encryption/errors.h"
#include "lumencrypt/util/logging.h"

#include <cctype>
#include <limits>
#include <vector>

namespace lumencrypt {

namespace {

void CheckField(const std::string& value, const char* name) {
    if (value.empty()) {
        throw EncryptionError(ErrorKind::InvalidField, std::string(name) + " is empty");
    }
    if (value.find(UTXO_FIELD_DELIMITER) != std::string::npos) {
        throw EncryptionError(ErrorKind::InvalidField,
                              std::string(name) + " contains the field delimiter");
    }
}

[[noreturn]] void FailMalformed(const char* reason) {
    throw EncryptionError(ErrorKind::MalformedRecord,
                          std::string("invalid UTXO format after decryption: ") + reason);
}

uint64_t ParseIndex(const std::string& text) {
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            FailMalformed("index is not a decimal integer");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            FailMalformed("index out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

/// Bytes -> text, scrubbing the byte copy
std::string TakeText(Bytes& plaintext) {
    std::string text(plaintext.begin(), plaintext.end());
    SecureWipe(plaintext);
    return text;
}

} // anonymous namespace

// ============================================================================
// Serialization
// ============================================================================

std::string SerializeUtxo(const UtxoRecord& record) {
    CheckField(record.amount, "amount");
    CheckField(record.blinding, "blinding");
    CheckField(record.mintAddress, "mintAddress");

    std::string out;
    out.reserve(record.amount.size() + record.blinding.size() +
                record.mintAddress.size() + 24);
    out += record.amount;
    out += UTXO_FIELD_DELIMITER;
    out += record.blinding;
    out += UTXO_FIELD_DELIMITER;
    out += std::to_string(record.index);
    out += UTXO_FIELD_DELIMITER;
    out += record.mintAddress;
    return out;
}

UtxoRecord ParseUtxo(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(UTXO_FIELD_DELIMITER, start);
        parts.push_back(text.substr(start, pos == std::string::npos ? pos : pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }

    if (parts.size() != UTXO_FIELD_COUNT) {
        FailMalformed("expected 4 fields");
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            FailMalformed("empty field");
        }
    }

    UtxoRecord record;
    record.amount = parts[0];
    record.blinding = parts[1];
    record.index = ParseIndex(parts[2]);
    record.mintAddress = parts[3];
    return record;
}

// ============================================================================
// UtxoCodec
// ============================================================================

Bytes UtxoCodec::EncryptRecord(const UtxoRecord& record) const {
    std::string text = SerializeUtxo(record);
    Bytes blob = symmetric_.EncryptV2(AsBytes(text));
    SecureWipe(text);
    return blob;
}

Bytes UtxoCodec::EncryptRecordV1(const UtxoRecord& record) const {
    std::string text = SerializeUtxo(record);
    Bytes blob = symmetric_.EncryptV1(AsBytes(text));
    SecureWipe(text);
    return blob;
}

Bytes UtxoCodec::EncryptRecordForRecipient(const UtxoRecord& record,
                                           ByteSpan recipientPublicKey) {
    std::string text = SerializeUtxo(record);
    Bytes blob = BoxCodec::EncryptForRecipient(AsBytes(text), recipientPublicKey);
    SecureWipe(text);
    return blob;
}

UtxoRecord UtxoCodec::DecryptRecord(ByteSpan blob) const {
    const WireFormat format = ClassifyBlob(blob);

    Bytes plaintext;
    KeyVersion version = KeyVersion::V1;
    switch (format) {
        case WireFormat::Box:
            plaintext = box_.DecryptOwn(blob);
            version = KeyVersion::V2;
            break;
        case WireFormat::V2:
            plaintext = symmetric_.Decrypt(blob);
            version = KeyVersion::V2;
            break;
        case WireFormat::V1:
            plaintext = symmetric_.Decrypt(blob);
            version = KeyVersion::V1;
            break;
    }

    std::string text = TakeText(plaintext);
    UtxoRecord record;
    try {
        record = ParseUtxo(text);
    } catch (const EncryptionError&) {
        SecureWipe(text);
        throw;
    }
    SecureWipe(text);

    record.version = version;
    record.privateKey = keys_.GetUtxoPrivateKey(version);

    LOG_DEBUG(util::LogCategory::UTXO) << "Decrypted " << WireFormatToString(format)
                                       << " record (key " << KeyVersionToString(version) << ")";
    return record;
}

KeyVersion UtxoCodec::DeriveKeyVersionForBlob(ByteSpan blob) {
    return KeyVersionForBlob(blob);
}

} // namespace lumencrypt

// LUMENCRYPT - UTXO Record Codec
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// A UTXO travels on-chain as an encrypted UTF-8 string
//
//   amount|blinding|index|mintAddress
//
// with no escaping. Fields containing '|' are rejected at serialization.

#ifndef LUMENCRYPT_ENCRYPTION_UTXO_H
#define LUMENCRYPT_ENCRYPTION_UTXO_H

#include <cstdint>
#include <string>
#include "lumencrypt/core/types.h"
#include "lumencrypt/encryption/box_codec.h"
#include "lumencrypt/encryption/format.h"
#include "lumencrypt/encryption/keys.h"
#include "lumencrypt/encryption/symmetric.h"

namespace lumencrypt {

/// Field separator of the serialized record
constexpr char UTXO_FIELD_DELIMITER = '|';

/// Number of serialized fields
constexpr size_t UTXO_FIELD_COUNT = 4;

/**
 * A shielded balance fragment.
 *
 * amount and blinding are arbitrary-precision integers kept in decimal
 * string form. version and privateKey are filled in by decryption and are
 * not part of the encrypted payload.
 */
struct UtxoRecord {
    std::string amount;
    std::string blinding;
    uint64_t index{0};
    std::string mintAddress;

    /// Key set the record belongs to
    KeyVersion version{KeyVersion::V2};

    /// Hex UTXO private key of that key set ("0x" + 64 hex chars)
    std::string privateKey;

    /// Compare the four serialized fields
    bool SameFields(const UtxoRecord& other) const {
        return amount == other.amount && blinding == other.blinding &&
               index == other.index && mintAddress == other.mintAddress;
    }
};

/**
 * Serialize the four payload fields.
 *
 * @throws EncryptionError(InvalidField) if a field is empty or contains '|'
 */
std::string SerializeUtxo(const UtxoRecord& record);

/**
 * Parse a serialized payload. version and privateKey are left at defaults.
 *
 * @throws EncryptionError(MalformedRecord) unless the text splits into
 *         exactly four non-empty fields and the index is a decimal uint64
 */
UtxoRecord ParseUtxo(const std::string& text);

/**
 * Encrypts and decrypts UTXO records, routing each blob by its format.
 *
 * Decryption: detect format -> box, V1 or V2 path -> authenticate ->
 * split fields -> attach the private key of the detected key version.
 * Failures throw; a partially populated record is never returned.
 */
class UtxoCodec {
public:
    UtxoCodec(const KeyDerivation& keys, const SymmetricCodec& symmetric,
              const BoxCodec& box)
        : keys_(keys), symmetric_(symmetric), box_(box) {}

    /// Self-owned record, always V2
    Bytes EncryptRecord(const UtxoRecord& record) const;

    /// Legacy V1 writer for backward-compatibility fixtures only
    Bytes EncryptRecordV1(const UtxoRecord& record) const;

    /// Pay-link deposit: box-encrypt for a recipient public key
    static Bytes EncryptRecordForRecipient(const UtxoRecord& record,
                                           ByteSpan recipientPublicKey);

    UtxoRecord DecryptRecord(ByteSpan blob) const;

    /// Key version a blob needs without decrypting it (Box -> V2)
    static KeyVersion DeriveKeyVersionForBlob(ByteSpan blob);

private:
    const KeyDerivation& keys_;
    const SymmetricCodec& symmetric_;
    const BoxCodec& box_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_UTXO_H

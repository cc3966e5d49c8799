// LUMENCRYPT - Wire Format Detection
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Encrypted blobs carry an 8-byte version tag:
//
//   V1  (legacy)  nonce(16) || hmacTag(16) || ciphertext       (no tag)
//   V2            00*7 02 || nonce(12) || gcmTag(16) || ciphertext
//   Box           00*7 03 || ephemeralPk(32) || nonce(24) || mac(16) || ciphertext

#ifndef LUMENCRYPT_ENCRYPTION_FORMAT_H
#define LUMENCRYPT_ENCRYPTION_FORMAT_H

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include "lumencrypt/core/types.h"

namespace lumencrypt {

/// Encryption scheme that produced a blob
enum class WireFormat {
    V1,
    V2,
    Box
};

/// Key set a blob (or a UTXO record) belongs to
enum class KeyVersion {
    V1,
    V2
};

namespace format {
    constexpr size_t VERSION_TAG_SIZE = 8;

    constexpr std::array<Byte, VERSION_TAG_SIZE> VERSION_TAG_V2 = {0, 0, 0, 0, 0, 0, 0, 0x02};
    constexpr std::array<Byte, VERSION_TAG_SIZE> VERSION_TAG_BOX = {0, 0, 0, 0, 0, 0, 0, 0x03};

    constexpr size_t V1_NONCE_SIZE = 16;
    constexpr size_t V1_TAG_SIZE = 16;
    constexpr size_t V1_HEADER_SIZE = V1_NONCE_SIZE + V1_TAG_SIZE;

    constexpr size_t V2_NONCE_SIZE = 12;
    constexpr size_t V2_TAG_SIZE = 16;
    constexpr size_t V2_HEADER_SIZE = VERSION_TAG_SIZE + V2_NONCE_SIZE + V2_TAG_SIZE;

    constexpr size_t BOX_EPHEMERAL_KEY_SIZE = 32;
    constexpr size_t BOX_NONCE_SIZE = 24;
    constexpr size_t BOX_MAC_SIZE = 16;
    constexpr size_t BOX_HEADER_SIZE = VERSION_TAG_SIZE + BOX_EPHEMERAL_KEY_SIZE + BOX_NONCE_SIZE;

    /// Format assumed when neither the V2 nor the box tag is present.
    /// Legacy V1 blobs were written before version tags existed.
    constexpr WireFormat LEGACY_DEFAULT = WireFormat::V1;
}

/// True if the blob starts with the V2 symmetric tag
bool HasV2Tag(ByteSpan blob);

/// True if the blob starts with the box tag (byte 7 == 0x03 after seven zeros)
bool IsBoxEncrypted(ByteSpan blob);

/**
 * Decide which scheme produced a blob from its leading bytes.
 *
 * Box and V2 are recognized by their tags; anything else, including input
 * shorter than a tag, falls to format::LEGACY_DEFAULT.
 */
WireFormat ClassifyBlob(ByteSpan blob);

/// Key version needed to open a blob (Box blobs use the V2 key set)
KeyVersion KeyVersionForBlob(ByteSpan blob);

/// Key version selected by the symmetric tag alone (box tag not inspected)
KeyVersion SymmetricKeyVersion(ByteSpan blob);

const char* WireFormatToString(WireFormat format);

/// "v1" or "v2"
const char* KeyVersionToString(KeyVersion version);

/// Parse "v1"/"v2" (case-insensitive)
std::optional<KeyVersion> KeyVersionFromString(const std::string& str);

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_FORMAT_H

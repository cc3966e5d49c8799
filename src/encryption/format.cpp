// LUMENCRYPT - Wire Format Detection
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/format.h"

#include <algorithm>

namespace lumencrypt {

namespace {

bool HasTag(ByteSpan blob, const std::array<Byte, format::VERSION_TAG_SIZE>& tag) {
    if (blob.size() < format::VERSION_TAG_SIZE) {
        return false;
    }
    return std::equal(tag.begin(), tag.end(), blob.begin());
}

} // anonymous namespace

bool HasV2Tag(ByteSpan blob) {
    return HasTag(blob, format::VERSION_TAG_V2);
}

bool IsBoxEncrypted(ByteSpan blob) {
    return HasTag(blob, format::VERSION_TAG_BOX);
}

WireFormat ClassifyBlob(ByteSpan blob) {
    if (IsBoxEncrypted(blob)) {
        return WireFormat::Box;
    }
    if (HasV2Tag(blob)) {
        return WireFormat::V2;
    }
    return format::LEGACY_DEFAULT;
}

KeyVersion KeyVersionForBlob(ByteSpan blob) {
    switch (ClassifyBlob(blob)) {
        case WireFormat::Box:
        case WireFormat::V2:
            return KeyVersion::V2;
        case WireFormat::V1:
            return KeyVersion::V1;
    }
    return KeyVersion::V1;
}

KeyVersion SymmetricKeyVersion(ByteSpan blob) {
    return HasV2Tag(blob) ? KeyVersion::V2 : KeyVersion::V1;
}

const char* WireFormatToString(WireFormat format) {
    switch (format) {
        case WireFormat::V1:  return "v1";
        case WireFormat::V2:  return "v2";
        case WireFormat::Box: return "box";
    }
    return "unknown";
}

const char* KeyVersionToString(KeyVersion version) {
    return version == KeyVersion::V1 ? "v1" : "v2";
}

std::optional<KeyVersion> KeyVersionFromString(const std::string& str) {
    if (str == "v1" || str == "V1") {
        return KeyVersion::V1;
    }
    if (str == "v2" || str == "V2") {
        return KeyVersion::V2;
    }
    return std::nullopt;
}

} // namespace lumencrypt

// LUMENCRYPT - Encryption Errors
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/errors.h"

namespace lumencrypt {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::KeyNotDerived:    return "KeyNotDerived";
        case ErrorKind::KeyNotSet:        return "KeyNotSet";
        case ErrorKind::InvalidKeyLength: return "InvalidKeyLength";
        case ErrorKind::DecryptionFailed: return "DecryptionFailed";
        case ErrorKind::MalformedRecord:  return "MalformedRecord";
        case ErrorKind::InvalidField:     return "InvalidField";
    }
    return "Unknown";
}

EncryptionError::EncryptionError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ErrorKindToString(kind)) + ": " + message)
    , kind_(kind) {}

} // namespace lumencrypt

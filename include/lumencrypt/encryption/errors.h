// LUMENCRYPT - Encryption Errors
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#ifndef LUMENCRYPT_ENCRYPTION_ERRORS_H
#define LUMENCRYPT_ENCRYPTION_ERRORS_H

#include <stdexcept>
#include <string>

namespace lumencrypt {

/// Failure categories reported by the encryption layer
enum class ErrorKind {
    /// Key material was never derived (key/keypair accessors)
    KeyNotDerived,
    /// Required key material is absent (encrypt/decrypt paths)
    KeyNotSet,
    /// A key has the wrong length
    InvalidKeyLength,
    /// Authentication failed or the blob is malformed. Callers must not
    /// try to distinguish "wrong key" from "corrupted data".
    DecryptionFailed,
    /// Plaintext did not split into four non-empty fields
    MalformedRecord,
    /// A record field cannot be serialized
    InvalidField
};

/// Stable name of an error kind ("KeyNotDerived", ...)
const char* ErrorKindToString(ErrorKind kind);

/**
 * Exception raised by every operation of the encryption layer.
 *
 * Messages never contain key material or plaintext.
 */
class EncryptionError : public std::runtime_error {
public:
    EncryptionError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_ERRORS_H

// LUMENCRYPT - Encryption Options
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#ifndef LUMENCRYPT_ENCRYPTION_OPTIONS_H
#define LUMENCRYPT_ENCRYPTION_OPTIONS_H

#include <string>
#include <vector>
#include "lumencrypt/encryption/keys.h"
#include "lumencrypt/util/config.h"
#include "lumencrypt/util/logging.h"

namespace lumencrypt {

/// Settings of an EncryptionService session and of library logging
struct EncryptionOptions {
    /// Message the wallet signs for key derivation
    std::string signMessage{DEFAULT_SIGN_MESSAGE};

    util::LogLevel logLevel{util::LogLevel::Info};

    /// Log categories to enable; empty enables all
    std::vector<std::string> debugCategories;

    /// Attach a console sink
    bool printToConsole{true};
};

/**
 * Read options from a parsed configuration.
 *
 * Missing keys keep their defaults. Unrecognized values are logged at Warn
 * and also keep the default.
 */
EncryptionOptions LoadEncryptionOptions(const util::ConfigManager& config);

/**
 * Configure the process-wide logger: level, category filter and, if
 * requested and none is attached yet, a console sink.
 */
void ApplyLoggingOptions(const EncryptionOptions& options);

} // namespace lumencrypt

#endif // LUMENCRYPT_ENCRYPTION_OPTIONS_H

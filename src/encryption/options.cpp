// LUMENCRYPT - Encryption Options
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License

#include "lumencrypt/encryption/options.h"

#include <memory>

namespace lumencrypt {

EncryptionOptions LoadEncryptionOptions(const util::ConfigManager& config) {
    using util::ConfigKeys::DEBUG;
    using util::ConfigKeys::LOGLEVEL;
    using util::ConfigKeys::PRINTTOCONSOLE;
    using util::ConfigKeys::SIGNMESSAGE;

    EncryptionOptions options;

    if (auto message = config.TryGetString(SIGNMESSAGE)) {
        if (message->empty()) {
            LOG_WARN(util::LogCategory::CONFIG) << "Ignoring empty " << SIGNMESSAGE;
        } else {
            options.signMessage = *message;
        }
    }

    if (auto level = config.TryGetString(LOGLEVEL)) {
        if (auto parsed = util::TryLogLevelFromString(*level)) {
            options.logLevel = *parsed;
        } else {
            LOG_WARN(util::LogCategory::CONFIG) << "Unknown " << LOGLEVEL << " '" << *level
                                                << "', keeping "
                                                << util::LogLevelToString(options.logLevel);
        }
    }

    for (const auto& category : config.GetList(DEBUG)) {
        if (category == "all" || category == "1") {
            options.debugCategories.clear();
            break;
        }
        options.debugCategories.push_back(category);
    }

    if (config.HasKey(PRINTTOCONSOLE)) {
        if (auto print = config.TryGetBool(PRINTTOCONSOLE)) {
            options.printToConsole = *print;
        } else {
            LOG_WARN(util::LogCategory::CONFIG) << "Invalid boolean for " << PRINTTOCONSOLE;
        }
    }

    return options;
}

void ApplyLoggingOptions(const EncryptionOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(options.logLevel);

    logger.EnableAllCategories();
    for (const auto& category : options.debugCategories) {
        logger.EnableCategory(category);
    }

    if (options.printToConsole && logger.SinkCount() == 0) {
        logger.AddSink(std::make_shared<util::ConsoleSink>());
    }
}

} // namespace lumencrypt

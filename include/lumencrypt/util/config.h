// LUMENCRYPT - Configuration Parser
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// INI-style configuration:
// - Lines starting with # or ; are comments
// - key=value pairs, optional [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag and means key=1

#ifndef LUMENCRYPT_UTIL_CONFIG_H
#define LUMENCRYPT_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lumencrypt {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string section;   // Empty for global section
    std::string source;    // File path or source name
    int lineNumber{0};
    bool isDefault{false};
    /// Every value assigned to this key, in order; the last one is current
    std::vector<std::string> values;

    const std::string& Value() const { return values.back(); }
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value settings parsed from text or set programmatically.
 *
 * Explicit values (parsed or Set) override defaults. A key assigned more
 * than once keeps every value for GetList; scalar getters see the last one.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName appears in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value (nullopt if missing or not a whole decimal number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Boolean value (nullopt if missing or not a recognized boolean)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// All values of a key, with comma-separated values split apart
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if the key has none yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Assign(const std::string& key, const std::string& value,
                const std::string& section, const std::string& source, int lineNum);

    const ConfigEntry* Find(const std::string& key, const std::string& section) const;

    std::map<std::string, ConfigEntry> entries_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* SIGNMESSAGE = "signmessage";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
}

} // namespace util
} // namespace lumencrypt

#endif // LUMENCRYPT_UTIL_CONFIG_H

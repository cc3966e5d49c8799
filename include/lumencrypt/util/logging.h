// LUMENCRYPT - Logging System
// Copyright (c) 2024 LUMENCRYPT Developers
// MIT License
//
// Leveled, category-filtered logging with pluggable sinks. The encryption
// layer logs events only; key bytes, private keys and plaintext never
// reach a sink.

#ifndef LUMENCRYPT_UTIL_LOGGING_H
#define LUMENCRYPT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace lumencrypt {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive)
std::optional<LogLevel> TryLogLevelFromString(const std::string& str);

/// Parse log level from string; unknown names yield fallback
LogLevel LogLevelFromString(const std::string& str, LogLevel fallback = LogLevel::Info);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* KEYS = "keys";
    constexpr const char* CODEC = "codec";
    constexpr const char* BOX = "box";
    constexpr const char* UTXO = "utxo";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes formatted entries to stderr (or stdout if configured)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStdout{false};
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};
        LogLevel level{LogLevel::Trace};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Format entry without color codes
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Forwards entries to a user callback (test capture, host application bridges)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Trace};
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Process-wide logger.
 *
 * Starts with no sinks, so the library is silent until the host attaches
 * one (directly or through ApplyLoggingOptions).
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper; the entry is emitted on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define LUMENCRYPT_LOGGER ::lumencrypt::util::Logger::Instance()

#define LUMENCRYPT_LOG_ENABLED(level, category) \
    LUMENCRYPT_LOGGER.WillLog(::lumencrypt::util::LogLevel::level, category)

#define LUMENCRYPT_LOG(level, category) \
    if (LUMENCRYPT_LOG_ENABLED(level, category)) \
        ::lumencrypt::util::LogStream(::lumencrypt::util::LogLevel::level, category, \
                                      __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   LUMENCRYPT_LOG(Trace, category)
#define LOG_DEBUG(category)   LUMENCRYPT_LOG(Debug, category)
#define LOG_INFO(category)    LUMENCRYPT_LOG(Info, category)
#define LOG_WARN(category)    LUMENCRYPT_LOG(Warn, category)
#define LOG_ERROR(category)   LUMENCRYPT_LOG(Error, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp as "YYYY-MM-DD HH:MM:SS.mmm" (local time)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace lumencrypt

#endif // LUMENCRYPT_UTIL_LOGGING_H

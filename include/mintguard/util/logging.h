// MINTGUARD - Logging System
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Provides the logging system shared by the controller, the state store and
// the command-line executor:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console, file and callback output
// - Block-height context attached to every entry of an operation
// - Printf-style and stream-style interfaces

#ifndef MINTGUARD_UTIL_LOGGING_H
#define MINTGUARD_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace mintguard {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information (rejected requests)
    Info = 2,    // State transitions
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

/// Predefined log categories
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ISSUANCE = "issuance";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

/// Sentinel for "no block context"
constexpr int64_t NO_BLOCK_CONTEXT = -1;

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    int64_t blockHeight;
    std::chrono::system_clock::time_point timestamp;

    LogEntry() : level(LogLevel::Info), line(0), blockHeight(NO_BLOCK_CONTEXT) {}
};

/// Render an entry as a single line ("<time> [LEVEL] [category] [h=N] msg")
std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp, bool showLocation);

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    /// Set minimum log level for this sink
    virtual void SetLevel(LogLevel level) = 0;

    /// Get minimum log level for this sink
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to the console. Defaults to stderr so command
/// output on stdout stays machine-readable.
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Use ANSI color codes on a tty
        bool useStderr{true};           // Write to stderr instead of stdout
        bool showTimestamp{false};
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Warn};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file (the executor's debug.log)
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    /// Check if file is open
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

    const std::string& GetPath() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that calls a callback function
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Main logger class
class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Add a log sink
    void AddSink(std::shared_ptr<ILogSink> sink);

    /// Remove a log sink
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);

    /// Clear all sinks
    void ClearSinks();

    /// Get number of sinks
    size_t SinkCount() const;

    /// Set global minimum log level
    void SetLevel(LogLevel level);

    /// Get global minimum log level
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);

    /// Check if category is enabled
    bool IsCategoryEnabled(const std::string& category) const;

    /// Enable all categories
    void EnableAllCategories();

    /// Block height attached to subsequent entries
    void SetBlockContext(int64_t height) { blockContext_.store(height); }
    int64_t GetBlockContext() const { return blockContext_.load(); }

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    /// Flush all sinks
    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<int64_t> blockContext_{NO_BLOCK_CONTEXT};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Scoped Block Context
// ============================================================================

/// RAII guard that tags every entry logged during one operation with the
/// block height the operation executes at.
class ScopedBlockContext {
public:
    explicit ScopedBlockContext(int64_t height);
    ~ScopedBlockContext();

    ScopedBlockContext(const ScopedBlockContext&) = delete;
    ScopedBlockContext& operator=(const ScopedBlockContext&) = delete;

private:
    int64_t previous_;
};

// ============================================================================
// Logging Macros
// ============================================================================

/// Get logger instance
#define MINTGUARD_LOGGER ::mintguard::util::Logger::Instance()

/// Check if logging is enabled
#define MINTGUARD_LOG_ENABLED(level, category) \
    MINTGUARD_LOGGER.WillLog(::mintguard::util::LogLevel::level, category)

/// Log with level and category
#define MINTGUARD_LOG(level, category) \
    if (MINTGUARD_LOG_ENABLED(level, category)) \
        ::mintguard::util::LogStream(::mintguard::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

/// Convenience macros for each level
#define LOG_TRACE(category)   MINTGUARD_LOG(Trace, category)
#define LOG_DEBUG(category)   MINTGUARD_LOG(Debug, category)
#define LOG_INFO(category)    MINTGUARD_LOG(Info, category)
#define LOG_WARN(category)    MINTGUARD_LOG(Warn, category)
#define LOG_ERROR(category)   MINTGUARD_LOG(Error, category)
#define LOG_FATAL(category)   MINTGUARD_LOG(Fatal, category)

/// Printf-style logging
#define MINTGUARD_LOGF(level, category, ...) \
    do { \
        if (MINTGUARD_LOG_ENABLED(level, category)) { \
            MINTGUARD_LOGGER.LogF(::mintguard::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  MINTGUARD_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   MINTGUARD_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   MINTGUARD_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  MINTGUARD_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace mintguard

#endif // MINTGUARD_UTIL_LOGGING_H

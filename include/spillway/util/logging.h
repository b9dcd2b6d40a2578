// SPILLWAY - Logging System
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Provides the logging facility used by the engine:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console and callback sinks
// - Thread-safe logging
// - Printf-style and stream-style interfaces

#ifndef SPILLWAY_UTIL_LOGGING_H
#define SPILLWAY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace spillway {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // State transitions
    Info = 2,    // General information
    Warn = 3,    // Rejected operations
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
    constexpr const char* GAUGE = "gauge";
    constexpr const char* VOTES = "votes";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* CONFIG = "config";
}

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

/// Log sink that writes to console (stdout/stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Use ANSI color codes
        bool useStderr{false};          // Write errors to stderr
        bool showTimestamp{true};       // Include timestamp
        bool showLevel{true};           // Include log level
        bool showCategory{true};        // Include category
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Info}; // Minimum level
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    void SetConfig(const Config& config) { config_ = config; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;

    const char* GetColorCode(LogLevel level) const;
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

    void SetCallback(Callback callback) { callback_ = std::move(callback); }

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

    /// Initialize logger with a default console sink
    void Initialize();

    /// Shutdown logger
    void Shutdown();

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

    /// Enable a category
    void EnableCategory(const std::string& category);

    /// Disable a category
    void DisableCategory(const std::string& category);

    /// Check if category is enabled
    bool IsCategoryEnabled(const std::string& category) const;

    /// Enable all categories
    void EnableAllCategories();

    /// Disable all categories
    void DisableAllCategories();

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    /// Flush all sinks
    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

/// Get logger instance
#define SPILLWAY_LOGGER ::spillway::util::Logger::Instance()

/// Check if logging is enabled
#define SPILLWAY_LOG_ENABLED(level, category) \
    SPILLWAY_LOGGER.WillLog(::spillway::util::LogLevel::level, category)

/// Log with level and category
#define SPILLWAY_LOG(level, category) \
    if (SPILLWAY_LOG_ENABLED(level, category)) \
        ::spillway::util::LogStream(::spillway::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   SPILLWAY_LOG(Trace, category)
#define LOG_DEBUG(category)   SPILLWAY_LOG(Debug, category)
#define LOG_INFO(category)    SPILLWAY_LOG(Info, category)
#define LOG_WARN(category)    SPILLWAY_LOG(Warn, category)
#define LOG_ERROR(category)   SPILLWAY_LOG(Error, category)
#define LOG_FATAL(category)   SPILLWAY_LOG(Fatal, category)

/// Printf-style logging
#define SPILLWAY_LOGF(level, category, ...) \
    do { \
        if (SPILLWAY_LOG_ENABLED(level, category)) { \
            SPILLWAY_LOGGER.LogF(::spillway::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  SPILLWAY_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   SPILLWAY_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   SPILLWAY_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace spillway

#endif // SPILLWAY_UTIL_LOGGING_H

// VESCROW - Logging System
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE through FATAL, plus OFF
// - Per-category filtering
// - Console, rotating file and callback sinks
// - Stream-style macros

#ifndef VESCROW_UTIL_LOGGING_H
#define VESCROW_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace vescrow {
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

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive); unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ESCROW = "escrow";
    constexpr const char* CHECKPOINT = "checkpoint";
    constexpr const char* QUERY = "query";
    constexpr const char* DB = "db";
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

/// Output destination for log entries
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

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{false};          // Errors go to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};       // file:line
        LogLevel level{LogLevel::Info};
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

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it to path.1 .. path.N when it grows
/// past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        LogLevel level{LogLevel::Debug};
    };

    FileSink();
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked();
    std::string Format(const LogEntry& entry) const;
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

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

class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (once)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    bool WillLog(LogLevel level, const std::string& category) const;

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

/// Collects a message with operator<< and logs it on destruction
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

#define VESCROW_LOGGER ::vescrow::util::Logger::Instance()

#define VESCROW_LOG_ENABLED(level, category) \
    VESCROW_LOGGER.WillLog(::vescrow::util::LogLevel::level, category)

#define VESCROW_LOG(level, category) \
    if (VESCROW_LOG_ENABLED(level, category)) \
        ::vescrow::util::LogStream(::vescrow::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   VESCROW_LOG(Trace, category)
#define LOG_DEBUG(category)   VESCROW_LOG(Debug, category)
#define LOG_INFO(category)    VESCROW_LOG(Info, category)
#define LOG_WARN(category)    VESCROW_LOG(Warn, category)
#define LOG_ERROR(category)   VESCROW_LOG(Error, category)
#define LOG_FATAL(category)   VESCROW_LOG(Fatal, category)

// ============================================================================
// Setup
// ============================================================================

/// Process-level logging options, usually read from the config file
struct LoggingOptions {
    LogLevel level{LogLevel::Info};
    bool printToConsole{true};
    std::string logFile;            // empty: no file sink
    std::vector<std::string> categories;  // empty: all categories
};

/// Replace the logger's sinks and filters according to options.
/// Returns false if the log file could not be opened.
bool ConfigureLogging(const LoggingOptions& options);

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace vescrow

#endif // VESCROW_UTIL_LOGGING_H

// SEALBID - Logging System
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Leveled, categorised logging. Entries are built by the LOG_* stream
// macros and fanned out to every sink registered with the Logger.
// Sinks filter on their own level; the Logger filters on a global level
// and, optionally, a set of enabled categories.

#ifndef SEALBID_UTIL_LOGGING_H
#define SEALBID_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace sealbid {
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
    Off = 5
};

/// Upper-case level name ("WARN")
const char* LogLevelToString(LogLevel level);

/// Case-insensitive level name; nullopt if unrecognised
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* AUDIT = "audit";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
};

/// Which optional fields a sink renders around the message
struct LogFormat {
    bool timestamp{true};
    bool location{false};
};

/**
 * Render an entry as a single line:
 *   [timestamp ]"[LEVEL] [category] "[file:line function() ]message
 */
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Final path component
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }

protected:
    explicit ILogSink(LogLevel level) : level_(level) {}

    bool Accepts(const LogEntry& entry) const { return entry.level >= level_; }

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stderr (default) or stdout
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogLevel level{LogLevel::Info};
        bool useStderr{true};
        LogFormat format{false, false};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file; flushes after every warning or error
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        LogLevel level{LogLevel::Debug};
        LogFormat format{true, true};
    };

    explicit FileSink(const Config& config);

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

/// Hands each entry to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /**
     * Category filter. With no category enabled every category passes;
     * once one is enabled only enabled categories pass.
     */
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;
    
    /// Threshold for one category, replacing the global level for it
    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ClearCategoryLevels();

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::set<std::string> categories_;
    std::map<std::string, LogLevel> categoryLevels_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function)
        : level_(level), category_(category), file_(file)
        , line_(line), function_(function) {}

    ~LogStream() {
        Logger::Instance().Log(level_, category_, stream_.str(),
                               file_, line_, function_);
    }

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

#define SEALBID_LOG(level, category) \
    if (!::sealbid::util::Logger::Instance().WillLog( \
            ::sealbid::util::LogLevel::level, category)) {} else \
        ::sealbid::util::LogStream(::sealbid::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   SEALBID_LOG(Trace, category)
#define LOG_DEBUG(category)   SEALBID_LOG(Debug, category)
#define LOG_INFO(category)    SEALBID_LOG(Info, category)
#define LOG_WARN(category)    SEALBID_LOG(Warn, category)
#define LOG_ERROR(category)   SEALBID_LOG(Error, category)

} // namespace util
} // namespace sealbid

#endif // SEALBID_UTIL_LOGGING_H

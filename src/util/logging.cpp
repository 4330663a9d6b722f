// SEALBID - Logging Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace sealbid {
namespace util {

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"off", LogLevel::Off},
        {"none", LogLevel::Off},
    };
    for (const auto& entry : names) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;
    if (format.timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    oss << '[' << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.location && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ' ';
        if (!entry.function.empty()) {
            oss << entry.function << "() ";
        }
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : ConsoleSink(Config()) {}

ConsoleSink::ConsoleSink(const Config& config)
    : ILogSink(config.level), config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }
    std::string line = FormatLogEntry(entry, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(config_.useStderr ? stderr : stdout, "%s\n", line.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(config_.useStderr ? stderr : stdout);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config)
    : ILogSink(config.level), config_(config) {
    file_.open(config_.path, config_.append ? std::ios::app : std::ios::trunc);
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (!Accepts(entry)) {
        return;
    }
    std::string line = FormatLogEntry(entry, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (entry.level >= LogLevel::Warn) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : ILogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (Accepts(entry) && callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.insert(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.erase(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    categoryLevels_[category] = level;
}

void Logger::ClearCategoryLevels() {
    std::lock_guard<std::mutex> lock(mutex_);
    categoryLevels_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = categoryLevels_.find(category);
    LogLevel threshold = it != categoryLevels_.end() ? it->second : level_.load();
    if (level < threshold) {
        return false;
    }
    return categories_.empty() || categories_.count(category) > 0;
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

} // namespace util
} // namespace sealbid

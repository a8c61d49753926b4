// VOTELOCK - Logging
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include "votelock/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace votelock {
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
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    static const std::pair<const char*, LogLevel> kNames[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal}, {"off", LogLevel::Off},
    };
    for (const auto& entry : kNames) {
        if (key == entry.first) {
            return entry.second;
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::time_t secs = system_clock::to_time_t(tp);
    const long millis = static_cast<long>(
        duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&secs, &local);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);

    std::ostringstream out;
    out << buf << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    std::string out = str.substr(0, width);
    out.resize(width, pad);
    return out;
}

std::string GetBasename(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogLine(const LogEntry& entry, const LogLineFormat& format) {
    std::ostringstream out;
    if (format.timestamp) {
        out << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    if (format.level) {
        out << '[' << FixedWidth(LogLevelToString(entry.level), 5) << "] ";
    }
    // "default" is omitted
    if (format.category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        out << '[' << entry.category << "] ";
    }
    if (format.location && !entry.file.empty()) {
        out << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    out << entry.message;
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

const char* AnsiColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;35m";
        default:              return "";
    }
}

} // namespace

ConsoleSink::ConsoleSink(LogLevel level, bool colors)
    : ILogSink(level), colors_(colors) {}

void ConsoleSink::Emit(const LogEntry& entry) {
    const std::string line = FormatLogLine(entry, LogLineFormat{});
    FILE* out = entry.level >= LogLevel::Error ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = AnsiColor(entry.level);
    if (colors_ && *color != '\0' && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

FileSink::FileSink(const std::string& path, LogLevel level)
    : ILogSink(level), out_(path, std::ios::app) {}

FileSink::~FileSink() {
    Flush();
}

void FileSink::Emit(const LogEntry& entry) {
    LogLineFormat format;
    format.location = true;
    const std::string line = FormatLogLine(entry, format);

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_) {
        out_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    auto it = std::find(sinks_.begin(), sinks_.end(), sink);
    if (it != sinks_.end()) {
        sinks_.erase(it);
    }
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    filterActive_ = true;
    allowed_.insert(category);
    blocked_.erase(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    allowed_.erase(category);
    blocked_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(filterMutex_);
    filterActive_ = false;
    allowed_.clear();
    blocked_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(filterMutex_);
    if (blocked_.count(category) != 0) {
        return false;
    }
    return !filterActive_ || allowed_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    const LogLevel threshold = level_.load();
    return threshold != LogLevel::Off && level >= threshold && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    if (file) entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinkMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char message[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    Log(level, category, message, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, buffer_.str(), file_, line_);
}

} // namespace util
} // namespace votelock

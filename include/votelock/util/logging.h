// VOTELOCK - Logging
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Process-wide logger. Records carry a level and a category (pool, lock,
// checkpoint, ...) and fan out to any number of sinks. Each sink applies
// its own level on top of the logger's.

#ifndef VOTELOCK_UTIL_LOGGING_H
#define VOTELOCK_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace votelock {
namespace util {

// ============================================================================
// Levels and Categories
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

/// Case-insensitive; "warning" is accepted. Anything unknown maps to Info.
LogLevel LogLevelFromString(const std::string& name);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* POOL = "pool";
    constexpr const char* LOCK = "lock";
    constexpr const char* CHECKPOINT = "checkpoint";
    constexpr const char* QUERY = "query";
    constexpr const char* CONFIG = "config";
    constexpr const char* SNAPSHOT = "snapshot";
}

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Which prefixes a sink puts in front of the message.
struct LogLineFormat {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool location{false};
};

/// Renders "<time> [LEVEL] [category] file:line message" per the format flags.
std::string FormatLogLine(const LogEntry& entry, const LogLineFormat& format);

class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    /// Forwards to Emit() when the entry passes this sink's level.
    void Write(const LogEntry& entry) {
        if (entry.level >= level_.load()) {
            Emit(entry);
        }
    }

    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    virtual void Emit(const LogEntry& entry) = 0;

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stdout, errors to stderr. Colors only when attached to a tty.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool colors = true);

    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    bool colors_;
    std::mutex mutex_;
};

/// Appends to a file. IsOpen() reports whether the file could be opened.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return out_.is_open(); }
    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    std::ofstream out_;
    std::mutex mutex_;
};

/// Hands every accepted entry to a function. Used by tests and hosts.
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : ILogSink(level), callback_(std::move(callback)) {}

protected:
    void Emit(const LogEntry& entry) override {
        if (callback_) callback_(entry);
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Enabling any category restricts output to the enabled set. A disabled
    /// category is always dropped. EnableAllCategories() resets both.
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    /// printf-style; the formatted message is cut at 4 KiB.
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    void Flush();

    /// Flushes, then drops every sink.
    void Shutdown();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex sinkMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    mutable std::mutex filterMutex_;
    bool filterActive_{false};
    std::set<std::string> allowed_;
    std::set<std::string> blocked_;
};

/// Collects a streamed message and logs it when destroyed.
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    std::ostringstream buffer_;
};

// ============================================================================
// Macros
// ============================================================================

#define VOTELOCK_LOG(lvl, category) \
    if (!::votelock::util::Logger::Instance().WillLog(::votelock::util::LogLevel::lvl, category)) {} \
    else ::votelock::util::LogStream(::votelock::util::LogLevel::lvl, category, __FILE__, __LINE__)

#define LOG_TRACE(category) VOTELOCK_LOG(Trace, category)
#define LOG_DEBUG(category) VOTELOCK_LOG(Debug, category)
#define LOG_INFO(category)  VOTELOCK_LOG(Info, category)
#define LOG_WARN(category)  VOTELOCK_LOG(Warn, category)
#define LOG_ERROR(category) VOTELOCK_LOG(Error, category)

#define VOTELOCK_LOGF(lvl, category, ...) \
    ::votelock::util::Logger::Instance().LogF(::votelock::util::LogLevel::lvl, category, \
                                              __FILE__, __LINE__, __VA_ARGS__)

#define LogDebugF(category, ...) VOTELOCK_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)  VOTELOCK_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)  VOTELOCK_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Helpers
// ============================================================================

/// Local time with milliseconds, "YYYY-MM-DD HH:MM:SS.mmm".
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Pads with `pad` or truncates to exactly `width` characters.
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace votelock

#endif // VOTELOCK_UTIL_LOGGING_H

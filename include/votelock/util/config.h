// VOTELOCK - Configuration
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// INI-style settings for pool definitions and logging:
//
//   # comment            ; comment
//   [pool.1]
//   multiplier = 1.5     # trailing comment
//   label = "quoted # kept"
//   file = ${HOME}/votelock.log
//
// A trailing backslash joins a line with the next one. Keys before the
// first header live in the unnamed section "".

#ifndef VOTELOCK_UTIL_CONFIG_H
#define VOTELOCK_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace votelock {
namespace util {

/// Longest physical line accepted by the parser
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigEntry {
    std::string value;
    std::string source;
    int line{0};
};

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, {}, {}, 0}; }

    static ConfigParseResult Error(std::string message, std::string file = {}, int line = 0) {
        return {false, std::move(message), std::move(file), line};
    }

    /// "file:line: message", or "ok"
    std::string ToString() const;
};

/**
 * Parsed settings keyed by (section, key).
 *
 * A key defined twice keeps its last value. Values are unquoted and have
 * ${VAR} references expanded at parse time. Not thread-safe.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& path);
    ConfigParseResult ParseString(const std::string& text,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& fallback,
                          const std::string& section = "") const;

    /// Whole-value decimal integers only
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t fallback,
                   const std::string& section = "") const;

    /// true/yes/on/1 and false/no/off/0, any case
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool fallback,
                 const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Named sections in sorted order; the unnamed section is left out
    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetSectionsWithPrefix(const std::string& prefix) const;

    /// Keys of one section in sorted order
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    void Clear() { sections_.clear(); }

    /// Number of stored keys across all sections
    size_t Size() const;

    /// Replaces ${NAME} with the environment value; unset names expand to "".
    static std::string ExpandEnvVars(const std::string& text);

private:
    ConfigParseResult Parse(std::istream& in, const std::string& source);
    ConfigParseResult ParseLine(const std::string& line, const std::string& source,
                                int lineNo, std::string& section);

    const ConfigEntry* Find(const std::string& key, const std::string& section) const;

    std::map<std::string, std::map<std::string, ConfigEntry>> sections_;
};

// ============================================================================
// Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* LOG_SECTION = "log";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_FILE = "file";
    constexpr const char* LOG_CONSOLE = "console";

    constexpr const char* POOL_SECTION_PREFIX = "pool.";
    constexpr const char* POOL_MULTIPLIER = "multiplier";
    constexpr const char* POOL_MAX_LOCK_TIME = "maxlocktime";
    constexpr const char* POOL_MAX_LOCK_WEEKS = "maxlockweeks";
}

/**
 * Configure the global logger from [log]: `level` sets the threshold,
 * `console = true` adds a console sink and `file` adds a file sink.
 * Returns false if the log file cannot be opened.
 */
bool ApplyLoggingConfig(const ConfigManager& config);

} // namespace util
} // namespace votelock

#endif // VOTELOCK_UTIL_CONFIG_H

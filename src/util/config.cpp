// VOTELOCK - Configuration
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include "votelock/util/config.h"
#include "votelock/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

namespace votelock {
namespace util {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return {};
    }
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string Lowercase(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// Strips matching quotes. Double quotes honour \n, \t, \\ and \".
std::string Unquote(const std::string& raw) {
    if (raw.size() < 2 || raw.front() != raw.back() ||
        (raw.front() != '"' && raw.front() != '\'')) {
        return raw;
    }
    const std::string body = raw.substr(1, raw.size() - 2);
    if (raw.front() == '\'') {
        return body;
    }

    std::string out;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' || i + 1 == body.size()) {
            out += body[i];
            continue;
        }
        switch (body[i + 1]) {
            case 'n': out += '\n'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"': out += '"'; ++i; break;
            default: out += '\\'; break;
        }
    }
    return out;
}

/// Drops " # ..." from an unquoted value
std::string StripComment(const std::string& raw) {
    if (raw.empty() || raw[0] == '"' || raw[0] == '\'') {
        return raw;
    }
    const size_t mark = raw.find(" #");
    return mark == std::string::npos ? raw : Trim(raw.substr(0, mark));
}

} // namespace

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::string where = errorFile;
    if (!where.empty() && errorLine > 0) {
        where += ":" + std::to_string(errorLine);
    }
    return where.empty() ? errorMessage : where + ": " + errorMessage;
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& path) {
    const std::string resolved = ExpandEnvVars(path);
    std::ifstream in(resolved);
    if (!in) {
        return ConfigParseResult::Error("Cannot open file: " + resolved);
    }
    return Parse(in, resolved);
}

ConfigParseResult ConfigManager::ParseString(const std::string& text,
                                             const std::string& sourceName) {
    std::istringstream in(text);
    return Parse(in, sourceName);
}

ConfigParseResult ConfigManager::Parse(std::istream& in, const std::string& source) {
    std::string section;
    std::string pending;
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line exceeds " + std::to_string(MAX_LINE_LENGTH) + " characters",
                source, lineNo);
        }
        if (!line.empty() && line.back() == '\\') {
            pending.append(line, 0, line.size() - 1);
            continue;
        }
        pending += line;
        ConfigParseResult result = ParseLine(pending, source, lineNo, section);
        pending.clear();
        if (!result.success) {
            return result;
        }
    }

    if (!pending.empty()) {
        return ParseLine(pending, source, lineNo, section);
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseLine(const std::string& rawLine, const std::string& source,
                                           int lineNo, std::string& section) {
    const std::string line = Trim(rawLine);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return ConfigParseResult::Success();
    }

    if (line[0] == '[') {
        const size_t close = line.find(']');
        if (close == std::string::npos) {
            return ConfigParseResult::Error("Missing closing bracket in section header",
                                            source, lineNo);
        }
        section = Trim(line.substr(1, close - 1));
        return ConfigParseResult::Success();
    }

    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return ConfigParseResult::Error("Expected key = value", source, lineNo);
    }

    const std::string key = Trim(line.substr(0, eq));
    if (key.empty() || !std::all_of(key.begin(), key.end(), IsKeyChar)) {
        return ConfigParseResult::Error("Invalid key '" + key + "'", source, lineNo);
    }

    ConfigEntry& entry = sections_[section][key];
    entry.value = ExpandEnvVars(Unquote(StripComment(Trim(line.substr(eq + 1)))));
    entry.source = source;
    entry.line = lineNo;
    return ConfigParseResult::Success();
}

std::string ConfigManager::ExpandEnvVars(const std::string& text) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t open = text.find("${", pos);
        const size_t close = open == std::string::npos ? open : text.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        if (const char* value = std::getenv(text.substr(open + 2, close - open - 2).c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key, const std::string& section) const {
    auto sec = sections_.find(section);
    if (sec == sections_.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return *entry;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& fallback,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(fallback);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry || entry->value.empty()) {
        return std::nullopt;
    }
    const std::string& text = entry->value;
    char* end = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() ||
        std::isspace(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t fallback,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(fallback);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    const std::string v = Lowercase(entry->value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool fallback,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(fallback);
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry& entry = sections_[section][key];
    entry.value = value;
    entry.source = "<set>";
    entry.line = 0;
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> names;
    for (const auto& sec : sections_) {
        if (!sec.first.empty() && !sec.second.empty()) {
            names.push_back(sec.first);
        }
    }
    return names;
}

std::vector<std::string> ConfigManager::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<std::string> names = GetSections();
    names.erase(std::remove_if(names.begin(), names.end(),
                               [&](const std::string& name) {
                                   return name.compare(0, prefix.size(), prefix) != 0;
                               }),
                names.end());
    return names;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec = sections_.find(section);
    if (sec != sections_.end()) {
        for (const auto& kv : sec->second) {
            keys.push_back(kv.first);
        }
    }
    return keys;
}

size_t ConfigManager::Size() const {
    size_t count = 0;
    for (const auto& sec : sections_) {
        count += sec.second.size();
    }
    return count;
}

// ============================================================================
// Logging
// ============================================================================

bool ApplyLoggingConfig(const ConfigManager& config) {
    using namespace ConfigKeys;
    Logger& logger = Logger::Instance();

    if (auto level = config.TryGetString(LOG_LEVEL, LOG_SECTION)) {
        logger.SetLevel(LogLevelFromString(*level));
    }

    if (config.GetBool(LOG_CONSOLE, false, LOG_SECTION)) {
        logger.AddSink(std::make_shared<ConsoleSink>(logger.GetLevel()));
    }

    const std::string path = config.GetString(LOG_FILE, "", LOG_SECTION);
    if (path.empty()) {
        return true;
    }

    auto sink = std::make_shared<FileSink>(path, logger.GetLevel());
    if (!sink->IsOpen()) {
        LOG_ERROR(LogCategory::CONFIG) << "Cannot open log file " << path;
        return false;
    }
    logger.AddSink(sink);
    LOG_DEBUG(LogCategory::CONFIG) << "Logging to " << path;
    return true;
}

} // namespace util
} // namespace votelock

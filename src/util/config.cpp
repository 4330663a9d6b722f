// SEALBID - Configuration Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/util/config.h"
#include "sealbid/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace sealbid {
namespace util {

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

/// Strip matching quotes; double quotes also honour \n \t \\ \"
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            switch (inner[i + 1]) {
                case 'n':  out += '\n'; ++i; continue;
                case 't':  out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"':  out += '"';  ++i; continue;
                default: break;
            }
        }
        out += c;
    }
    return out;
}

bool IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

/**
 * Split one assignment ("key=value", "key" or "nokey") into key and value.
 * Returns false if the key is malformed.
 */
bool ParseAssignment(const std::string& text, std::string& key, std::string& value) {
    size_t eq = text.find('=');
    if (eq != std::string::npos) {
        key = Trim(text.substr(0, eq));
        value = Trim(text.substr(eq + 1));
    } else if (text.size() > 2 && text.compare(0, 2, "no") == 0 &&
               std::islower(static_cast<unsigned char>(text[2]))) {
        key = text.substr(2);
        value = "false";
    } else {
        key = text;
        value = "true";
    }
    return IsValidKey(key);
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "OK";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, Entry entry) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        const Origin existing = it->second.origin;
        if (existing > entry.origin ||
            (existing == entry.origin && existing == Origin::CONFIG_FILE)) {
            return;
        }
    }
    entries_[key] = std::move(entry);
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& source) {
    std::string line;
    int lineNum = 0;

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }
        if (trimmed[0] == '[') {
            return ConfigParseResult::Error(
                "Sections are not supported: " + trimmed, source, lineNum);
        }

        std::string key, value;
        if (!ParseAssignment(trimmed, key, value)) {
            return ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        }

        Entry entry;
        entry.value = ExpandEnvVars(Unquote(value));
        entry.origin = Origin::CONFIG_FILE;
        entry.source = source;
        entry.line = lineNum;
        Store(key, std::move(entry));
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    LOG_DEBUG(LogCategory::CONFIG) << "Reading config file " << path;
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        size_t start = arg.find_first_not_of('-');
        std::string key, value;
        if (start == std::string::npos ||
            !ParseAssignment(arg.substr(start), key, value)) {
            return ConfigParseResult::Error("Invalid option: '" + arg + "'",
                                            COMMAND_LINE_SOURCE);
        }

        Entry entry;
        entry.value = value;
        entry.origin = Origin::COMMAND_LINE;
        entry.source = COMMAND_LINE_SOURCE;
        Store(key, std::move(entry));
    }

    positional_.assign(argv + i, argv + argc);
    return ConfigParseResult::Success();
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    if (HasKey(key)) {
        return;
    }
    Entry entry;
    entry.value = value;
    entry.origin = Origin::DEFAULT;
    entry.source = "<default>";
    entries_[key] = std::move(entry);
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.count(key) > 0;
}

const ConfigManager::Entry* ConfigManager::Find(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    if (const Entry* entry = Find(key)) {
        return entry->value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty() || str->size() > 20) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : *str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream stream(GetString(key, ""));
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value.compare(i, 2, "${") == 0) {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        if (struct passwd* pwd = getpwuid(getuid())) {
            home = pwd->pw_dir;
        }
    }
    return home ? std::string(home) + path.substr(1) : path;
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

} // namespace util
} // namespace sealbid

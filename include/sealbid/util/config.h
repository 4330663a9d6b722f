// SEALBID - Configuration
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Options for sealbid-cli come from three places, highest priority first:
// the command line, the config file, and built-in defaults.
//
// Config file format (sealbid.conf):
//   # comment            ; comment
//   key=value            key = "quoted value"
//   key                  (same as key=true)
//   nokey                (same as key=false)
//   datadir=${HOME}/bids (environment expansion)

#ifndef SEALBID_UTIL_CONFIG_H
#define SEALBID_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sealbid {
namespace util {

// ============================================================================
// Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".sealbid";

/// Config file looked up inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "sealbid.conf";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Recognised Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* BACKEND = "backend";
    constexpr const char* ADMIN = "admin";
    constexpr const char* HEIGHT = "height";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* LOGCATEGORIES = "logcategories";
    constexpr const char* AUDITLEVEL = "auditlevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// ConfigManager
// ============================================================================

class ConfigManager {
public:
    /// Where a value came from, lowest priority first
    enum class Origin {
        DEFAULT,
        CONFIG_FILE,
        COMMAND_LINE,
    };

    struct Entry {
        std::string value;
        Origin origin{Origin::DEFAULT};
        std::string source;
        int line{0};
    };

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Read a config file. Values already set by a file or the command line are kept.
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Same as ParseFile for in-memory text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Read --key=value, --key and --nokey options up to the first
     * non-option argument or "--". The rest become positional arguments.
     * An option never takes its value from the following argument.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    /// Register a built-in default; never replaces an existing value
    void SetDefault(const std::string& key, const std::string& value);

    // ========================================================================
    // Lookup
    // ========================================================================

    bool HasKey(const std::string& key) const;

    const Entry* Find(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Decimal value; nullopt if missing, signed or not entirely digits
    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;

    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    /// Comma-separated value split into trimmed, non-empty items
    std::vector<std::string> GetList(const std::string& key) const;

    size_t Size() const { return entries_.size(); }

    // ========================================================================
    // Helpers
    // ========================================================================

    /// $HOME/.sealbid
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// true/false, yes/no, on/off, 1/0 (case-insensitive)
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::map<std::string, Entry> entries_;
    std::vector<std::string> positional_;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    /// Lower origins never replace higher ones; in a file the first value wins
    void Store(const std::string& key, Entry entry);
};

} // namespace util
} // namespace sealbid

#endif // SEALBID_UTIL_CONFIG_H

// VESCROW - Configuration File Parser
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Parses INI-style configuration files for the escrow ledger.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef VESCROW_UTIL_CONFIG_H
#define VESCROW_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vescrow {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".vescrow";

constexpr const char* DEFAULT_CONFIG_FILENAME = "vescrow.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, the command line and built-in defaults.
 *
 * Priority (highest first): command line, config file, defaults.
 * Command-line options may address a section as -section.key=value.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments. Options start with '-' or '--';
     * anything else is kept as a positional argument.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    /// Non-option command-line arguments, in order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a whole decimal number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Comma-separated list value
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set only if no value is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections and Validation
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Register a known key; Validate() reports keys never registered
    void AllowKey(const std::string& key, const std::string& section = "");

    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const;

    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);

    static std::string Unquote(const std::string& str);

    static std::optional<bool> ParseBool(const std::string& str);

    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // [escrow]
    constexpr const char* ESCROW_SECTION = "escrow";
    constexpr const char* LOCKUNIT = "lockunit";
    constexpr const char* MAXLOCKDURATION = "maxlockduration";
    constexpr const char* MAXSWEEPBUCKETS = "maxsweepbuckets";
    constexpr const char* NAME = "name";
    constexpr const char* SYMBOL = "symbol";
}

} // namespace util
} // namespace vescrow

#endif // VESCROW_UTIL_CONFIG_H

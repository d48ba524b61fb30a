// VESCROW - Configuration File Parser Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace vescrow {
namespace util {

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double-quoted values support a small set of escapes
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
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
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare key is a flag; "nokey" negates it
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    auto it = entries_.find(MakeKey(key, currentSection));
    if (it != entries_.end() && it->second.source == "<command-line>") {
        return true;  // Command line wins over files
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[MakeKey(key, currentSection)] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
        return result;
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
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }

    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        arg = arg.substr(start);

        std::string key = arg;
        std::string value = "true";
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }

        // -section.key=value
        std::string section;
        size_t dotPos = key.find('.');
        if (dotPos != std::string::npos) {
            section = key.substr(0, dotPos);
            key = key.substr(dotPos + 1);
        }

        if (!IsValidKey(key) || (!section.empty() && !IsValidKey(section))) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>");
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.section = section;
        entry.source = "<command-line>";
        entries_[MakeKey(key, section)] = entry;
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str->c_str(), &end, 10);
    if (errno == ERANGE || end == str->c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto str = TryGetString(key, section);
    if (!str) {
        return result;
    }

    std::istringstream ss(*str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[MakeKey(key, section)] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) > 0) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Sections and Validation
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }
    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.count(fullKey) == 0) {
            errors.push_back("Unknown key: " + fullKey + " (defined in " + entry.source + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

} // namespace util
} // namespace vescrow

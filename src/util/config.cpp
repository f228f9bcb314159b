// STAKEGOV - Configuration File Parser Implementation
// Copyright (c) 2024 STAKEGOV Developers
// MIT License

#include "stakegov/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace stakegov {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

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
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }

    // Double quotes honour \n \t \r \\ and \"
    std::string inner = str.substr(1, str.length() - 2);
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case 'r': unescaped += '\r'; ++i; continue;
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
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<int64_t> ConfigManager::ParseInt(const std::string& str) {
    std::string s = Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

bool ConfigManager::IsValidKey(const std::string& key, char& bad) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            bad = c;
            return false;
        }
    }
    return !key.empty();
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                if (const char* envValue = std::getenv(varName.c_str())) {
                    result += envValue;
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
        return path;
    }

    std::string home;
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    std::string home = ExpandTilde("~");
    if (home == "~") {
        return "";
    }
    return home + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.fromCommandLine && !entry.fromCommandLine) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// File Parsing
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
        return true;
    }

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }

        std::string includePath = ExpandEnvVars(ExpandTilde(Unquote(Trim(trimmed.substr(8)))));

        ++includeDepth_;
        ConfigParseResult includeResult = ParseFile(includePath);
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nofoo" negates foo
        std::string key = trimmed;
        bool negated = false;
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            negated = true;
        }
        entry.key = key;
        entry.value = negated ? "false" : "true";
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    char bad = '\0';
    if (!IsValidKey(entry.key, bad)) {
        result = ConfigParseResult::Error(
            entry.key.empty() ? "Empty key" : "Invalid character in key: " + std::string(1, bad),
            source, lineNum);
        return false;
    }

    Store(std::move(entry));
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

    if (!continuation.empty()) {
        if (!ParseLine(continuation, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  std::vector<std::string>* positional) {
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
        if (start == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        arg = arg.substr(start);

        ConfigEntry entry;
        entry.source = "<command-line>";
        entry.fromCommandLine = true;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "false";
        } else {
            entry.key = arg;
            entry.value = "true";
        }

        char bad = '\0';
        if (!IsValidKey(entry.key, bad)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>");
        }
        Store(std::move(entry));
    }

    if (positional) {
        for (; i < argc; ++i) {
            positional->emplace_back(argv[i]);
        }
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

const ConfigEntry* ConfigManager::GetEntry(const std::string& key,
                                           const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    return it == entries_.end() ? nullptr : &it->second;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return GetEntry(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (const ConfigEntry* entry = GetEntry(key, section)) {
        return entry->value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    const ConfigEntry* entry = GetEntry(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return ParseInt(entry->value);
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto intValue = TryGetInt(key, section);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigEntry* entry = GetEntry(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return ParseBool(entry->value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
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
    entries_[MakeKey(key, section)] = std::move(entry);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Utilities
// ============================================================================

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
    includeDepth_ = 0;
}

} // namespace util
} // namespace stakegov

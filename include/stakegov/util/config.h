// STAKEGOV - Configuration File Parser
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// Parses INI-style configuration files and -key=value command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag set to true; "nokey" sets it to false
// - Environment variable expansion: ${VAR_NAME}
// - include <path> pulls in another file

#ifndef STAKEGOV_UTIL_CONFIG_H
#define STAKEGOV_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakegov {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".stakegov";

constexpr const char* DEFAULT_CONFIG_FILENAME = "stakegov.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth (to prevent infinite recursion)
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>", "<default>" ...
    int lineNumber{0};
    bool isDefault{false};
    bool fromCommandLine{false};
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

    /// "file:line: message" form for printing
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and the command line.
 *
 * Command-line values always win: a file parsed after ParseCommandLine
 * never replaces a key that came from the command line.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ------------------------------------------------------------------------
    // Parsing
    // ------------------------------------------------------------------------

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse leading -key=value / -flag / -noflag options.
     * Parsing stops at the first argument that does not start with '-'
     * (or after a bare "--"); that argument and everything after it is
     * appended to positional, if given.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

    // ------------------------------------------------------------------------
    // Value Retrieval
    // ------------------------------------------------------------------------

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt if the key is missing or the value is not a whole integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// String value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    const ConfigEntry* GetEntry(const std::string& key,
                                const std::string& section = "") const;

    // ------------------------------------------------------------------------
    // Value Setting
    // ------------------------------------------------------------------------

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ------------------------------------------------------------------------
    // Utilities
    // ------------------------------------------------------------------------

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// ~/.stakegov (empty if HOME cannot be determined)
    static std::string GetDefaultDataDir();

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    static std::optional<bool> ParseBool(const std::string& str);

    static std::optional<int64_t> ParseInt(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(ConfigEntry entry);

    static bool IsValidKey(const std::string& key, char& bad);

    static std::string Trim(const std::string& str);

    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // Invocation
    constexpr const char* CALLER = "caller";
    constexpr const char* HEIGHT = "height";

    // Governance deployment constants
    constexpr const char* MINPROPOSALSTAKE = "minproposalstake";
    constexpr const char* PROPOSALDURATION = "proposalduration";
    constexpr const char* CUSTODYACCOUNT = "custodyaccount";
}

} // namespace util
} // namespace stakegov

#endif // STAKEGOV_UTIL_CONFIG_H

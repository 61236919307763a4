// MINTGUARD - Configuration File Parser
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Parses INI-style configuration files and command-line options for the
// issuance controller.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section] (e.g. [regtest] overrides for the test preset)
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef MINTGUARD_UTIL_CONFIG_H
#define MINTGUARD_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mintguard {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "mintguard.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false}; // True if this is a default value
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file or a command line.
 */
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
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line options (-key=value)
 * 2. Config file in the data directory
 * 3. Defaults registered with SetDefault()
 *
 * Arguments that do not start with '-' are kept, in order, as positional
 * arguments (the executor's command and its operands).
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @param overwrite If false, keys already set (e.g. from the command
     *                  line) are left untouched
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @param overwrite If false, keys already set are left untouched
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments. Options take the form -key=value or a
     * bare -flag (-noflag negates). Everything else is positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Get string value with default
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (returns nullopt if key doesn't exist or is not a
    /// plain decimal integer)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    /// Get integer value with default
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    /// Get boolean value with default
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get path value (with ~ and ${VAR} expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Positional (non-option) command-line arguments, in order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than config files)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

    /// Parse a strict decimal integer ("-12", "300"); nullopt on any junk
    static std::optional<int64_t> ParseInt(const std::string& str);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

private:
    /// Internal key for section:key combination
    std::string MakeKey(const std::string& key, const std::string& section) const;

    /// Parse a whole buffer line by line
    ConfigParseResult ParseStream(std::istream& stream, const std::string& source,
                                  bool overwrite);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection,
                   ConfigParseResult& result);

    /// Store an entry, respecting the overwrite rule
    void Store(ConfigEntry entry, bool overwrite);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Check a key for forbidden characters
    static bool IsValidKey(const std::string& key, char& badChar);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* REGTEST = "regtest";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";

    // Executor
    constexpr const char* HEIGHT = "height";
    constexpr const char* CALLER = "caller";

    // Issuance parameters
    constexpr const char* MAXISSUERS = "maxissuers";
    constexpr const char* TERMLENGTH = "termlength";
    constexpr const char* BASEMINTFACTOR = "basemintfactor";
    constexpr const char* MINTFACTORSCALE = "mintfactorscale";
    constexpr const char* BURNBONUS = "burnbonus";
    constexpr const char* LOWMINTTHRESHOLD = "lowmintthreshold";
    constexpr const char* SUPPLYFLOOR = "supplyfloor";
    constexpr const char* EARLYEXITBPS = "earlyexitbps";
    constexpr const char* CONTROLLER = "controller";
}

} // namespace util
} // namespace mintguard

#endif // MINTGUARD_UTIL_CONFIG_H

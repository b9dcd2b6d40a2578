// SPILLWAY - Configuration File Parser
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Parses INI-style configuration for the gauge controller.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Integer values may carry a duration suffix: s, m, h, d, w, y

#ifndef SPILLWAY_UTIL_CONFIG_H
#define SPILLWAY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spillway {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "spillway.conf";

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
 * Result of parsing a configuration source.
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
 * Holds configuration from files, strings and command-line arguments.
 *
 * Later sources overwrite earlier ones; values set through SetDefault()
 * never overwrite anything.
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
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form --key=value or
     * --section.key=value. Command-line values overwrite file values.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

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

    /// Get integer value (returns nullopt if key doesn't exist or is invalid)
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

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than any parsed source)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Get all section names
    std::vector<std::string> GetSections() const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key (for validation)
    void AllowKey(const std::string& key, const std::string& section = "");

    /// List keys of the given section that were never allowed
    std::vector<std::string> Validate(const std::string& section) const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Generate sample configuration file
    static std::string GenerateSampleConfig();

    /// Dump all configuration to string
    std::string Dump() const;

private:
    /// Internal key for section:key combination
    std::string MakeKey(const std::string& key, const std::string& section) const;

    /// Parse lines from a stream, honoring continuations
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

    /// Check key characters
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* GAUGE_SECTION = "gauge";

    constexpr const char* EMISSION_WINDOW = "emission_window";
    constexpr const char* BASE_BOOST_BPS = "base_boost_bps";
    constexpr const char* POOL_BOOST_BPS = "pool_boost_bps";
    constexpr const char* LOG_LEVEL = "log_level";
}

} // namespace util
} // namespace spillway

#endif // SPILLWAY_UTIL_CONFIG_H

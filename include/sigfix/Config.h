#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include "Constants.h"
#include "Diagnostics.h"
#include "SignatureSynthesizer.h"

namespace sigfix {

// Forward declaration
struct SigfixToolOptions;

/// Configuration loaded from a .sigfix.toml file.
/// All fields are optional - missing values use defaults during merge.
struct FileConfig {
    // [signatures] section
    std::optional<LineBudget> line_length_limit;  ///< nullopt inside means "none"

    // [formatting] section
    std::optional<int> indent;          ///< Number of spaces (or -1 for tab)

    // [detectors] section
    std::optional<bool> missing_signature;
    std::optional<bool> stray_lines;

    // [behavior] section
    std::optional<int> verbosity;       ///< 0=quiet, 1=normal, 2=verbose

    /// Check if any configuration was loaded
    [[nodiscard]] bool empty() const {
        return !line_length_limit && !indent &&
               !missing_signature && !stray_lines && !verbosity;
    }
};

/// Configuration from `# sigfix-KEY: VALUE` comments in a source file.
struct InlineConfig {
    std::optional<LineBudget> line_length_limit;
    std::optional<int> indent;          ///< Indentation spaces (-1 for tab)
    std::optional<bool> missing_signature;
    std::optional<bool> stray_lines;
    std::unordered_map<std::string, std::string> custom_options; ///< Unknown keys

    /// Check if any configuration was found
    [[nodiscard]] bool empty() const {
        return !line_length_limit && !indent && !missing_signature &&
               !stray_lines && custom_options.empty();
    }
};

/// Tracks which CLI options were explicitly specified (vs using defaults).
/// Used for priority-based merging.
struct CliFlags {
    bool has_line_length_limit = false;
    bool has_detectors = false;         ///< --only
    bool has_verbosity = false;
};

/// Final merged configuration with all values resolved.
/// Priority: CLI > inline > file > defaults
struct MergedConfig {
    LineBudget line_length_limit;   ///< Default: unbounded
    std::string indent = std::string(ONE_INDENT_LEVEL);
    bool missing_signature = true;
    bool stray_lines = true;
    int verbosity = 1;

    /// Convert to SigfixToolOptions (for use with SigfixTool)
    [[nodiscard]] SigfixToolOptions toToolOptions() const;
};

/// Loads and merges configuration from multiple sources.
class ConfigLoader {
public:
    static constexpr const char* CONFIG_FILENAME = ".sigfix.toml";

    /// Find the configuration file by searching:
    /// 1. Starting directory (typically CWD)
    /// 2. Git repository root
    /// Returns the path if found, nullopt otherwise.
    [[nodiscard]] static std::optional<std::filesystem::path> findConfigFile(
        const std::filesystem::path& start_dir = std::filesystem::current_path());

    /// Find the git repository root by searching upward for .git directory.
    [[nodiscard]] static std::optional<std::filesystem::path> findGitRoot(
        const std::filesystem::path& start_dir);

    /// Load and parse a TOML configuration file.
    /// @param config_path Path to the .sigfix.toml file
    /// @param diagnostics Optional collector for parse errors
    /// @return Parsed config or nullopt on error
    [[nodiscard]] static std::optional<FileConfig> loadFile(
        const std::filesystem::path& config_path,
        DiagnosticCollector* diagnostics = nullptr);

    /// Merge configurations with priority: CLI > inline > file > defaults.
    /// @param file_config Config from .sigfix.toml (lowest priority)
    /// @param inline_config Config from file comments
    /// @param cli_options Options parsed from command line (highest priority)
    /// @param cli_flags Which CLI options were explicitly set
    [[nodiscard]] static MergedConfig merge(
        const std::optional<FileConfig>& file_config,
        const InlineConfig& inline_config,
        const SigfixToolOptions& cli_options,
        const CliFlags& cli_flags = {});

    /// Layer one file's inline config over already merged tool options,
    /// leaving options that were set on the command line untouched.
    [[nodiscard]] static SigfixToolOptions applyInline(
        const SigfixToolOptions& options,
        const InlineConfig& inline_config,
        const CliFlags& cli_flags = {});
};

/// Convert an indent setting (-1 for tab) to the indentation unit
[[nodiscard]] std::string indentUnit(int spaces);

/// Parse `# sigfix-KEY: VALUE` comments.
/// Keys: line-length-limit (integer or none), indent (tab or 0-16),
/// missing-signature and stray-lines (true/false/yes/no/1/0).
/// Invalid values and unknown keys produce "inline_config" warnings.
[[nodiscard]] InlineConfig parseInlineConfig(
    const std::string& content,
    const std::string& file_path = "",
    DiagnosticCollector* diagnostics = nullptr);

} // namespace sigfix

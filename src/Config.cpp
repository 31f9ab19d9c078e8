#include "sigfix/Config.h"
#include "sigfix/Constants.h"
#include "sigfix/Tool.h"

#include <toml++/toml.hpp>

#include <cctype>
#include <charconv>
#include <regex>

namespace sigfix {

// ============================================================================
// MergedConfig implementation
// ============================================================================

SigfixToolOptions MergedConfig::toToolOptions() const {
    SigfixToolOptions opts;
    opts.line_length_limit = line_length_limit;
    opts.indent = indent;
    opts.missing_signature = missing_signature;
    opts.stray_lines = stray_lines;
    opts.verbosity = verbosity;
    return opts;
}

std::string indentUnit(int spaces) {
    if (spaces == -1) {
        return "\t";
    }
    return std::string(static_cast<size_t>(spaces), ' ');
}

// ============================================================================
// ConfigLoader implementation
// ============================================================================

std::optional<std::filesystem::path> ConfigLoader::findGitRoot(
    const std::filesystem::path& start_dir) {

    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path current = fs::absolute(start_dir, ec);
    if (ec) {
        return std::nullopt;
    }

    // Walk up the directory tree looking for .git
    while (!current.empty() && current.has_parent_path()) {
        if (fs::exists(current / ".git", ec)) {
            return current;
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // Reached filesystem root
        }
        current = parent;
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(
    const std::filesystem::path& start_dir) {

    namespace fs = std::filesystem;

    std::error_code ec;

    // 1. Check starting directory
    fs::path config_in_start = start_dir / CONFIG_FILENAME;
    if (fs::exists(config_in_start, ec)) {
        return config_in_start;
    }

    // 2. Check git repository root
    if (auto git_root = findGitRoot(start_dir)) {
        fs::path config_in_git = *git_root / CONFIG_FILENAME;
        if (fs::exists(config_in_git, ec)) {
            return config_in_git;
        }
    }

    return std::nullopt;
}

std::optional<FileConfig> ConfigLoader::loadFile(
    const std::filesystem::path& config_path,
    DiagnosticCollector* diagnostics) {

    FileConfig config;

    auto warn = [&](const std::string& msg) {
        if (diagnostics) {
            diagnostics->addWarning(msg, config_path.string(), 0, "config");
        }
    };

    try {
        toml::table tbl = toml::parse_file(config_path.string());

        // [signatures] section
        if (auto signatures = tbl["signatures"].as_table()) {
            if (auto val = (*signatures)["line_length_limit"].as_integer()) {
                if (val->get() > 0) {
                    config.line_length_limit = LineBudget(static_cast<size_t>(val->get()));
                } else {
                    warn("line_length_limit must be positive, ignoring " + std::to_string(val->get()));
                }
            } else if (auto str = (*signatures)["line_length_limit"].as_string()) {
                if (str->get() == "none") {
                    config.line_length_limit = LineBudget();
                } else {
                    warn("Unknown line_length_limit value: " + str->get() +
                         " (expected an integer or 'none')");
                }
            }
        }

        // [formatting] section
        if (auto formatting = tbl["formatting"].as_table()) {
            if (auto val = (*formatting)["indent"].as_integer()) {
                if (val->get() < 0 || val->get() > MAX_INDENT_SPACES) {
                    warn("indent must be between 0 and 16, ignoring " + std::to_string(val->get()));
                } else {
                    config.indent = static_cast<int>(val->get());
                }
            } else if (auto str = (*formatting)["indent"].as_string()) {
                if (str->get() == "tab") {
                    config.indent = -1;  // Special value for tab
                }
            }
        }

        // [detectors] section
        if (auto detectors = tbl["detectors"].as_table()) {
            if (auto val = (*detectors)["missing_signature"].as_boolean()) {
                config.missing_signature = val->get();
            }
            if (auto val = (*detectors)["stray_lines"].as_boolean()) {
                config.stray_lines = val->get();
            }
        }

        // [behavior] section
        if (auto behavior = tbl["behavior"].as_table()) {
            if (auto val = (*behavior)["verbosity"].as_integer()) {
                config.verbosity = static_cast<int>(val->get());
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        if (diagnostics) {
            diagnostics->addError(
                std::string("Failed to parse config file: ") + std::string(err.description()),
                config_path.string(),
                err.source().begin.line,
                "config",
                err.source().begin.column);
        }
        return std::nullopt;
    }
}

MergedConfig ConfigLoader::merge(
    const std::optional<FileConfig>& file_config,
    const InlineConfig& inline_config,
    const SigfixToolOptions& cli_options,
    const CliFlags& cli_flags) {

    MergedConfig result;

    // Start with defaults (already set in MergedConfig struct)

    // Layer 1: File config (lowest priority)
    if (file_config) {
        if (file_config->line_length_limit) {
            result.line_length_limit = *file_config->line_length_limit;
        }
        if (file_config->indent) {
            result.indent = indentUnit(*file_config->indent);
        }
        if (file_config->missing_signature) {
            result.missing_signature = *file_config->missing_signature;
        }
        if (file_config->stray_lines) {
            result.stray_lines = *file_config->stray_lines;
        }
        if (file_config->verbosity) {
            result.verbosity = *file_config->verbosity;
        }
    }

    // Layer 2: Inline config (overrides file config)
    if (inline_config.line_length_limit) {
        result.line_length_limit = *inline_config.line_length_limit;
    }
    if (inline_config.indent) {
        result.indent = indentUnit(*inline_config.indent);
    }
    if (inline_config.missing_signature) {
        result.missing_signature = *inline_config.missing_signature;
    }
    if (inline_config.stray_lines) {
        result.stray_lines = *inline_config.stray_lines;
    }

    // Layer 3: CLI options (highest priority)
    // CLI overrides all if explicitly specified
    if (cli_flags.has_line_length_limit) {
        result.line_length_limit = cli_options.line_length_limit;
    }
    if (cli_flags.has_detectors) {
        result.missing_signature = cli_options.missing_signature;
        result.stray_lines = cli_options.stray_lines;
    }
    if (cli_flags.has_verbosity) {
        result.verbosity = cli_options.verbosity;
    }

    return result;
}

SigfixToolOptions ConfigLoader::applyInline(
    const SigfixToolOptions& options,
    const InlineConfig& inline_config,
    const CliFlags& cli_flags) {

    SigfixToolOptions result = options;
    if (inline_config.line_length_limit && !cli_flags.has_line_length_limit) {
        result.line_length_limit = *inline_config.line_length_limit;
    }
    if (inline_config.indent) {
        result.indent = indentUnit(*inline_config.indent);
    }
    if (!cli_flags.has_detectors) {
        result.missing_signature = inline_config.missing_signature.value_or(result.missing_signature);
        result.stray_lines = inline_config.stray_lines.value_or(result.stray_lines);
    }
    return result;
}

// ============================================================================
// Inline configuration
// ============================================================================

namespace {

std::optional<int> parseInt(const std::string& value) {
    int result = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> parseBool(const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return std::nullopt;
}

} // namespace

InlineConfig parseInlineConfig(const std::string& content, const std::string& file_path, DiagnosticCollector* diagnostics) {
    InlineConfig config;

    // Helper to emit warnings for invalid values
    auto warnInvalidValue = [&](const std::string& key, const std::string& value,
                                const std::string& valid_values) {
        if (diagnostics) {
            diagnostics->addWarning(
                "Invalid value '" + value + "' for " + std::string(markers::INLINE_CONFIG_PREFIX) +
                key + ". Valid values: " + valid_values,
                file_path, 0, "inline_config");
        }
    };

    // Pattern: # sigfix-KEY: VALUE
    static const std::regex config_re(
        R"re(#\s*sigfix-([\w-]+)\s*:\s*(.+)$)re",
        std::regex::multiline);

    auto begin = std::sregex_iterator(content.begin(), content.end(), config_re);
    auto end = std::sregex_iterator();

    for (std::sregex_iterator it = begin; it != end; ++it) {
        std::smatch match = *it;
        std::string key = match[1].str();
        std::string value = match[2].str();

        // Trim trailing whitespace from value
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }

        if (key == "line-length-limit") {
            if (value == "none") {
                config.line_length_limit = LineBudget();
            } else if (auto limit = parseInt(value); limit && *limit > 0) {
                config.line_length_limit = LineBudget(static_cast<size_t>(*limit));
            } else {
                warnInvalidValue(key, value, "none, or a positive number");
            }
        } else if (key == "indent") {
            if (value == "tab") {
                config.indent = -1;
            } else if (auto indent = parseInt(value); indent && *indent >= 0 && *indent <= MAX_INDENT_SPACES) {
                config.indent = *indent;
            } else {
                warnInvalidValue(key, value, "tab, or 0-16");
            }
        } else if (key == "missing-signature") {
            if (auto enabled = parseBool(value)) {
                config.missing_signature = *enabled;
            } else {
                warnInvalidValue(key, value, "true, false, yes, no, 1, 0");
            }
        } else if (key == "stray-lines") {
            if (auto enabled = parseBool(value)) {
                config.stray_lines = *enabled;
            } else {
                warnInvalidValue(key, value, "true, false, yes, no, 1, 0");
            }
        } else {
            // Unknown key - warn and store as custom option
            if (diagnostics) {
                diagnostics->addWarning(
                    "Unknown inline config key '" + std::string(markers::INLINE_CONFIG_PREFIX) + key + "'. "
                    "Valid keys: line-length-limit, indent, missing-signature, stray-lines",
                    file_path, 0, "inline_config");
            }
            config.custom_options[key] = value;
        }
    }

    return config;
}

} // namespace sigfix

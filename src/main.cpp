#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "slang/util/CommandLine.h"
#include "slang/util/OS.h"

#include "sigfix/Config.h"
#include "sigfix/Constants.h"
#include "sigfix/Diagnostics.h"
#include "sigfix/Tool.h"
#include "sigfix/Writer.h"

using namespace slang;
using namespace sigfix;

namespace fs = std::filesystem;

static constexpr const char* SIGFIX_VERSION = "0.1.0";

// Ruby sources and the extension-less files commonly holding Ruby code
static bool isRubyFile(const fs::path& path) {
    auto ext = path.extension().string();
    auto name = path.filename().string();
    return ext == ".rb" || ext == ".rake" || ext == ".ru" || ext == ".gemspec" ||
           name == "Rakefile" || name == "Gemfile";
}

static void collectFiles(const fs::path& path, std::vector<fs::path>& out, DiagnosticCollector& diagnostics) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        for (auto it = fs::recursive_directory_iterator(path, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && isRubyFile(it->path())) {
                out.push_back(it->path());
            }
        }
        if (ec) {
            diagnostics.addWarning("Failed to list directory: " + ec.message(), path.string());
        }
    } else if (fs::exists(path, ec)) {
        out.push_back(path);
    } else {
        diagnostics.addError("No such file or directory: " + path.string());
    }
}

int main(int argc, char* argv[]) {
    CommandLine cmdLine;

    // ========================================================================
    // Options
    // ========================================================================

    std::optional<bool> showHelp;
    std::optional<bool> showVersion;
    cmdLine.add("-h,--help", showHelp, "Display available options");
    cmdLine.add("--version", showVersion, "Display version information and exit");

    // Output modes
    std::optional<bool> dryRun;
    std::optional<bool> diffMode;
    std::optional<bool> checkMode;
    cmdLine.add("--dry-run", dryRun, "Report offenses without modifying files");
    cmdLine.add("--diff", diffMode, "Output unified diff instead of modifying");
    cmdLine.add("--check", checkMode, "Check if files need changes (exit 1 if changes needed, for CI)");

    // Signature formatting
    std::optional<int32_t> lineLengthLimit;
    std::optional<bool> noLineLengthLimit;
    cmdLine.add("--line-length-limit", lineLengthLimit,
                "Break generated signatures over several lines beyond this width", "<columns>");
    cmdLine.add("--no-line-length-limit", noLineLengthLimit,
                "Always generate single-line signatures");

    // Detector selection
    std::optional<std::string> only;
    cmdLine.add("--only", only, "Run a single detector (missing-signature, stray-lines)", "<detector>");

    // Verbosity
    std::optional<bool> verbose;
    std::optional<bool> quiet;
    cmdLine.add("--verbose", verbose, "Increase verbosity");
    cmdLine.add("-q,--quiet", quiet, "Suppress non-error output");

    std::vector<std::string> inputs;
    cmdLine.setPositional(inputs, "files");

    // ========================================================================
    // Parse command line
    // ========================================================================

    if (!cmdLine.parse(argc, argv)) {
        for (const auto& err : cmdLine.getErrors()) {
            OS::printE(fmt::format("error: {}\n", err));
        }
        return 1;
    }

    if (showHelp == true) {
        OS::print(cmdLine.getHelpText("sigfix - Sorbet signature checker and fixer"));
        return 0;
    }

    if (showVersion == true) {
        OS::print(fmt::format("sigfix version {}\n", SIGFIX_VERSION));
        return 0;
    }

    if (lineLengthLimit && *lineLengthLimit <= 0) {
        OS::printE(fmt::format("error: --line-length-limit must be positive, got {}\n", *lineLengthLimit));
        return 1;
    }

    if (only && *only != MISSING_SIGNATURE_DETECTOR && *only != STRAY_LINES_DETECTOR) {
        OS::printE(fmt::format("error: unknown detector '{}' (expected {} or {})\n",
                               *only, MISSING_SIGNATURE_DETECTOR, STRAY_LINES_DETECTOR));
        return 1;
    }

    // ========================================================================
    // Load configuration file (.sigfix.toml)
    // ========================================================================

    DiagnosticCollector config_diagnostics;
    std::optional<FileConfig> file_config;
    if (auto config_path = ConfigLoader::findConfigFile()) {
        file_config = ConfigLoader::loadFile(*config_path, &config_diagnostics);
    }

    // ========================================================================
    // Build tool options (merging CLI > config file > defaults)
    // ========================================================================

    // Track which CLI options were explicitly specified
    CliFlags cli_flags;
    cli_flags.has_line_length_limit = lineLengthLimit.has_value() || noLineLengthLimit.has_value();
    cli_flags.has_detectors = only.has_value();
    cli_flags.has_verbosity = verbose.has_value() || quiet.has_value();

    // Build CLI options (these are the "raw" CLI values)
    SigfixTool::Options cli_options;
    if (lineLengthLimit && !noLineLengthLimit.value_or(false)) {
        cli_options.line_length_limit = static_cast<size_t>(*lineLengthLimit);
    }
    if (only) {
        cli_options.missing_signature = *only == MISSING_SIGNATURE_DETECTOR;
        cli_options.stray_lines = *only == STRAY_LINES_DETECTOR;
    }
    cli_options.verbosity = quiet.value_or(false) ? 0 : (verbose.value_or(false) ? 2 : 1);

    // Merge: CLI > config file > defaults
    // Note: Inline config is handled per-file by the tool
    InlineConfig empty_inline;
    MergedConfig merged = ConfigLoader::merge(file_config, empty_inline, cli_options, cli_flags);
    SigfixTool::Options options = merged.toToolOptions();
    int verbosity = options.verbosity;

    // Report config diagnostics (always shown - these are config issues)
    if (!config_diagnostics.diagnostics().empty()) {
        OS::printE(config_diagnostics.format());
    }
    if (config_diagnostics.hasErrors()) {
        return 1;
    }

    // ========================================================================
    // Collect input files
    // ========================================================================

    if (inputs.empty()) {
        OS::printE("error: no input files specified\n");
        OS::printE("Run with --help for usage information\n");
        return 1;
    }

    DiagnosticCollector input_diagnostics;
    std::vector<fs::path> files;
    for (const auto& input : inputs) {
        collectFiles(input, files, input_diagnostics);
    }
    if (!input_diagnostics.diagnostics().empty()) {
        OS::printE(input_diagnostics.format());
    }

    // ========================================================================
    // Check and fix
    // ========================================================================

    bool dry_run = dryRun.value_or(false);
    bool diff_mode = diffMode.value_or(false);
    bool check_mode = checkMode.value_or(false);

    int total_missing = 0;
    int total_stray = 0;
    int files_changed = 0;
    bool any_errors = input_diagnostics.hasErrors();
    DiagnosticCollector run_diagnostics;
    run_diagnostics.merge(input_diagnostics);

    for (const auto& path : files) {
        if (verbosity >= 2) {
            OS::print(fmt::format("Processing: {}\n", path.string()));
        }

        SigfixTool tool(options, cli_flags);
        auto result = tool.checkFile(path, dry_run || diff_mode || check_mode);

        // Print diagnostics for this file (always show - these are config/tool issues)
        if (tool.diagnostics().hasErrors() ||
            (tool.diagnostics().warningCount() > 0 && verbosity >= 1)) {
            OS::printE(tool.diagnostics().format());
        }
        run_diagnostics.merge(tool.diagnostics());

        if (!result.success) {
            any_errors = true;
            continue;
        }

        total_missing += result.missing_signature_count;
        total_stray += result.stray_lines_count;

        if (verbosity >= 1 && !diff_mode) {
            OS::print(SigfixTool::formatOffenses(result, path.string()));
        }

        if (result.hasChanges()) {
            ++files_changed;

            if (diff_mode) {
                SourceWriter writer(true);
                OS::print(writer.generateDiff(path, result.original_content,
                                              result.modified_content));
            }
        }
    }

    // Print summary
    if (verbosity >= 1 && !diff_mode) {
        std::string change_verb = (dry_run || check_mode) ? "would be " : "";
        OS::print(fmt::format("\nSummary: {} file(s) inspected, {} file(s) {}changed, "
                              "{} missing signature(s), {} stray line offense(s)",
                              files.size(), files_changed, change_verb,
                              total_missing, total_stray));
        if (run_diagnostics.warningCount() > 0) {
            OS::print(fmt::format(", {} warning(s)", run_diagnostics.warningCount()));
        }
        OS::print("\n");
    }

    // In check mode, exit 1 if any files would be changed (for CI)
    if (check_mode && files_changed > 0) {
        if (verbosity >= 1) {
            OS::printE("error: files need signature fixes (run without --check to apply)\n");
        }
        return 1;
    }

    return any_errors ? 1 : 0;
}

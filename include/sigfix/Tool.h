#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "Config.h"
#include "Constants.h"
#include "Diagnostics.h"
#include "Offense.h"
#include "SignatureSynthesizer.h"
#include "SyntaxTree.h"

namespace sigfix {

/// Result of checking a single file
struct CheckResult {
    std::string original_content;   ///< Original file content
    std::string modified_content;   ///< Content after applying all corrections
    std::vector<Offense> offenses;  ///< Offenses in document order
    int missing_signature_count = 0;
    int stray_lines_count = 0;
    bool success = true;            ///< false if the file could not be read, fixed or written

    /// Check if any changes were made
    [[nodiscard]] bool hasChanges() const {
        return original_content != modified_content;
    }
};

/// Configuration options for SigfixTool
/// NOTE: In production, values are set from MergedConfig via toToolOptions().
///       Defaults here are for direct use (e.g., tests).
struct SigfixToolOptions {
    LineBudget line_length_limit;   ///< Default: unbounded
    std::string indent = std::string(ONE_INDENT_LEVEL);
    bool missing_signature = true;
    bool stray_lines = true;
    int verbosity = 1;
};

/// Main orchestrator: parses a file, runs the enabled detectors over every
/// node in document order and applies all corrections in one batch.
class SigfixTool {
public:
    using Options = SigfixToolOptions;

    SigfixTool();
    explicit SigfixTool(const Options& options, const CliFlags& cli_flags = {});

    /// Check source text. The name is used for messages and diagnostics.
    [[nodiscard]] CheckResult checkText(const std::string& content, const std::string& name = "");

    /// Check a file and write the corrected content back.
    /// @param file Path to the file to check
    /// @param dry_run If true, don't modify the file
    [[nodiscard]] CheckResult checkFile(const std::filesystem::path& file, bool dry_run = false);

    /// Run the enabled detectors over every node of the tree (pre-order)
    [[nodiscard]] std::vector<Offense> findOffenses(const SyntaxTree& tree, const Options& options) const;

    /// Format offenses as `file:line:col: offense: message [detector]` lines
    [[nodiscard]] static std::string formatOffenses(const CheckResult& result, const std::string& name);

    /// Get the diagnostics collector
    [[nodiscard]] DiagnosticCollector& diagnostics() { return diagnostics_; }
    [[nodiscard]] const DiagnosticCollector& diagnostics() const { return diagnostics_; }

private:
    Options options_;
    CliFlags cli_flags_;
    DiagnosticCollector diagnostics_;
};

} // namespace sigfix

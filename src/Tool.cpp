#include "sigfix/Tool.h"

#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "sigfix/Constants.h"
#include "sigfix/MissingSignatureDetector.h"
#include "sigfix/Parser.h"
#include "sigfix/StrayLinesDetector.h"
#include "sigfix/Writer.h"

namespace sigfix {

SigfixTool::SigfixTool()
    : options_{} {
}

SigfixTool::SigfixTool(const Options& options, const CliFlags& cli_flags)
    : options_(options)
    , cli_flags_(cli_flags) {
}

std::vector<Offense> SigfixTool::findOffenses(const SyntaxTree& tree, const Options& options) const {
    std::vector<std::unique_ptr<Detector>> detectors;
    if (options.missing_signature) {
        SignatureSynthesizer synthesizer(options.line_length_limit, options.indent);
        detectors.push_back(std::make_unique<MissingSignatureDetector>(
            tree, detectFileModes(tree), std::move(synthesizer)));
    }
    if (options.stray_lines) {
        detectors.push_back(std::make_unique<StrayLinesDetector>(tree));
    }

    std::vector<Offense> offenses;
    tree.forEachPreorder([&](NodeId id) {
        for (const auto& detector : detectors) {
            if (auto offense = detector->onCandidate(id)) {
                offenses.push_back(std::move(*offense));
            }
        }
    });
    return offenses;
}

CheckResult SigfixTool::checkText(const std::string& content, const std::string& name) {
    CheckResult result;
    result.original_content = content;
    result.modified_content = content;

    // ─────────────────────────────────────────────────────────────────────────
    // Get configuration
    // ─────────────────────────────────────────────────────────────────────────
    InlineConfig inline_config = parseInlineConfig(content, name, &diagnostics_);
    Options options = ConfigLoader::applyInline(options_, inline_config, cli_flags_);

    // ─────────────────────────────────────────────────────────────────────────
    // Parse and detect
    // ─────────────────────────────────────────────────────────────────────────
    OutlineParser parser(&diagnostics_);
    auto tree = parser.parse(content, name);

    result.offenses = findOffenses(*tree, options);
    for (const auto& offense : result.offenses) {
        if (offense.detector == MISSING_SIGNATURE_DETECTOR) {
            ++result.missing_signature_count;
        } else if (offense.detector == STRAY_LINES_DETECTOR) {
            ++result.stray_lines_count;
        }
    }

    if (result.offenses.empty()) {
        return result;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Apply all corrections against the original content
    // ─────────────────────────────────────────────────────────────────────────
    DiagnosticCollector edit_diagnostics;
    SourceWriter writer(true, &edit_diagnostics);
    auto modified = writer.applyEdits(content, result.offenses);
    if (!modified) {
        for (const auto& diag : edit_diagnostics.diagnostics()) {
            diagnostics_.addError(diag.message, name, diag.line_number, diag.category);
        }
        result.success = false;
        return result;
    }
    result.modified_content = std::move(*modified);

    return result;
}

CheckResult SigfixTool::checkFile(const std::filesystem::path& file, bool dry_run) {
    // ─────────────────────────────────────────────────────────────────────────
    // Read source file
    // ─────────────────────────────────────────────────────────────────────────
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
        diagnostics_.addError("Failed to open file: " + file.string());
        CheckResult result;
        result.success = false;
        return result;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    CheckResult result = checkText(buffer.str(), file.string());

    // ─────────────────────────────────────────────────────────────────────────
    // Write back
    // ─────────────────────────────────────────────────────────────────────────
    if (result.success && result.hasChanges() && !dry_run) {
        SourceWriter writer(false, &diagnostics_);
        if (!writer.writeFile(file, result.modified_content)) {
            result.success = false;
        }
    }

    return result;
}

std::string SigfixTool::formatOffenses(const CheckResult& result, const std::string& name) {
    TextBuffer buffer(result.original_content, name);
    std::string out;
    for (const auto& offense : result.offenses) {
        size_t begin = offense.location.begin;
        out += fmt::format("{}:{}:{}: offense: {} [{}]\n",
                           name, buffer.lineOf(begin), buffer.columnOf(begin) + 1,
                           offense.message, offense.detector);
    }
    return out;
}

} // namespace sigfix

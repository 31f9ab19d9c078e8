#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "Diagnostics.h"
#include "SyntaxTree.h"

namespace sigfix {

/// Per-file typing modes derived from `# typed:` comments.
struct FileModes {
    bool strict = false;             ///< `# typed: strict` present anywhere
    bool signatures_enabled = false; ///< `# typed: true` present anywhere
};

/// Builds an outline SyntaxTree for Ruby source with tree-sitter-ruby.
///
/// The outline covers what the detectors need: scopes (class, module,
/// `class << self`), method definitions with their parameters, calls (with
/// plain arguments, with a block, or wrapping a definition) and opaque
/// statements. Definitions nested inside opaque statements are kept as
/// children of that statement.
///
/// The parser never fails: syntax errors and missing tokens produce warnings
/// ("parse" category) and tree-sitter's recovered tree is used.
class OutlineParser {
public:
    explicit OutlineParser(DiagnosticCollector* diagnostics = nullptr);

    /// Parse text into a tree. The buffer name is used for diagnostics.
    [[nodiscard]] std::unique_ptr<SyntaxTree> parse(std::string text,
                                                    std::string name = "") const;

    /// Parse an existing buffer
    [[nodiscard]] std::unique_ptr<SyntaxTree> parse(TextBuffer buffer) const;

private:
    DiagnosticCollector* diagnostics_;
};

/// Detect typing modes from the tree's comments.
/// Each comment must match exactly (e.g. `# typed: true`), anywhere in the file.
[[nodiscard]] FileModes detectFileModes(const SyntaxTree& tree);

} // namespace sigfix

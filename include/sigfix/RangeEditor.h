#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "SyntaxTree.h"

namespace sigfix {

// ============================================================================
// Edits
// ============================================================================

/// Relative order of insertions sharing an anchor.
/// Declarations go first, whichever offense contributed them.
enum class InsertOrder {
    Declaration,
    Normal
};

/// Splice text at an offset of the original buffer.
struct InsertBefore {
    size_t anchor = 0;
    std::string text;
    InsertOrder order = InsertOrder::Normal;

    bool operator==(const InsertBefore& other) const = default;
};

/// Replace [begin, end) of the original buffer.
struct ReplaceRange {
    size_t begin = 0;
    size_t end = 0;
    std::string text;

    bool operator==(const ReplaceRange& other) const = default;
};

/// Delete [begin, end) of the original buffer.
struct Remove {
    size_t begin = 0;
    size_t end = 0;

    bool operator==(const Remove& other) const = default;
};

/// A text patch against the original buffer. Edits are never applied to a
/// mutated buffer; SourceWriter composes them in one pass.
using Edit = std::variant<InsertBefore, ReplaceRange, Remove>;

/// Byte range the edit replaces (empty for insertions)
[[nodiscard]] SourceRange editRange(const Edit& edit);

/// Replacement text of the edit (empty for removals)
[[nodiscard]] std::string editText(const Edit& edit);

// ============================================================================
// RangeEditor
// ============================================================================

/// Result of collapsing the lines between two siblings.
struct Collapse {
    SourceRange range;      ///< Lines to remove, see RangeEditor::linesBetween()
    std::string preserved;  ///< Non-blank lines of the range (comments), each ending in '\n'

    /// Drop the range and move its comments to relocate_to
    [[nodiscard]] std::vector<Edit> toEdits(size_t relocate_to) const;
};

/// Computes byte-range patches between and before sibling nodes.
///
/// Arguments are contract-checked with assertions: the first node of a pair
/// must end before the second begins and every range must lie in the buffer.
class RangeEditor {
public:
    explicit RangeEditor(const SyntaxTree& tree) : tree_(tree) {}

    /// Lines strictly between the end of a and the start of b: from just
    /// after the first line break to just after the last one. Empty when a
    /// and b are on the same line or separated by a single line break.
    [[nodiscard]] SourceRange linesBetween(NodeId a, NodeId b) const;

    /// Collapse the lines between a and b down to a single line break.
    /// Returns nothing when there is nothing to collapse.
    [[nodiscard]] std::optional<Collapse> collapse(NodeId a, NodeId b) const;

    /// Insert text above node. text carries its own indentation and
    /// trailing line break. When node is not the first thing on its line,
    /// the insertion happens at the node and the text is reshaped so the
    /// node moves to a fresh line with the same indentation.
    [[nodiscard]] Edit insertBefore(NodeId node, std::string text,
                                    InsertOrder order = InsertOrder::Normal) const;

    /// Start offset of the line containing node
    [[nodiscard]] size_t wholeLineStart(NodeId node) const;

private:
    const SyntaxTree& tree_;
};

} // namespace sigfix

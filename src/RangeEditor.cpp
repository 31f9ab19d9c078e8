#include "sigfix/RangeEditor.h"

#include <cassert>

namespace sigfix {

// ============================================================================
// Edit helpers
// ============================================================================

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool isBlankLine(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

} // namespace

SourceRange editRange(const Edit& edit) {
    return std::visit(Overloaded{
        [](const InsertBefore& e) { return SourceRange(e.anchor, e.anchor); },
        [](const ReplaceRange& e) { return SourceRange(e.begin, e.end); },
        [](const Remove& e) { return SourceRange(e.begin, e.end); },
    }, edit);
}

std::string editText(const Edit& edit) {
    return std::visit(Overloaded{
        [](const InsertBefore& e) { return e.text; },
        [](const ReplaceRange& e) { return e.text; },
        [](const Remove&) { return std::string(); },
    }, edit);
}

std::vector<Edit> Collapse::toEdits(size_t relocate_to) const {
    std::vector<Edit> edits;
    if (!preserved.empty()) {
        edits.push_back(InsertBefore{relocate_to, preserved});
    }
    edits.push_back(Remove{range.begin, range.end});
    return edits;
}

// ============================================================================
// RangeEditor
// ============================================================================

SourceRange RangeEditor::linesBetween(NodeId a, NodeId b) const {
    size_t end_of_a = tree_.sourceRange(a).end;
    size_t start_of_b = tree_.sourceRange(b).begin;
    assert(end_of_a <= start_of_b);

    std::string_view between = tree_.buffer().slice(SourceRange(end_of_a, start_of_b));
    size_t first = between.find('\n');
    if (first == std::string_view::npos) {
        return SourceRange(end_of_a, end_of_a);
    }
    size_t last = between.rfind('\n');
    return SourceRange(end_of_a + first + 1, end_of_a + last + 1);
}

std::optional<Collapse> RangeEditor::collapse(NodeId a, NodeId b) const {
    SourceRange range = linesBetween(a, b);
    if (range.empty()) {
        return std::nullopt;
    }

    Collapse result;
    result.range = range;

    // Keep non-blank lines (comments), drop blank ones
    std::string_view text = tree_.buffer().slice(range);
    size_t line_begin = 0;
    while (line_begin < text.size()) {
        size_t eol = text.find('\n', line_begin);
        if (eol == std::string_view::npos) {
            eol = text.size() - 1;
        }
        std::string_view line = text.substr(line_begin, eol - line_begin);
        if (!isBlankLine(line)) {
            result.preserved.append(line);
            result.preserved.push_back('\n');
        }
        line_begin = eol + 1;
    }
    return result;
}

Edit RangeEditor::insertBefore(NodeId node, std::string text, InsertOrder order) const {
    const auto& buffer = tree_.buffer();
    size_t begin = tree_.sourceRange(node).begin;

    if (buffer.isFirstOnLine(begin)) {
        return InsertBefore{buffer.lineStart(begin), std::move(text), order};
    }

    // Mid-line: `foo; def bar` becomes `foo; <text>\n<indent>def bar`
    size_t first = text.find_first_not_of(" \t");
    std::string reshaped = first == std::string::npos ? std::string() : text.substr(first);
    while (!reshaped.empty() && reshaped.back() == '\n') {
        reshaped.pop_back();
    }
    reshaped.push_back('\n');
    reshaped.append(buffer.indentationAt(begin));
    return InsertBefore{begin, std::move(reshaped), order};
}

size_t RangeEditor::wholeLineStart(NodeId node) const {
    return tree_.buffer().lineStart(tree_.sourceRange(node).begin);
}

} // namespace sigfix

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sigfix {

/// Half-open byte range [begin, end) into a TextBuffer.
struct SourceRange {
    size_t begin = 0;
    size_t end = 0;

    SourceRange() = default;
    SourceRange(size_t b, size_t e) : begin(b), end(e) {}

    [[nodiscard]] bool empty() const { return end <= begin; }
    [[nodiscard]] size_t size() const { return empty() ? 0 : end - begin; }
    [[nodiscard]] bool contains(size_t offset) const { return offset >= begin && offset < end; }

    bool operator==(const SourceRange& other) const = default;
};

/// Immutable source text with a precomputed line table.
/// Lines are 1-based, columns 0-based byte counts.
class TextBuffer {
public:
    TextBuffer() : TextBuffer(std::string{}) {}
    explicit TextBuffer(std::string text, std::string name = "");

    [[nodiscard]] std::string_view text() const { return text_; }
    [[nodiscard]] size_t size() const { return text_.size(); }

    /// Display name of the buffer (usually the file path, may be empty)
    [[nodiscard]] const std::string& name() const { return name_; }

    /// Substring for a range. The range must lie within the buffer.
    [[nodiscard]] std::string_view slice(SourceRange range) const;

    [[nodiscard]] size_t lineCount() const { return line_starts_.size(); }

    /// 1-based line containing offset (offset == size() maps to the last line)
    [[nodiscard]] size_t lineOf(size_t offset) const;

    /// 0-based byte column of offset within its line
    [[nodiscard]] size_t columnOf(size_t offset) const;

    /// Offset of the first byte of the line containing offset
    [[nodiscard]] size_t lineStart(size_t offset) const;

    /// Offset of the first byte of a 1-based line
    [[nodiscard]] size_t startOfLine(size_t line) const;

    /// Leading whitespace of the line containing offset
    [[nodiscard]] std::string_view indentationAt(size_t offset) const;

    /// True if only spaces and tabs precede offset on its line
    [[nodiscard]] bool isFirstOnLine(size_t offset) const;

private:
    std::string text_;
    std::string name_;
    std::vector<size_t> line_starts_;
};

} // namespace sigfix

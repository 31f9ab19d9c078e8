#include "sigfix/TextBuffer.h"

#include <algorithm>
#include <cassert>

namespace sigfix {

TextBuffer::TextBuffer(std::string text, std::string name)
    : text_(std::move(text))
    , name_(std::move(name)) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

std::string_view TextBuffer::slice(SourceRange range) const {
    assert(range.begin <= range.end && range.end <= text_.size());
    return std::string_view(text_).substr(range.begin, range.end - range.begin);
}

size_t TextBuffer::lineOf(size_t offset) const {
    assert(offset <= text_.size());
    // First line start strictly greater than offset, the line is the one before it
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    return static_cast<size_t>(it - line_starts_.begin());
}

size_t TextBuffer::columnOf(size_t offset) const {
    return offset - lineStart(offset);
}

size_t TextBuffer::lineStart(size_t offset) const {
    return line_starts_[lineOf(offset) - 1];
}

size_t TextBuffer::startOfLine(size_t line) const {
    assert(line >= 1 && line <= line_starts_.size());
    return line_starts_[line - 1];
}

std::string_view TextBuffer::indentationAt(size_t offset) const {
    size_t begin = lineStart(offset);
    size_t end = begin;
    while (end < text_.size() && (text_[end] == ' ' || text_[end] == '\t')) {
        ++end;
    }
    return slice({begin, end});
}

bool TextBuffer::isFirstOnLine(size_t offset) const {
    return lineStart(offset) + indentationAt(offset).size() >= offset;
}

} // namespace sigfix

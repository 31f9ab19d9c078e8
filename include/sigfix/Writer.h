#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Diagnostics.h"
#include "Offense.h"
#include "RangeEditor.h"

namespace sigfix {

/// A text replacement to apply to source content.
struct Replacement {
    size_t start;           ///< Start byte offset (inclusive)
    size_t end;             ///< End byte offset (exclusive)
    std::string new_text;   ///< Replacement text
    std::string description;///< Optional description for logging
    int rank = 0;           ///< Insertions at one offset apply in ascending rank

    Replacement() : start(0), end(0) {}
    Replacement(size_t s, size_t e, std::string text, std::string desc = "")
        : start(s), end(e), new_text(std::move(text)), description(std::move(desc)) {}

    /// Same range and text (the description is informational)
    [[nodiscard]] bool sameEdit(const Replacement& other) const {
        return start == other.start && end == other.end && new_text == other.new_text;
    }
};

/// Convert an edit to a (range, text) replacement on the original buffer
[[nodiscard]] Replacement toReplacement(const Edit& edit, std::string description = "");

/// Applies edits to source content and writes files.
/// All offsets refer to the original content; the writer composes them in a
/// single forward pass and never re-applies to modified text.
class SourceWriter {
public:
    explicit SourceWriter(bool dry_run = false, DiagnosticCollector* diagnostics = nullptr);

    /// Apply replacements to text content.
    /// Replacements are ordered by start offset (insertions at an offset go
    /// before a range starting there, equal keys keep their given order).
    /// @param content Original text content
    /// @param replacements Replacements against content
    /// @return Modified content, or nullopt if two replacements overlap or
    ///         one lies outside content (an "edit" error is recorded)
    [[nodiscard]] std::optional<std::string> applyReplacements(
        const std::string& content,
        std::vector<Replacement> replacements);

    /// Apply the corrections of all offenses in one batch.
    /// Identical edits planned by several offenses (such as one scope
    /// declaration for many methods) are applied once.
    [[nodiscard]] std::optional<std::string> applyEdits(
        const std::string& content,
        const std::vector<Offense>& offenses);

    /// Write content to a file.
    /// @param file Path to write to
    /// @param content Content to write
    /// @return true if file was written (false if dry_run or on failure)
    bool writeFile(const std::filesystem::path& file, const std::string& content);

    /// Generate a unified diff between original and modified content.
    /// @param file File path for diff header
    /// @param original Original content
    /// @param modified Modified content
    /// @return Unified diff string with 3 lines of context (empty if equal)
    [[nodiscard]] std::string generateDiff(
        const std::filesystem::path& file,
        const std::string& original,
        const std::string& modified) const;

private:
    void reportError(const std::string& msg) const;

    bool dry_run_;
    DiagnosticCollector* diagnostics_;
};

} // namespace sigfix

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sigfix {

/// Diagnostic severity level
enum class DiagnosticLevel {
    Warning,
    Error
};

/// A tool diagnostic (configuration, parsing or edit merging problem).
/// Offenses found by detectors are reported separately, see Offense.h.
struct Diagnostic {
    DiagnosticLevel level;
    std::string message;
    std::string file_path;
    size_t line_number = 0;
    size_t column = 0;
    std::string category;  // "config", "parse", "inline_config", "edit", ...

    Diagnostic(DiagnosticLevel lvl, std::string msg,
               std::string file = "", size_t line = 0,
               std::string diag_category = "", size_t col = 0)
        : level(lvl)
        , message(std::move(msg))
        , file_path(std::move(file))
        , line_number(line)
        , column(col)
        , category(std::move(diag_category)) {}
};

/// Collects warnings and errors without throwing exceptions.
/// Every layer around the correction engine reports through one of these.
class DiagnosticCollector {
public:
    DiagnosticCollector() = default;

    void addWarning(const std::string& msg,
                    const std::string& file = "",
                    size_t line = 0,
                    const std::string& category = "",
                    size_t column = 0);

    void addError(const std::string& msg,
                  const std::string& file = "",
                  size_t line = 0,
                  const std::string& category = "",
                  size_t column = 0);

    /// Append all diagnostics of another collector
    void merge(const DiagnosticCollector& other);

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool hasErrors() const { return error_count_ > 0; }

    [[nodiscard]] size_t errorCount() const { return error_count_; }

    [[nodiscard]] size_t warningCount() const { return warning_count_; }

    /// Count diagnostics of one category
    [[nodiscard]] size_t countCategory(const std::string& category) const;

    /// Format all diagnostics as `file:line:col: level: message` lines
    [[nodiscard]] std::string format() const;

private:
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
};

} // namespace sigfix

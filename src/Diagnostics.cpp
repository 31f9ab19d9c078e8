#include "sigfix/Diagnostics.h"

#include <algorithm>

#include <fmt/format.h>

namespace sigfix {

void DiagnosticCollector::addWarning(const std::string& msg,
                                     const std::string& file,
                                     size_t line,
                                     const std::string& category,
                                     size_t column) {
    diagnostics_.emplace_back(DiagnosticLevel::Warning, msg, file, line, category, column);
    ++warning_count_;
}

void DiagnosticCollector::addError(const std::string& msg,
                                   const std::string& file,
                                   size_t line,
                                   const std::string& category,
                                   size_t column) {
    diagnostics_.emplace_back(DiagnosticLevel::Error, msg, file, line, category, column);
    ++error_count_;
}

void DiagnosticCollector::merge(const DiagnosticCollector& other) {
    diagnostics_.insert(diagnostics_.end(),
                        other.diagnostics_.begin(), other.diagnostics_.end());
    error_count_ += other.error_count_;
    warning_count_ += other.warning_count_;
}

size_t DiagnosticCollector::countCategory(const std::string& category) const {
    return static_cast<size_t>(std::count_if(
        diagnostics_.begin(), diagnostics_.end(),
        [&](const Diagnostic& d) { return d.category == category; }));
}

std::string DiagnosticCollector::format() const {
    std::string out;

    for (const auto& diag : diagnostics_) {
        if (!diag.file_path.empty()) {
            out += diag.file_path;
            if (diag.line_number > 0) {
                out += fmt::format(":{}", diag.line_number);
                if (diag.column > 0) {
                    out += fmt::format(":{}", diag.column);
                }
            }
            out += ": ";
        }

        out += fmt::format("{}: {}\n",
                           diag.level == DiagnosticLevel::Error ? "error" : "warning",
                           diag.message);
    }

    return out;
}

} // namespace sigfix

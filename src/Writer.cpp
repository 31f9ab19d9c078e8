#include "sigfix/Writer.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

namespace sigfix {

Replacement toReplacement(const Edit& edit, std::string description) {
    SourceRange range = editRange(edit);
    Replacement repl(range.begin, range.end, editText(edit), std::move(description));
    if (const auto* insert = std::get_if<InsertBefore>(&edit)) {
        repl.rank = static_cast<int>(insert->order);
    }
    return repl;
}

// ============================================================================
// SourceWriter Implementation
// ============================================================================

SourceWriter::SourceWriter(bool dry_run, DiagnosticCollector* diagnostics)
    : dry_run_(dry_run)
    , diagnostics_(diagnostics) {
}

void SourceWriter::reportError(const std::string& msg) const {
    if (diagnostics_) {
        diagnostics_->addError(msg, "", 0, "edit");
    }
}

std::optional<std::string> SourceWriter::applyReplacements(
    const std::string& content,
    std::vector<Replacement> replacements) {

    // Sort by start offset, ascending; insertions first at equal offsets,
    // ordered by rank among themselves
    std::stable_sort(replacements.begin(), replacements.end(),
        [](const Replacement& a, const Replacement& b) {
            if (a.start != b.start) {
                return a.start < b.start;
            }
            bool a_inserts = a.end == a.start;
            bool b_inserts = b.end == b.start;
            if (a_inserts != b_inserts) {
                return a_inserts;
            }
            return a_inserts && a.rank < b.rank;
        });

    std::string result;
    result.reserve(content.size());
    size_t pos = 0;

    for (const auto& repl : replacements) {
        if (repl.start > repl.end || repl.end > content.size()) {
            reportError(fmt::format("Edit [{}, {}) lies outside the buffer of {} bytes",
                                    repl.start, repl.end, content.size()));
            return std::nullopt;
        }
        if (repl.start < pos) {
            reportError(fmt::format("Overlapping edits at offset {}{}", repl.start,
                                    repl.description.empty() ? "" : " (" + repl.description + ")"));
            return std::nullopt;
        }
        result.append(content, pos, repl.start - pos);
        result += repl.new_text;
        pos = repl.end;
    }
    result.append(content, pos, std::string::npos);

    return result;
}

std::optional<std::string> SourceWriter::applyEdits(
    const std::string& content,
    const std::vector<Offense>& offenses) {

    std::vector<Replacement> replacements;
    for (const auto& offense : offenses) {
        for (const auto& edit : offense.corrections) {
            Replacement repl = toReplacement(edit, offense.detector);
            bool duplicate = std::any_of(replacements.begin(), replacements.end(),
                [&repl](const Replacement& other) { return other.sameEdit(repl); });
            if (!duplicate) {
                replacements.push_back(std::move(repl));
            }
        }
    }

    return applyReplacements(content, std::move(replacements));
}

bool SourceWriter::writeFile(const std::filesystem::path& file, const std::string& content) {
    if (dry_run_) {
        return false;
    }

    std::ofstream ofs(file, std::ios::binary);
    if (!ofs) {
        reportError("Failed to open file for writing: " + file.string());
        return false;
    }

    ofs << content;
    return static_cast<bool>(ofs);
}

// ============================================================================
// Unified diff
// ============================================================================

namespace {

enum class DiffOpKind { Equal, Delete, Insert };

struct DiffOp {
    DiffOpKind kind;
    size_t a_index;     ///< Line in original (Equal, Delete)
    size_t b_index;     ///< Line in modified (Equal, Insert)
};

std::vector<std::string> splitLines(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

/// Shortest edit script (Myers) between two line sequences
std::vector<DiffOp> diffLines(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const auto n = static_cast<long>(a.size());
    const auto m = static_cast<long>(b.size());
    const long max = n + m;
    const long offset = max + 1;

    std::vector<long> v(static_cast<size_t>(2 * max + 3), 0);
    std::vector<std::vector<long>> trace;

    auto at = [&](std::vector<long>& vec, long k) -> long& {
        return vec[static_cast<size_t>(k + offset)];
    };

    long final_d = 0;
    bool done = false;
    for (long d = 0; d <= max && !done; ++d) {
        trace.push_back(v);
        for (long k = -d; k <= d; k += 2) {
            long x = (k == -d || (k != d && at(v, k - 1) < at(v, k + 1)))
                ? at(v, k + 1)
                : at(v, k - 1) + 1;
            long y = x - k;
            while (x < n && y < m && a[static_cast<size_t>(x)] == b[static_cast<size_t>(y)]) {
                ++x;
                ++y;
            }
            at(v, k) = x;
            if (x >= n && y >= m) {
                final_d = d;
                done = true;
                break;
            }
        }
    }

    std::vector<DiffOp> ops;
    long x = n;
    long y = m;
    for (long d = final_d; d > 0; --d) {
        auto& prev_v = trace[static_cast<size_t>(d)];
        long k = x - y;
        long prev_k = (k == -d || (k != d && at(prev_v, k - 1) < at(prev_v, k + 1))) ? k + 1 : k - 1;
        long prev_x = at(prev_v, prev_k);
        long prev_y = prev_x - prev_k;

        while (x > prev_x && y > prev_y) {
            --x;
            --y;
            ops.push_back({DiffOpKind::Equal, static_cast<size_t>(x), static_cast<size_t>(y)});
        }
        if (x == prev_x) {
            ops.push_back({DiffOpKind::Insert, static_cast<size_t>(x), static_cast<size_t>(prev_y)});
        } else {
            ops.push_back({DiffOpKind::Delete, static_cast<size_t>(prev_x), static_cast<size_t>(y)});
        }
        x = prev_x;
        y = prev_y;
    }
    while (x > 0 && y > 0) {
        --x;
        --y;
        ops.push_back({DiffOpKind::Equal, static_cast<size_t>(x), static_cast<size_t>(y)});
    }

    std::reverse(ops.begin(), ops.end());
    return ops;
}

} // namespace

std::string SourceWriter::generateDiff(
    const std::filesystem::path& file,
    const std::string& original,
    const std::string& modified) const {

    if (original == modified) {
        return "";
    }

    auto orig_lines = splitLines(original);
    auto mod_lines = splitLines(modified);
    auto ops = diffLines(orig_lines, mod_lines);

    constexpr size_t context_lines = 3;

    std::ostringstream diff;
    diff << "--- a/" << file.string() << "\n";
    diff << "+++ b/" << file.string() << "\n";

    size_t i = 0;
    while (i < ops.size()) {
        // Find next change
        while (i < ops.size() && ops[i].kind == DiffOpKind::Equal) {
            ++i;
        }
        if (i >= ops.size()) {
            break;
        }

        size_t hunk_begin = i > context_lines ? i - context_lines : 0;

        // Extend while changes are separated by at most 2 * context equal lines
        size_t hunk_end = i;
        while (hunk_end < ops.size()) {
            while (hunk_end < ops.size() && ops[hunk_end].kind != DiffOpKind::Equal) {
                ++hunk_end;
            }
            size_t equal_run = 0;
            while (hunk_end + equal_run < ops.size() &&
                   ops[hunk_end + equal_run].kind == DiffOpKind::Equal) {
                ++equal_run;
            }
            if (hunk_end + equal_run >= ops.size() || equal_run > context_lines * 2) {
                hunk_end += std::min(equal_run, context_lines);
                break;
            }
            hunk_end += equal_run;
        }

        // Hunk header
        size_t a_start = 0, a_count = 0, b_start = 0, b_count = 0;
        bool a_seen = false, b_seen = false;
        for (size_t k = hunk_begin; k < hunk_end; ++k) {
            const auto& op = ops[k];
            if (op.kind != DiffOpKind::Insert) {
                if (!a_seen) { a_start = op.a_index; a_seen = true; }
                ++a_count;
            }
            if (op.kind != DiffOpKind::Delete) {
                if (!b_seen) { b_start = op.b_index; b_seen = true; }
                ++b_count;
            }
        }
        if (!a_seen) {
            a_start = ops[hunk_begin].a_index;
        }
        if (!b_seen) {
            b_start = ops[hunk_begin].b_index;
        }

        diff << "@@ -" << (a_count ? a_start + 1 : a_start) << "," << a_count
             << " +" << (b_count ? b_start + 1 : b_start) << "," << b_count << " @@\n";

        for (size_t k = hunk_begin; k < hunk_end; ++k) {
            const auto& op = ops[k];
            switch (op.kind) {
                case DiffOpKind::Equal:
                    diff << " " << orig_lines[op.a_index] << "\n";
                    break;
                case DiffOpKind::Delete:
                    diff << "-" << orig_lines[op.a_index] << "\n";
                    break;
                case DiffOpKind::Insert:
                    diff << "+" << mod_lines[op.b_index] << "\n";
                    break;
            }
        }

        i = hunk_end;
    }

    return diff.str();
}

} // namespace sigfix

#include "sigfix/SignatureSynthesizer.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace sigfix {

namespace {

std::vector<std::string> parameterEntries(const std::vector<ArgumentDescriptor>& arguments) {
    std::vector<std::string> entries;
    entries.reserve(arguments.size());
    for (const auto& arg : arguments) {
        if (!arg.name.empty()) {
            entries.push_back(fmt::format("{}: {}", arg.name, markers::UNTYPED));
        }
    }
    return entries;
}

} // namespace

SignatureSynthesizer::SignatureSynthesizer(LineBudget budget, std::string indent_unit)
    : budget_(budget)
    , indent_unit_(std::move(indent_unit)) {
}

std::string SignatureSynthesizer::singleLine(const std::vector<ArgumentDescriptor>& arguments) const {
    auto entries = parameterEntries(arguments);
    std::string returns = fmt::format("returns({})", markers::UNTYPED);
    if (entries.empty()) {
        return fmt::format("{} {{ {} }}", markers::SIG, returns);
    }
    return fmt::format("{} {{ params({}).{} }}", markers::SIG, fmt::join(entries, ", "), returns);
}

std::string SignatureSynthesizer::multiLine(const std::vector<ArgumentDescriptor>& arguments,
                                            const IndentationContext& indentation) const {
    auto entries = parameterEntries(arguments);
    const std::string& ind = indentation.prefix;
    std::string body_indent = ind + indent_unit_;

    std::string out = fmt::format("{} do\n{}", markers::SIG, body_indent);
    if (!entries.empty()) {
        std::string entry_indent = body_indent + indent_unit_;
        out += "params(\n";
        for (size_t i = 0; i < entries.size(); ++i) {
            out += entry_indent + entries[i];
            out += i + 1 < entries.size() ? ",\n" : "\n";
        }
        out += body_indent + ").";
    }
    out += fmt::format("returns({})\n{}end", markers::UNTYPED, ind);
    return out;
}

std::string SignatureSynthesizer::synthesize(const std::vector<ArgumentDescriptor>& arguments,
                                             const IndentationContext& indentation) const {
    std::string candidate = singleLine(arguments);
    if (!budget_ || indentation.column + candidate.size() <= *budget_) {
        return candidate;
    }
    return multiLine(arguments, indentation);
}

} // namespace sigfix

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Constants.h"
#include "SyntaxTree.h"

namespace sigfix {

/// Maximum line width for generated signatures; nullopt means unbounded.
using LineBudget = std::optional<size_t>;

/// Where the signature will be placed.
struct IndentationContext {
    size_t column = 0;      ///< Column of the node the signature precedes
    std::string prefix;     ///< Leading whitespace of that line (spaces or tabs)

    IndentationContext() = default;
    explicit IndentationContext(size_t col)
        : column(col), prefix(col, ' ') {}
    IndentationContext(size_t col, std::string pre)
        : column(col), prefix(std::move(pre)) {}
};

/// Builds `sig` text for a method from its parameters.
///
/// Single-line form when it fits the budget:
///   sig { params(a: T.untyped, b: T.untyped).returns(T.untyped) }
/// otherwise a block form with one parameter per line:
///   sig do
///     params(
///       a: T.untyped,
///       b: T.untyped
///     ).returns(T.untyped)
///   end
///
/// The result carries no indentation on its first line and no trailing line
/// break. Continuation lines are indented from IndentationContext::prefix.
class SignatureSynthesizer {
public:
    explicit SignatureSynthesizer(LineBudget budget = std::nullopt,
                                  std::string indent_unit = std::string(ONE_INDENT_LEVEL));

    [[nodiscard]] std::string synthesize(const std::vector<ArgumentDescriptor>& arguments,
                                         const IndentationContext& indentation) const;

    /// The single-line candidate, regardless of budget
    [[nodiscard]] std::string singleLine(const std::vector<ArgumentDescriptor>& arguments) const;

    /// The block form, regardless of budget
    [[nodiscard]] std::string multiLine(const std::vector<ArgumentDescriptor>& arguments,
                                        const IndentationContext& indentation) const;

    [[nodiscard]] const LineBudget& budget() const { return budget_; }

private:
    LineBudget budget_;
    std::string indent_unit_;
};

} // namespace sigfix

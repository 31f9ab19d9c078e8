#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "SyntaxTree.h"

namespace sigfix {

/// Named node shapes the detectors and the planner test against.
enum class Pattern {
    SignatureBlock,         ///< `sig { ... }` / `sig do ... end` without receiver
    CapabilityDeclaration,  ///< `extend T::Sig`
    SignableDefinition,     ///< `def`, `def self.x`, or an attribute accessor
    AttributeAccessor,      ///< `attr_reader|attr_writer|attr_accessor :name, ...`
    WrappingCall            ///< Receiverless call wrapping a definition (`memoize def x`)
};

[[nodiscard]] std::string_view toString(Pattern pattern);

/// Stateless shape predicates over a SyntaxTree.
///
/// match() returns the node the pattern captures:
/// - WrappingCall captures the wrapped definition (innermost `def`)
/// - every other pattern captures the node itself
/// A kNoNode argument never matches.
class PatternMatcher {
public:
    explicit PatternMatcher(const SyntaxTree& tree) : tree_(tree) {}

    [[nodiscard]] std::optional<NodeId> match(NodeId id, Pattern pattern) const;

    [[nodiscard]] bool matches(NodeId id, Pattern pattern) const {
        return match(id, pattern).has_value();
    }

    /// Method name of a signable definition: the `def` name, or the first
    /// attribute name of an accessor (`attr_reader :foo` -> "foo").
    [[nodiscard]] std::string definitionName(NodeId id) const;

private:
    [[nodiscard]] bool isReceiverlessCall(NodeId id, std::string_view name) const;

    const SyntaxTree& tree_;
};

/// Strip a symbol or string literal down to its name (`:foo`, `"foo"` -> foo)
[[nodiscard]] std::string attributeName(std::string_view literal);

} // namespace sigfix

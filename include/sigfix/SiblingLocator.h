#pragma once

#include "SyntaxTree.h"

namespace sigfix {

/// Sibling and ancestor navigation over the arena's parent/child indices.
/// Every query returns kNoNode when the requested node does not exist.
class SiblingLocator {
public:
    explicit SiblingLocator(const SyntaxTree& tree) : tree_(tree) {}

    [[nodiscard]] NodeId nextSibling(NodeId id) const;
    [[nodiscard]] NodeId previousSibling(NodeId id) const;

    /// Nearest Class or Module ancestor. `class << self` is looked through.
    [[nodiscard]] NodeId enclosingScope(NodeId id) const;

    /// Outermost receiverless call that wraps id as its only child
    /// (`private memoize def foo` yields the `private` call), or id itself.
    [[nodiscard]] NodeId outermostWrapper(NodeId id) const;

private:
    const SyntaxTree& tree_;
};

} // namespace sigfix

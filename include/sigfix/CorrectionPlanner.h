#pragma once

#include <optional>
#include <vector>

#include "PatternMatcher.h"
#include "RangeEditor.h"
#include "SiblingLocator.h"
#include "SignatureSynthesizer.h"
#include "SyntaxTree.h"

namespace sigfix {

/// Plans the edits that give a definition its signature.
///
/// Two edits at most, in this order:
/// 1. `extend T::Sig` plus a blank line as the first statement of the
///    enclosing class or module, when that scope does not have it yet;
/// 2. the synthesized `sig` directly above the node to decorate.
/// The first edit is skipped at top level and never blocks the second.
class CorrectionPlanner {
public:
    CorrectionPlanner(const SyntaxTree& tree, SignatureSynthesizer synthesizer);

    /// The outermost wrapping call (`memoize def foo`) or the definition itself
    [[nodiscard]] NodeId nodeToDecorate(NodeId definition) const;

    /// Column and line indentation of the node to decorate
    [[nodiscard]] IndentationContext indentationFor(NodeId definition) const;

    /// Parameters the signature lists. Attribute writers take one parameter
    /// named after the attribute, readers and accessors none.
    [[nodiscard]] std::vector<ArgumentDescriptor> argumentsFor(NodeId definition) const;

    /// Does the scope contain `extend T::Sig` among its direct children?
    [[nodiscard]] bool scopeHasCapability(NodeId scope) const;

    [[nodiscard]] Edit signatureEdit(NodeId definition) const;

    /// `extend T::Sig` insertion for the definition's scope, if one is needed
    /// and the scope shape allows it.
    [[nodiscard]] std::optional<Edit> capabilityEdit(NodeId definition) const;

    /// Full plan: capability edit (when requested and possible), then signature
    [[nodiscard]] std::vector<Edit> plan(NodeId definition, bool with_capability) const;

private:
    const SyntaxTree& tree_;
    SignatureSynthesizer synthesizer_;
    PatternMatcher matcher_;
    SiblingLocator locator_;
    RangeEditor editor_;
};

} // namespace sigfix

#include "sigfix/CorrectionPlanner.h"

#include <algorithm>

#include "sigfix/Constants.h"

namespace sigfix {

CorrectionPlanner::CorrectionPlanner(const SyntaxTree& tree, SignatureSynthesizer synthesizer)
    : tree_(tree)
    , synthesizer_(std::move(synthesizer))
    , matcher_(tree)
    , locator_(tree)
    , editor_(tree) {
}

NodeId CorrectionPlanner::nodeToDecorate(NodeId definition) const {
    return locator_.outermostWrapper(definition);
}

IndentationContext CorrectionPlanner::indentationFor(NodeId definition) const {
    const auto& buffer = tree_.buffer();
    size_t begin = tree_.sourceRange(nodeToDecorate(definition)).begin;
    return IndentationContext(buffer.columnOf(begin), std::string(buffer.indentationAt(begin)));
}

std::vector<ArgumentDescriptor> CorrectionPlanner::argumentsFor(NodeId definition) const {
    const auto& node = tree_.node(definition);
    if (node.kind == NodeKind::Def || node.kind == NodeKind::Defs) {
        return node.params;
    }
    if (node.name == markers::ATTR_WRITER && !node.arguments.empty()) {
        return {ArgumentDescriptor(attributeName(node.arguments.front()), ArgumentKind::Positional)};
    }
    return {};
}

bool CorrectionPlanner::scopeHasCapability(NodeId scope) const {
    if (scope == kNoNode) {
        return false;
    }
    const auto& children = tree_.children(scope);
    return std::any_of(children.begin(), children.end(), [this](NodeId child) {
        return matcher_.matches(child, Pattern::CapabilityDeclaration);
    });
}

Edit CorrectionPlanner::signatureEdit(NodeId definition) const {
    IndentationContext indentation = indentationFor(definition);
    std::string text = indentation.prefix;
    text += synthesizer_.synthesize(argumentsFor(definition), indentation);
    text += '\n';
    return editor_.insertBefore(nodeToDecorate(definition), std::move(text));
}

std::optional<Edit> CorrectionPlanner::capabilityEdit(NodeId definition) const {
    NodeId scope = locator_.enclosingScope(definition);
    if (scope == kNoNode || scopeHasCapability(scope)) {
        return std::nullopt;
    }
    const auto& body = tree_.children(scope);
    if (body.empty()) {
        return std::nullopt;
    }

    NodeId first = body.front();
    std::string text(tree_.buffer().indentationAt(tree_.sourceRange(first).begin));
    text += markers::EXTEND_T_SIG;
    text += "\n\n";
    return editor_.insertBefore(first, std::move(text), InsertOrder::Declaration);
}

std::vector<Edit> CorrectionPlanner::plan(NodeId definition, bool with_capability) const {
    std::vector<Edit> edits;
    if (with_capability) {
        if (auto edit = capabilityEdit(definition)) {
            edits.push_back(std::move(*edit));
        }
    }
    edits.push_back(signatureEdit(definition));
    return edits;
}

} // namespace sigfix

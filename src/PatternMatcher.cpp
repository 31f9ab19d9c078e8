#include "sigfix/PatternMatcher.h"

#include <regex>

#include "sigfix/Constants.h"

namespace sigfix {

std::string_view toString(Pattern pattern) {
    switch (pattern) {
        case Pattern::SignatureBlock:        return "signature-block";
        case Pattern::CapabilityDeclaration: return "capability-declaration";
        case Pattern::SignableDefinition:    return "signable-definition";
        case Pattern::AttributeAccessor:     return "attribute-accessor";
        case Pattern::WrappingCall:          return "wrapping-call";
    }
    return "unknown";
}

bool PatternMatcher::isReceiverlessCall(NodeId id, std::string_view name) const {
    const auto& node = tree_.node(id);
    return (node.kind == NodeKind::Send || node.kind == NodeKind::Block) &&
           !node.has_receiver && node.name == name;
}

std::optional<NodeId> PatternMatcher::match(NodeId id, Pattern pattern) const {
    if (id == kNoNode || id >= tree_.size()) {
        return std::nullopt;
    }
    const auto& node = tree_.node(id);

    switch (pattern) {
        case Pattern::SignatureBlock:
            if (node.kind == NodeKind::Block && isReceiverlessCall(id, markers::SIG)) {
                return id;
            }
            return std::nullopt;

        case Pattern::CapabilityDeclaration: {
            // `extend T::Sig` or `extend ::T::Sig`, possibly among other modules
            static const std::regex t_sig_re(R"(^\s*(::)?T\s*::\s*Sig\s*$)");
            if (node.kind != NodeKind::Send || !isReceiverlessCall(id, "extend")) {
                return std::nullopt;
            }
            for (const auto& arg : node.arguments) {
                if (std::regex_match(arg, t_sig_re)) {
                    return id;
                }
            }
            return std::nullopt;
        }

        case Pattern::AttributeAccessor:
            if (node.kind == NodeKind::Send && !node.arguments.empty() &&
                (isReceiverlessCall(id, markers::ATTR_READER) ||
                 isReceiverlessCall(id, markers::ATTR_WRITER) ||
                 isReceiverlessCall(id, markers::ATTR_ACCESSOR))) {
                return id;
            }
            return std::nullopt;

        case Pattern::SignableDefinition:
            if (node.kind == NodeKind::Def || node.kind == NodeKind::Defs) {
                return id;
            }
            return match(id, Pattern::AttributeAccessor);

        case Pattern::WrappingCall: {
            if (node.kind != NodeKind::Send || node.has_receiver || node.children.size() != 1) {
                return std::nullopt;
            }
            NodeId child = node.children.front();
            NodeKind child_kind = tree_.kind(child);
            if (child_kind == NodeKind::Def || child_kind == NodeKind::Defs) {
                return child;
            }
            return match(child, Pattern::WrappingCall);
        }
    }
    return std::nullopt;
}

std::string PatternMatcher::definitionName(NodeId id) const {
    const auto& node = tree_.node(id);
    if (node.kind == NodeKind::Send && !node.arguments.empty()) {
        return attributeName(node.arguments.front());
    }
    return node.name;
}

std::string attributeName(std::string_view literal) {
    if (!literal.empty() && literal.front() == ':') {
        literal.remove_prefix(1);
    }
    if (literal.size() >= 2 && (literal.front() == '"' || literal.front() == '\'') &&
        literal.back() == literal.front()) {
        literal = literal.substr(1, literal.size() - 2);
    }
    return std::string(literal);
}

} // namespace sigfix

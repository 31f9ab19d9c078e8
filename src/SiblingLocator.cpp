#include "sigfix/SiblingLocator.h"

namespace sigfix {

NodeId SiblingLocator::nextSibling(NodeId id) const {
    if (id == kNoNode) {
        return kNoNode;
    }
    const auto& node = tree_.node(id);
    if (node.parent == kNoNode) {
        return kNoNode;
    }
    const auto& siblings = tree_.children(node.parent);
    size_t next = static_cast<size_t>(node.sibling_index) + 1;
    return next < siblings.size() ? siblings[next] : kNoNode;
}

NodeId SiblingLocator::previousSibling(NodeId id) const {
    if (id == kNoNode) {
        return kNoNode;
    }
    const auto& node = tree_.node(id);
    if (node.parent == kNoNode || node.sibling_index == 0) {
        return kNoNode;
    }
    return tree_.children(node.parent)[node.sibling_index - 1];
}

NodeId SiblingLocator::enclosingScope(NodeId id) const {
    if (id == kNoNode) {
        return kNoNode;
    }
    for (NodeId current = tree_.parent(id); current != kNoNode; current = tree_.parent(current)) {
        NodeKind kind = tree_.kind(current);
        if (kind == NodeKind::Class || kind == NodeKind::Module) {
            return current;
        }
    }
    return kNoNode;
}

NodeId SiblingLocator::outermostWrapper(NodeId id) const {
    if (id == kNoNode) {
        return kNoNode;
    }
    NodeId current = id;
    while (true) {
        NodeId parent = tree_.parent(current);
        if (parent == kNoNode) {
            return current;
        }
        const auto& wrapper = tree_.node(parent);
        if (wrapper.kind != NodeKind::Send || wrapper.has_receiver || wrapper.children.size() != 1) {
            return current;
        }
        current = parent;
    }
}

} // namespace sigfix

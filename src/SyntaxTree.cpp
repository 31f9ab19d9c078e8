#include "sigfix/SyntaxTree.h"

#include <cassert>

namespace sigfix {

std::string_view toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Program: return "program";
        case NodeKind::Class:   return "class";
        case NodeKind::SClass:  return "sclass";
        case NodeKind::Module:  return "module";
        case NodeKind::Def:     return "def";
        case NodeKind::Defs:    return "defs";
        case NodeKind::Send:    return "send";
        case NodeKind::Block:   return "block";
        case NodeKind::Expr:    return "expr";
    }
    return "unknown";
}

SyntaxTree::SyntaxTree(TextBuffer buffer)
    : buffer_(std::move(buffer)) {
    SyntaxNode root;
    root.kind = NodeKind::Program;
    root.range = SourceRange(0, buffer_.size());
    nodes_.push_back(std::move(root));
}

NodeId SyntaxTree::addNode(NodeKind kind, NodeId parent, SourceRange range, std::string name) {
    assert(parent != kNoNode && parent < nodes_.size());
    assert(range.begin <= range.end && range.end <= buffer_.size());

    auto id = static_cast<NodeId>(nodes_.size());
    SyntaxNode node;
    node.kind = kind;
    node.parent = parent;
    node.range = range;
    node.name = std::move(name);
    node.sibling_index = static_cast<uint32_t>(nodes_[parent].children.size());
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(id);
    return id;
}

} // namespace sigfix

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "TextBuffer.h"

namespace sigfix {

using NodeId = uint32_t;

/// Sentinel for "no node" (missing parent, no sibling, ...)
inline constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

/// Closed set of node kinds produced by the tree builder.
enum class NodeKind {
    Program,    ///< Root: children are top-level statements
    Class,      ///< `class Name ... end`: children are body statements
    SClass,     ///< `class << self ... end`
    Module,     ///< `module Name ... end`
    Def,        ///< `def name ... end`
    Defs,       ///< `def self.name ... end` (singleton definition)
    Send,       ///< Call statement; may wrap a definition as its only child
    Block,      ///< Call with a block: `name { ... }` / `name do ... end`
    Expr        ///< Any other statement (opaque)
};

[[nodiscard]] std::string_view toString(NodeKind kind);

/// Parameter kinds, as far as signature synthesis cares.
enum class ArgumentKind {
    Positional,
    Keyword,
    Rest,
    Block,
    Destructured
};

/// One named method parameter. Destructured groups are flattened to leaves.
struct ArgumentDescriptor {
    std::string name;
    ArgumentKind kind = ArgumentKind::Positional;

    ArgumentDescriptor() = default;
    ArgumentDescriptor(std::string n, ArgumentKind k)
        : name(std::move(n)), kind(k) {}

    bool operator==(const ArgumentDescriptor& other) const = default;
};

/// A node in the arena. Navigation is by index, never by owning pointers.
struct SyntaxNode {
    NodeKind kind = NodeKind::Expr;
    NodeId parent = kNoNode;
    uint32_t sibling_index = 0;         ///< Position in parent's children
    std::vector<NodeId> children;
    SourceRange range;

    std::string name;                   ///< Def/Send/Block method name, Class/Module path
    bool has_receiver = false;          ///< Send/Block: explicit receiver present
    std::vector<std::string> arguments; ///< Send/Block: raw call argument texts
    std::vector<ArgumentDescriptor> params; ///< Def/Defs: flattened parameters
};

/// Immutable-after-build syntax tree over an owned TextBuffer.
class SyntaxTree {
public:
    explicit SyntaxTree(TextBuffer buffer);

    // Non-copyable, movable
    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;
    SyntaxTree(SyntaxTree&&) noexcept = default;
    SyntaxTree& operator=(SyntaxTree&&) noexcept = default;

    [[nodiscard]] const TextBuffer& buffer() const { return buffer_; }
    [[nodiscard]] NodeId root() const { return 0; }
    [[nodiscard]] size_t size() const { return nodes_.size(); }

    [[nodiscard]] const SyntaxNode& node(NodeId id) const { return nodes_.at(id); }
    [[nodiscard]] NodeKind kind(NodeId id) const { return node(id).kind; }
    [[nodiscard]] NodeId parent(NodeId id) const { return node(id).parent; }
    [[nodiscard]] const std::vector<NodeId>& children(NodeId id) const { return node(id).children; }

    /// Byte range of a node in the buffer
    [[nodiscard]] SourceRange sourceRange(NodeId id) const { return node(id).range; }

    /// Source text of a node
    [[nodiscard]] std::string_view source(NodeId id) const { return buffer_.slice(sourceRange(id)); }

    /// Ranges of all comments, in document order
    [[nodiscard]] const std::vector<SourceRange>& comments() const { return comments_; }

    /// Visit all nodes in document order (pre-order)
    template<typename Fn>
    void forEachPreorder(Fn&& fn) const {
        forEachPreorderFrom(root(), fn);
    }

    // ────────────────────────────────────────────────────────────────────────
    // Building (used by tree builders and tests)
    // ────────────────────────────────────────────────────────────────────────

    /// Add a node and attach it as last child of an existing parent
    NodeId addNode(NodeKind kind, NodeId parent, SourceRange range, std::string name = "");

    [[nodiscard]] SyntaxNode& mutableNode(NodeId id) { return nodes_.at(id); }

    void addComment(SourceRange range) { comments_.push_back(range); }

private:
    template<typename Fn>
    void forEachPreorderFrom(NodeId id, Fn& fn) const {
        fn(id);
        for (NodeId child : node(id).children) {
            forEachPreorderFrom(child, fn);
        }
    }

    TextBuffer buffer_;
    std::vector<SyntaxNode> nodes_;
    std::vector<SourceRange> comments_;
};

} // namespace sigfix

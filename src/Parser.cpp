#include "sigfix/Parser.h"

#include <cstring>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <tree_sitter/api.h>

extern "C" {
const TSLanguage* tree_sitter_ruby(void);
}

namespace sigfix {

namespace {

// ============================================================================
// tree-sitter helpers
// ============================================================================

bool isType(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

SourceRange rangeOf(TSNode node) {
    return SourceRange(ts_node_start_byte(node), ts_node_end_byte(node));
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

/// Comments and heredoc bodies may appear between any two nodes
bool isExtra(TSNode node) {
    return isType(node, "comment") || isType(node, "heredoc_body");
}

std::vector<TSNode> namedChildren(TSNode node) {
    std::vector<TSNode> children;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!isExtra(child)) {
            children.push_back(child);
        }
    }
    return children;
}

bool isDefinition(TSNode node) {
    return isType(node, "method") || isType(node, "singleton_method");
}

bool isScope(TSNode node) {
    return isType(node, "class") || isType(node, "module") || isType(node, "singleton_class");
}

/// Arena kind of a tree-sitter node that owns a body closed by a token
std::optional<NodeKind> bodyKindOf(TSNode node) {
    if (isType(node, "class")) {
        return NodeKind::Class;
    }
    if (isType(node, "module")) {
        return NodeKind::Module;
    }
    if (isType(node, "singleton_class")) {
        return NodeKind::SClass;
    }
    if (isType(node, "method")) {
        return NodeKind::Def;
    }
    if (isType(node, "singleton_method")) {
        return NodeKind::Defs;
    }
    if (isType(node, "block") || isType(node, "do_block")) {
        return NodeKind::Block;
    }
    return std::nullopt;
}

/// `def ...`, or a receiverless call chain ending in one (`private memoize def foo`)
bool wrapsDefinition(TSNode node) {
    if (isDefinition(node)) {
        return true;
    }
    if (!isType(node, "call") || !ts_node_is_null(field(node, "receiver")) ||
        !ts_node_is_null(field(node, "block"))) {
        return false;
    }
    TSNode arguments = field(node, "arguments");
    if (ts_node_is_null(arguments)) {
        return false;
    }
    auto args = namedChildren(arguments);
    return args.size() == 1 && wrapsDefinition(args.front());
}

// ============================================================================
// TreeBuilder - maps the tree-sitter tree onto the arena
// ============================================================================

class TreeBuilder {
public:
    TreeBuilder(SyntaxTree& tree, DiagnosticCollector* diagnostics)
        : tree_(tree)
        , diagnostics_(diagnostics) {}

    void build(TSNode program) {
        addStatements(program, tree_.root());
        walkNodes(program);
    }

private:
    std::string text(TSNode node) const {
        if (ts_node_is_null(node)) {
            return "";
        }
        return std::string(tree_.buffer().slice(rangeOf(node)));
    }

    void warn(const std::string& msg, size_t offset) {
        if (diagnostics_) {
            const auto& buffer = tree_.buffer();
            diagnostics_->addWarning(msg, buffer.name(), buffer.lineOf(offset), "parse",
                                     buffer.columnOf(offset) + 1);
        }
    }

    // ────────────────────────────────────────────────────────────────────────
    // Statements
    // ────────────────────────────────────────────────────────────────────────

    void addStatements(TSNode body, NodeId parent) {
        for (TSNode statement : namedChildren(body)) {
            addStatement(statement, parent);
        }
    }

    /// Statements of a scope, definition or block body
    void addBody(TSNode owner, NodeId parent) {
        TSNode body = field(owner, "body");
        if (ts_node_is_null(body)) {
            return;
        }
        if (isType(body, "body_statement") || isType(body, "block_body")) {
            addStatements(body, parent);
        } else {
            // Endless definition: `def foo(x) = expr`
            collectDefinitions(body, parent);
        }
    }

    void addStatement(TSNode node, NodeId parent) {
        if (isScope(node)) {
            addScope(node, parent);
            return;
        }
        if (isDefinition(node)) {
            addDefinition(node, parent);
            return;
        }
        if (isType(node, "call")) {
            addCall(node, parent);
            return;
        }
        if (isType(node, "identifier")) {
            // Bare receiverless call such as `private`
            tree_.addNode(NodeKind::Send, parent, rangeOf(node), text(node));
            return;
        }

        NodeId expr = tree_.addNode(NodeKind::Expr, parent, rangeOf(node));
        collectDefinitions(node, expr);
    }

    void addScope(TSNode node, NodeId parent) {
        NodeId scope;
        if (isType(node, "singleton_class")) {
            scope = tree_.addNode(NodeKind::SClass, parent, rangeOf(node),
                                  "<< " + text(field(node, "value")));
        } else {
            NodeKind kind = isType(node, "class") ? NodeKind::Class : NodeKind::Module;
            scope = tree_.addNode(kind, parent, rangeOf(node), text(field(node, "name")));
        }
        addBody(node, scope);
    }

    void addDefinition(TSNode node, NodeId parent) {
        NodeKind kind = isType(node, "method") ? NodeKind::Def : NodeKind::Defs;
        NodeId def = tree_.addNode(kind, parent, rangeOf(node), text(field(node, "name")));

        std::vector<ArgumentDescriptor> params;
        TSNode parameters = field(node, "parameters");
        if (!ts_node_is_null(parameters)) {
            appendParameters(parameters, false, params);
        }
        tree_.mutableNode(def).params = std::move(params);

        addBody(node, def);
    }

    void addCall(TSNode node, NodeId parent) {
        TSNode block = field(node, "block");
        TSNode arguments = field(node, "arguments");

        NodeKind kind = ts_node_is_null(block) ? NodeKind::Send : NodeKind::Block;
        NodeId call = tree_.addNode(kind, parent, rangeOf(node), text(field(node, "method")));

        std::vector<TSNode> args;
        if (!ts_node_is_null(arguments)) {
            args = namedChildren(arguments);
        }
        {
            auto& payload = tree_.mutableNode(call);
            payload.has_receiver = !ts_node_is_null(field(node, "receiver"));
            for (TSNode arg : args) {
                payload.arguments.push_back(text(arg));
            }
        }

        if (!ts_node_is_null(block)) {
            addBody(block, call);
        } else if (args.size() == 1 && wrapsDefinition(args.front())) {
            addStatement(args.front(), call);
        } else if (!ts_node_is_null(arguments)) {
            collectDefinitions(arguments, call);
        }
    }

    /// Definitions and scopes nested in an opaque expression become children of owner
    void collectDefinitions(TSNode node, NodeId owner) {
        for (TSNode child : namedChildren(node)) {
            if (isDefinition(child)) {
                addDefinition(child, owner);
            } else if (isScope(child)) {
                addScope(child, owner);
            } else {
                collectDefinitions(child, owner);
            }
        }
    }

    // ────────────────────────────────────────────────────────────────────────
    // Parameters
    // ────────────────────────────────────────────────────────────────────────

    void appendParameters(TSNode parameters, bool destructured,
                          std::vector<ArgumentDescriptor>& out) const {
        for (TSNode param : namedChildren(parameters)) {
            if (isType(param, "destructured_parameter")) {
                appendParameters(param, true, out);
                continue;
            }

            TSNode name = field(param, "name");
            ArgumentKind kind = ArgumentKind::Positional;
            if (isType(param, "identifier")) {
                name = param;
            } else if (isType(param, "keyword_parameter")) {
                kind = ArgumentKind::Keyword;
            } else if (isType(param, "splat_parameter") || isType(param, "hash_splat_parameter")) {
                kind = ArgumentKind::Rest;
            } else if (isType(param, "block_parameter")) {
                kind = ArgumentKind::Block;
            } else if (!isType(param, "optional_parameter")) {
                continue;  // `...`, `**nil`
            }

            if (ts_node_is_null(name)) {
                continue;  // anonymous *, **, &
            }
            out.emplace_back(text(name), destructured ? ArgumentKind::Destructured : kind);
        }
    }

    // ────────────────────────────────────────────────────────────────────────
    // Comments and syntax errors
    // ────────────────────────────────────────────────────────────────────────

    /// Pre-order walk over every node: records comments, reports recovered errors
    void walkNodes(TSNode program) {
        TSTreeCursor cursor = ts_tree_cursor_new(program);
        bool done = false;
        while (!done) {
            TSNode node = ts_tree_cursor_current_node(&cursor);
            if (visitNode(node) && ts_tree_cursor_goto_first_child(&cursor)) {
                continue;
            }
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                continue;
            }
            while (true) {
                if (!ts_tree_cursor_goto_parent(&cursor)) {
                    done = true;
                    break;
                }
                if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                    break;
                }
            }
        }
        ts_tree_cursor_delete(&cursor);
    }

    /// Returns whether to descend into node
    bool visitNode(TSNode node) {
        if (isType(node, "comment")) {
            tree_.addComment(rangeOf(node));
            return false;
        }
        if (ts_node_is_missing(node)) {
            std::string msg = "missing '" + std::string(ts_node_type(node)) + "'";
            if (auto kind = bodyKindOf(ts_node_parent(node))) {
                msg += " to close " + std::string(toString(*kind));
            }
            warn(msg, ts_node_start_byte(node));
            return false;
        }
        if (isType(node, "ERROR")) {
            std::string snippet = text(node);
            snippet = snippet.substr(0, snippet.find('\n'));
            warn(snippet.empty() ? "syntax error" : "syntax error near '" + snippet + "'",
                 ts_node_start_byte(node));
        }
        return ts_node_child_count(node) > 0;
    }

    SyntaxTree& tree_;
    DiagnosticCollector* diagnostics_;
};

} // namespace

// ============================================================================
// OutlineParser
// ============================================================================

OutlineParser::OutlineParser(DiagnosticCollector* diagnostics)
    : diagnostics_(diagnostics) {
}

std::unique_ptr<SyntaxTree> OutlineParser::parse(std::string text, std::string name) const {
    return parse(TextBuffer(std::move(text), std::move(name)));
}

std::unique_ptr<SyntaxTree> OutlineParser::parse(TextBuffer buffer) const {
    auto tree = std::make_unique<SyntaxTree>(std::move(buffer));

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), ts_parser_delete);
    if (!ts_parser_set_language(parser.get(), tree_sitter_ruby())) {
        if (diagnostics_) {
            diagnostics_->addError("tree-sitter-ruby grammar does not match the tree-sitter runtime",
                                   tree->buffer().name(), 0, "parse");
        }
        return tree;
    }

    std::string_view source = tree->buffer().text();
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> syntax(
        ts_parser_parse_string(parser.get(), nullptr, source.data(),
                               static_cast<uint32_t>(source.size())),
        ts_tree_delete);
    if (!syntax) {
        if (diagnostics_) {
            diagnostics_->addError("tree-sitter failed to parse", tree->buffer().name(), 0, "parse");
        }
        return tree;
    }

    TreeBuilder builder(*tree, diagnostics_);
    builder.build(ts_tree_root_node(syntax.get()));

    return tree;
}

// ============================================================================
// File modes
// ============================================================================

FileModes detectFileModes(const SyntaxTree& tree) {
    static const std::regex typed_true_re(R"(#\s*typed:\s*true)");
    static const std::regex typed_strict_re(R"(#\s*typed:\s*strict)");

    FileModes modes;
    for (const auto& range : tree.comments()) {
        std::string text(tree.buffer().slice(range));
        if (std::regex_match(text, typed_true_re)) {
            modes.signatures_enabled = true;
        }
        if (std::regex_match(text, typed_strict_re)) {
            modes.strict = true;
        }
    }
    return modes;
}

} // namespace sigfix

#include <catch2/catch_test_macros.hpp>

#include "sigfix/Parser.h"

using namespace sigfix;

// Helper to find the first node of a kind (and name, if given) in document order
static NodeId findNode(const SyntaxTree& tree, NodeKind kind, const std::string& name = "") {
    NodeId found = kNoNode;
    tree.forEachPreorder([&](NodeId id) {
        if (found == kNoNode && tree.kind(id) == kind &&
            (name.empty() || tree.node(id).name == name)) {
            found = id;
        }
    });
    return found;
}

static std::vector<NodeKind> childKinds(const SyntaxTree& tree, NodeId id) {
    std::vector<NodeKind> kinds;
    for (NodeId child : tree.children(id)) {
        kinds.push_back(tree.kind(child));
    }
    return kinds;
}

TEST_CASE("OutlineParser - class with method", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse(
        "class Foo < Base\n"
        "  def bar(a, b: 1, *rest, **opts, &blk)\n"
        "    a + b\n"
        "  end\n"
        "end\n");

    REQUIRE(tree->children(tree->root()).size() == 1);
    NodeId cls = tree->children(tree->root()).front();
    CHECK(tree->kind(cls) == NodeKind::Class);
    CHECK(tree->node(cls).name == "Foo");

    REQUIRE(tree->children(cls).size() == 1);
    NodeId def = tree->children(cls).front();
    CHECK(tree->kind(def) == NodeKind::Def);
    CHECK(tree->node(def).name == "bar");
    CHECK(tree->parent(def) == cls);
    CHECK(tree->source(def).starts_with("def bar"));
    CHECK(tree->source(def).ends_with("end"));

    std::vector<ArgumentDescriptor> expected = {
        {"a", ArgumentKind::Positional},
        {"b", ArgumentKind::Keyword},
        {"rest", ArgumentKind::Rest},
        {"opts", ArgumentKind::Rest},
        {"blk", ArgumentKind::Block},
    };
    CHECK(tree->node(def).params == expected);
}

TEST_CASE("OutlineParser - parameter shapes", "[parser]") {
    OutlineParser parser;

    SECTION("destructured parameters are flattened") {
        auto tree = parser.parse("def build_query((name, period, query_params))\nend\n");
        NodeId def = findNode(*tree, NodeKind::Def);
        REQUIRE(def != kNoNode);
        std::vector<ArgumentDescriptor> expected = {
            {"name", ArgumentKind::Destructured},
            {"period", ArgumentKind::Destructured},
            {"query_params", ArgumentKind::Destructured},
        };
        CHECK(tree->node(def).params == expected);
    }

    SECTION("defaults with nested brackets") {
        auto tree = parser.parse("def foo(a = [1, 2], b: { x: 1 }, c: nil)\nend\n");
        NodeId def = findNode(*tree, NodeKind::Def);
        const auto& params = tree->node(def).params;
        REQUIRE(params.size() == 3);
        CHECK(params[0] == ArgumentDescriptor("a", ArgumentKind::Positional));
        CHECK(params[1] == ArgumentDescriptor("b", ArgumentKind::Keyword));
        CHECK(params[2] == ArgumentDescriptor("c", ArgumentKind::Keyword));
    }

    SECTION("parameters without parentheses") {
        auto tree = parser.parse("def foo a, b\n  a\nend\n");
        NodeId def = findNode(*tree, NodeKind::Def);
        CHECK(tree->node(def).params.size() == 2);
    }

    SECTION("anonymous splats and forwarding are skipped") {
        auto tree = parser.parse("def foo(*, **, &)\nend\ndef bar(...)\nend\n");
        CHECK(tree->node(findNode(*tree, NodeKind::Def, "foo")).params.empty());
        CHECK(tree->node(findNode(*tree, NodeKind::Def, "bar")).params.empty());
    }

    SECTION("parameters spanning lines") {
        auto tree = parser.parse("def foo(\n  a,\n  b:\n)\nend\n");
        NodeId def = findNode(*tree, NodeKind::Def);
        CHECK(tree->node(def).params.size() == 2);
    }
}

TEST_CASE("OutlineParser - method names", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse(
        "def fancy?; end\n"
        "def save!; end\n"
        "def name=(value); end\n"
        "def ==(other); end\n"
        "def [](key); end\n"
        "def self.build; end\n");

    auto defs = tree->children(tree->root());
    REQUIRE(defs.size() == 6);
    CHECK(tree->node(defs[0]).name == "fancy?");
    CHECK(tree->node(defs[1]).name == "save!");
    CHECK(tree->node(defs[2]).name == "name=");
    CHECK(tree->node(defs[3]).name == "==");
    CHECK(tree->node(defs[4]).name == "[]");
    CHECK(tree->node(defs[5]).name == "build");
    CHECK(tree->kind(defs[5]) == NodeKind::Defs);
}

TEST_CASE("OutlineParser - endless definition", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse("def square(x) = x * x\ndef other; end\n");
    auto top = tree->children(tree->root());
    REQUIRE(top.size() == 2);
    CHECK(tree->source(top[0]) == "def square(x) = x * x");
    CHECK(tree->node(top[0]).params.size() == 1);
    CHECK(tree->node(top[1]).name == "other");
}

TEST_CASE("OutlineParser - calls", "[parser]") {
    OutlineParser parser;

    SECTION("wrapping call") {
        auto tree = parser.parse("class A\n  memoize def foo(x)\n    x\n  end\nend\n");
        NodeId cls = findNode(*tree, NodeKind::Class);
        REQUIRE(tree->children(cls).size() == 1);
        NodeId send = tree->children(cls).front();
        CHECK(tree->kind(send) == NodeKind::Send);
        CHECK(tree->node(send).name == "memoize");
        REQUIRE(tree->children(send).size() == 1);
        CHECK(tree->kind(tree->children(send).front()) == NodeKind::Def);
        CHECK(tree->source(send).starts_with("memoize def foo"));
        CHECK(tree->source(send).ends_with("end"));
    }

    SECTION("nested wrapping calls") {
        auto tree = parser.parse("private memoize def foo; end\n");
        NodeId outer = tree->children(tree->root()).front();
        CHECK(tree->node(outer).name == "private");
        NodeId inner = tree->children(outer).front();
        CHECK(tree->node(inner).name == "memoize");
        CHECK(tree->kind(tree->children(inner).front()) == NodeKind::Def);
    }

    SECTION("plain arguments") {
        auto tree = parser.parse("attr_reader :foo, :bar\nextend T::Sig\ndelegate :x, to: :y\n");
        auto top = tree->children(tree->root());
        REQUIRE(top.size() == 3);
        CHECK(tree->node(top[0]).arguments == std::vector<std::string>{":foo", ":bar"});
        CHECK(tree->node(top[1]).arguments == std::vector<std::string>{"T::Sig"});
        CHECK(tree->node(top[2]).arguments == std::vector<std::string>{":x", "to: :y"});
    }

    SECTION("parenthesized arguments") {
        auto tree = parser.parse("include(Comparable)\n");
        NodeId send = tree->children(tree->root()).front();
        CHECK(tree->kind(send) == NodeKind::Send);
        CHECK(tree->node(send).arguments == std::vector<std::string>{"Comparable"});
    }

    SECTION("signature blocks") {
        auto tree = parser.parse(
            "sig { params(a: Integer).returns(String) }\n"
            "def foo(a); end\n"
            "sig do\n"
            "  returns(String)\n"
            "end\n"
            "def bar; end\n");
        auto top = tree->children(tree->root());
        REQUIRE(top.size() == 4);
        CHECK(tree->kind(top[0]) == NodeKind::Block);
        CHECK(tree->node(top[0]).name == "sig");
        CHECK(tree->source(top[0]) == "sig { params(a: Integer).returns(String) }");
        CHECK(tree->kind(top[1]) == NodeKind::Def);
        CHECK(tree->kind(top[2]) == NodeKind::Block);
        CHECK(tree->source(top[2]).ends_with("end"));
        CHECK(tree->kind(top[3]) == NodeKind::Def);
    }

    SECTION("block bodies hold definitions") {
        auto tree = parser.parse("included do |base|\n  def helper; end\nend\n");
        NodeId block = tree->children(tree->root()).front();
        CHECK(tree->kind(block) == NodeKind::Block);
        CHECK(childKinds(*tree, block) == std::vector<NodeKind>{NodeKind::Def});
    }

    SECTION("calls with a receiver") {
        auto tree = parser.parse("foo(1).bar\nbaz.qux do\nend\nsig\n");
        auto top = tree->children(tree->root());
        REQUIRE(top.size() == 3);
        CHECK(tree->kind(top[0]) == NodeKind::Send);
        CHECK(tree->node(top[0]).name == "bar");
        CHECK(tree->node(top[0]).has_receiver);
        CHECK(tree->kind(top[1]) == NodeKind::Block);
        CHECK(tree->node(top[1]).name == "qux");
        CHECK(tree->node(top[1]).has_receiver);
        CHECK(tree->kind(top[2]) == NodeKind::Send);
        CHECK(tree->node(top[2]).name == "sig");
        CHECK_FALSE(tree->node(top[2]).has_receiver);
    }

    SECTION("definitions inside arguments") {
        auto tree = parser.parse("helper(1, def foo; end)\n");
        NodeId send = tree->children(tree->root()).front();
        CHECK(tree->kind(send) == NodeKind::Send);
        CHECK(childKinds(*tree, send) == std::vector<NodeKind>{NodeKind::Def});
    }
}

TEST_CASE("OutlineParser - scopes", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse(
        "module Outer\n"
        "  class Inner\n"
        "    class << self\n"
        "      def build; end\n"
        "    end\n"
        "  end\n"
        "end\n");

    NodeId mod = findNode(*tree, NodeKind::Module);
    NodeId cls = findNode(*tree, NodeKind::Class);
    NodeId sclass = findNode(*tree, NodeKind::SClass);
    REQUIRE(mod != kNoNode);
    REQUIRE(cls != kNoNode);
    REQUIRE(sclass != kNoNode);

    CHECK(tree->node(mod).name == "Outer");
    CHECK(tree->node(cls).name == "Inner");
    CHECK(tree->parent(cls) == mod);
    CHECK(tree->parent(sclass) == cls);
    CHECK(childKinds(*tree, sclass) == std::vector<NodeKind>{NodeKind::Def});
}

TEST_CASE("OutlineParser - nesting keywords inside bodies", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse(
        "def foo\n"
        "  if x\n"
        "    y\n"
        "  end\n"
        "  [1].each do |i|\n"
        "    puts i\n"
        "  end\n"
        "  z = if a then b else c end\n"
        "  return 1 if cond\n"
        "  while running do step end\n"
        "  case v\n"
        "  when 1 then :one\n"
        "  end\n"
        "  begin\n"
        "    risky\n"
        "  rescue StandardError\n"
        "    nil\n"
        "  end\n"
        "end\n"
        "def bar; end\n");

    auto top = tree->children(tree->root());
    REQUIRE(top.size() == 2);
    CHECK(tree->node(top[0]).name == "foo");
    CHECK(tree->node(top[1]).name == "bar");
}

TEST_CASE("OutlineParser - literals hide keywords", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse(
        "def foo\n"
        "  a = \"def end #{\"end\"}\"\n"
        "  b = 'end'\n"
        "  c = %w[def end]\n"
        "  d = :end\n"
        "  e = /end/\n"
        "  f = <<~TXT\n"
        "    end\n"
        "  TXT\n"
        "  g = x / 2 # end\n"
        "end\n"
        "=begin\n"
        "def ignored\n"
        "=end\n"
        "def bar; end\n");

    auto top = tree->children(tree->root());
    REQUIRE(top.size() == 2);
    CHECK(tree->node(top[0]).name == "foo");
    CHECK(tree->node(top[1]).name == "bar");
}

TEST_CASE("OutlineParser - comments", "[parser]") {
    OutlineParser parser;
    auto tree = parser.parse("# typed: true\nx = 1 # trailing\n");
    REQUIRE(tree->comments().size() == 2);
    CHECK(tree->buffer().slice(tree->comments()[0]) == "# typed: true");
    CHECK(tree->buffer().slice(tree->comments()[1]) == "# trailing");
}

TEST_CASE("OutlineParser - modifier keywords", "[parser]") {
    DiagnosticCollector diagnostics;
    OutlineParser parser(&diagnostics);

    SECTION("guard clause") {
        auto tree = parser.parse("def foo\n  return unless x\nend\n");
        CHECK(diagnostics.warningCount() == 0);
        auto top = tree->children(tree->root());
        REQUIRE(top.size() == 1);
        CHECK(tree->node(top[0]).name == "foo");
    }

    SECTION("if and while modifiers") {
        auto tree = parser.parse(
            "def foo\n"
            "  x = y if z\n"
            "  puts(a) while b\n"
            "  retry_later until done\n"
            "end\n");
        CHECK(diagnostics.warningCount() == 0);
        auto top = tree->children(tree->root());
        REQUIRE(top.size() == 1);
        CHECK(tree->kind(top[0]) == NodeKind::Def);
        CHECK(tree->node(top[0]).name == "foo");
        CHECK(tree->children(top[0]).size() == 3);
    }

    SECTION("scopes after a modifier stay at top level") {
        auto tree = parser.parse(
            "class A\n"
            "  def a\n"
            "    return unless x\n"
            "  end\n"
            "end\n"
            "module B\n"
            "end\n");
        CHECK(diagnostics.warningCount() == 0);
        CHECK(childKinds(*tree, tree->root()) ==
              std::vector<NodeKind>{NodeKind::Class, NodeKind::Module});
    }
}

TEST_CASE("OutlineParser - unbalanced input", "[parser]") {
    DiagnosticCollector diagnostics;
    OutlineParser parser(&diagnostics);

    SECTION("missing end") {
        auto tree = parser.parse("class Foo\n  def bar\n", "broken.rb");
        CHECK(diagnostics.warningCount() > 0);
        CHECK(diagnostics.countCategory("parse") == diagnostics.warningCount());
        CHECK(diagnostics.diagnostics().front().file_path == "broken.rb");
        CHECK_FALSE(diagnostics.hasErrors());
    }

    SECTION("stray end") {
        auto tree = parser.parse("end\ndef foo; end\n");
        CHECK(diagnostics.warningCount() > 0);
        CHECK(diagnostics.countCategory("parse") == diagnostics.warningCount());
    }
}

TEST_CASE("NodeKind names", "[parser]") {
    CHECK(toString(NodeKind::Def) == "def");
    CHECK(toString(NodeKind::SClass) == "sclass");
}

TEST_CASE("detectFileModes", "[parser]") {
    OutlineParser parser;

    SECTION("typed true") {
        auto modes = detectFileModes(*parser.parse("# typed: true\nclass A; end\n"));
        CHECK(modes.signatures_enabled);
        CHECK_FALSE(modes.strict);
    }

    SECTION("typed strict anywhere in the file") {
        auto modes = detectFileModes(*parser.parse("class A; end\n#typed:strict\n"));
        CHECK(modes.strict);
        CHECK_FALSE(modes.signatures_enabled);
    }

    SECTION("marker must be the whole comment") {
        auto modes = detectFileModes(*parser.parse("# typed: true-ish\n# not typed: strict\n"));
        CHECK_FALSE(modes.signatures_enabled);
        CHECK_FALSE(modes.strict);
    }

    SECTION("marker inside a string is not a comment") {
        auto modes = detectFileModes(*parser.parse("x = \"# typed: true\"\n"));
        CHECK_FALSE(modes.signatures_enabled);
    }
}

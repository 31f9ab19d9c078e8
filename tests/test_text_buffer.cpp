#include <catch2/catch_test_macros.hpp>

#include "sigfix/TextBuffer.h"

using namespace sigfix;

TEST_CASE("TextBuffer - line and column lookup", "[buffer]") {
    TextBuffer buffer("class A\n  def foo\n  end\nend\n", "a.rb");

    CHECK(buffer.name() == "a.rb");
    CHECK(buffer.lineCount() == 5);  // trailing newline opens an empty last line

    SECTION("first line") {
        CHECK(buffer.lineOf(0) == 1);
        CHECK(buffer.columnOf(0) == 0);
    }

    SECTION("offset inside second line") {
        size_t def_offset = buffer.text().find("def");
        CHECK(buffer.lineOf(def_offset) == 2);
        CHECK(buffer.columnOf(def_offset) == 2);
        CHECK(buffer.lineStart(def_offset) == 8);
    }

    SECTION("newline belongs to the line it ends") {
        CHECK(buffer.lineOf(7) == 1);
        CHECK(buffer.lineOf(8) == 2);
    }

    SECTION("end of buffer maps to last line") {
        CHECK(buffer.lineOf(buffer.size()) == buffer.lineCount());
    }

    SECTION("start of line by number") {
        CHECK(buffer.startOfLine(1) == 0);
        CHECK(buffer.startOfLine(2) == 8);
    }
}

TEST_CASE("TextBuffer - slicing", "[buffer]") {
    TextBuffer buffer("hello world");
    CHECK(buffer.slice({0, 5}) == "hello");
    CHECK(buffer.slice({6, 11}) == "world");
    CHECK(buffer.slice({3, 3}).empty());
}

TEST_CASE("TextBuffer - indentation", "[buffer]") {
    TextBuffer buffer("module M\n    foo; bar\n\tbaz\n");

    size_t foo = buffer.text().find("foo");
    size_t bar = buffer.text().find("bar");
    size_t baz = buffer.text().find("baz");

    CHECK(buffer.indentationAt(foo) == "    ");
    CHECK(buffer.indentationAt(bar) == "    ");
    CHECK(buffer.indentationAt(baz) == "\t");
    CHECK(buffer.indentationAt(0).empty());

    CHECK(buffer.isFirstOnLine(foo));
    CHECK_FALSE(buffer.isFirstOnLine(bar));
    CHECK(buffer.isFirstOnLine(baz));
}

TEST_CASE("SourceRange - basics", "[buffer]") {
    SourceRange range(3, 7);
    CHECK(range.size() == 4);
    CHECK_FALSE(range.empty());
    CHECK(range.contains(3));
    CHECK_FALSE(range.contains(7));

    CHECK(SourceRange(5, 5).empty());
    CHECK(SourceRange(6, 5).empty());
    CHECK(SourceRange(6, 5).size() == 0);
    CHECK(SourceRange(1, 2) == SourceRange(1, 2));
}

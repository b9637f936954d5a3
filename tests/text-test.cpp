#include <string>

#include "indentproc/text.hpp"

using namespace indentproc;

#include "catch.hpp"

TEST_CASE("leading whitespace", "[text]")
{
    CHECK(getLeadingWhitespace("") == "");
    CHECK(getLeadingWhitespace("foo") == "");
    CHECK(getLeadingWhitespace("  \tfoo ") == "  \t");
    CHECK(getLeadingWhitespace("    ") == "    ");
}


TEST_CASE("remove all occurrences", "[text]")
{
    SECTION("literal match")
    {
        CHECK(removeAllOccurrences("a[b]c[", "[") == "ab]c");
        CHECK(removeAllOccurrences("${x} + ${y}", "${") == "x} + y}");
        CHECK(removeAllOccurrences("a.b.c", ".") == "abc");
    }

    SECTION("no rescan of exposed text")
    {
        // Removing the middle "ab" joins an "a" and a "b", which stay
        CHECK(removeAllOccurrences("aabb", "ab") == "ab");
    }

    SECTION("non-overlapping, left to right")
    {
        CHECK(removeAllOccurrences("aaa", "aa") == "a");
    }

    SECTION("empty needle")
    {
        CHECK(removeAllOccurrences("foo", "") == "foo");
    }
}


TEST_CASE("replace indentation", "[text]")
{
    CHECK(replaceIndentation("  foo()", "\t\t") == "\t\tfoo()");
    CHECK(replaceIndentation("foo()", "    ") == "    foo()");
    CHECK(replaceIndentation("\t  foo()", "") == "foo()");
    CHECK(replaceIndentation("   ", "\t") == "\t");
}

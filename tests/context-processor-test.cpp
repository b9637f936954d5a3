#include <sstream>
#include <string>
#include <vector>

#include "indentproc/context-processor.hpp"
#include "indentproc/trace.hpp"

using namespace indentproc;

#include "catch.hpp"
#include "fake-model.hpp"

namespace {

void registerLanguages(LanguageConfigurationRegistry & registry) {
    LanguageConfiguration js;
    js.brackets = BracketPairSet {
        BracketPair ("(", ")"),
        BracketPair ("[", "]"),
        BracketPair ("{", "}")
    };
    registry.registerLanguage("js", js);

    LanguageConfiguration html;
    html.brackets = BracketPairSet {
        BracketPair ("<!--", "-->"),
        BracketPair ("<", ">")
    };
    registry.registerLanguage("html", html);
}

// <script>foo("(", {
LineTokens scriptOpeningLine() {
    return LineTokens::fromSegments({
        {"<script>", StandardTokenType::Other, "html"},
        {"foo(", StandardTokenType::Other, "js"},
        {"\"(\"", StandardTokenType::String, "js"},
        {", {", StandardTokenType::Other, "js"}
    });
}

} // end anonymous namespace


TEST_CASE("previous line context", "[context]")
{
    LanguageConfigurationRegistry registry;
    registerLanguages(registry);

    SECTION("language continues across the line break")
    {
        FakeModel model {
            scriptOpeningLine(),
            LineTokens::uniform("  bar();", "js")
        };
        IndentationContextProcessor processor (model, registry);

        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(2, 1)
        );
        CHECK(context.beforeRangeText == "");
        CHECK(context.afterRangeText == "  bar();");
        CHECK(context.previousLineText == "foo(\"\", {");

        CHECK(model.forcedLines() == (std::vector<int> {2, 1}));
    }

    SECTION("scope opened mid-line does not continue")
    {
        // <b>x = ')'
        FakeModel model {
            scriptOpeningLine(),
            LineTokens::fromSegments({
                {"<b>", StandardTokenType::Other, "html"},
                {"x = ", StandardTokenType::Other, "js"},
                {"')'", StandardTokenType::String, "js"}
            })
        };
        IndentationContextProcessor processor (model, registry);

        std::ostringstream log;
        std::ostream * old = Trace::setStream(&log);

        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(2, 5)
        );

        Trace::setStream(old);

        CHECK(context.beforeRangeText == "x");
        CHECK(context.afterRangeText == " = ''");
        CHECK(context.previousLineText == "");

        CHECK(model.forcedLines() == (std::vector<int> {2}));
        CHECK(log.str() == "previous line 1 skipped: js opens at offset 3\n");
    }

    SECTION("language changes across the line break")
    {
        FakeModel model {
            LineTokens::uniform("<div>", "html"),
            LineTokens::uniform("foo();", "js")
        };
        IndentationContextProcessor processor (model, registry);

        std::ostringstream log;
        std::ostream * old = Trace::setStream(&log);

        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(2, 1)
        );

        Trace::setStream(old);

        CHECK(context.previousLineText == "");
        CHECK(log.str() == "previous line 1 skipped: ends in html not js\n");
    }

    SECTION("previous line is empty")
    {
        FakeModel model {
            LineTokens::uniform("", "js"),
            LineTokens::uniform("x", "js")
        };
        IndentationContextProcessor processor (model, registry);

        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(2, 1)
        );
        CHECK(context.previousLineText == "");
        CHECK(context.afterRangeText == "x");
    }

    SECTION("first line has no previous line")
    {
        FakeModel model {scriptOpeningLine()};
        IndentationContextProcessor processor (model, registry);

        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(1, 10)
        );
        CHECK(context.beforeRangeText == "f");
        CHECK(context.afterRangeText == "oo(\"\", {");
        CHECK(context.previousLineText == "");

        context = processor.getProcessedContextAroundRange(Range::caret(1, 1));
        CHECK(context.beforeRangeText == "");
        CHECK(context.afterRangeText == "<script>");
        CHECK(context.previousLineText == "");
    }
}


TEST_CASE("text around the range", "[context]")
{
    LanguageConfigurationRegistry registry;
    registerLanguages(registry);

    FakeModel model {
        LineTokens::uniform("abcdefghij", "js"),
        LineTokens::fromSegments({
            {"0123456", StandardTokenType::Other, "js"},
            {"\"[8]\"", StandardTokenType::String, "js"}
        })
    };
    IndentationContextProcessor processor (model, registry);

    SECTION("caret")
    {
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(1, 5)
        );
        CHECK(context.beforeRangeText == "abcd");
        CHECK(context.afterRangeText == "efghij");
    }

    SECTION("selection on one line")
    {
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range (1, 3, 1, 6)
        );
        CHECK(context.beforeRangeText == "ab");
        CHECK(context.afterRangeText == "fghij");
    }

    SECTION("selection across lines takes the after text from the end line")
    {
        // Up to where the scope ends on the start line (offset 10)
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range (1, 3, 2, 8)
        );
        CHECK(context.beforeRangeText == "ab");
        CHECK(context.afterRangeText == "\"8");
        CHECK(context.previousLineText == "");
    }

    SECTION("backwards selection is normalized")
    {
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range (Position (2, 8), Position (1, 3))
        );
        CHECK(context.beforeRangeText == "ab");
        CHECK(context.afterRangeText == "\"8");
    }

    SECTION("columns past the end of the line are clamped")
    {
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(1, 50)
        );
        CHECK(context.beforeRangeText == "abcdefghij");
        CHECK(context.afterRangeText == "");
    }

    SECTION("caret on the second line sees the first")
    {
        ProcessedContext context = processor.getProcessedContextAroundRange(
            Range::caret(2, 8)
        );
        CHECK(context.beforeRangeText == "0123456");
        CHECK(context.afterRangeText == "\"8\"");
        CHECK(context.previousLineText == "abcdefghij");
    }
}


TEST_CASE("empty document line", "[context]")
{
    LanguageConfigurationRegistry registry;
    registerLanguages(registry);

    FakeModel model {LineTokens::uniform("", "js")};
    IndentationContextProcessor processor (model, registry);

    ProcessedContext context = processor.getProcessedContextAroundRange(
        Range::caret(1, 1)
    );
    CHECK(context.beforeRangeText == "");
    CHECK(context.afterRangeText == "");
    CHECK(context.previousLineText == "");
}


TEST_CASE("context on a missing line", "[context]")
{
    LanguageConfigurationRegistry registry;

    FakeModel model {LineTokens::uniform("x", "js")};
    IndentationContextProcessor processor (model, registry);

    CHECK_THROWS_AS(
        processor.getProcessedContextAroundRange(Range::caret(3, 1)),
        std::out_of_range
    );
}

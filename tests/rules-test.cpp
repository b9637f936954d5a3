#include <string>
#include <vector>

#include "indentproc/exceptions.hpp"
#include "indentproc/processed-rules.hpp"
#include "indentproc/rules.hpp"

using namespace indentproc;

#include "catch.hpp"
#include "fake-model.hpp"

namespace {

IndentationRules braceRules() {
    IndentationRules rules;
    rules.increaseIndentPattern = std::string ("\\{\\s*$");
    rules.decreaseIndentPattern = std::string ("^\\}");
    rules.indentNextLinePattern = std::string ("^\\s*(if|while)\\s*\\(.*\\)\\s*$");
    rules.unIndentedLinePattern = std::string ("^#");
    return rules;
}

} // end anonymous namespace


TEST_CASE("regex indent rules", "[rules]")
{
    IndentRulesSupport support (braceRules());

    SECTION("each question uses its own pattern")
    {
        CHECK(support.shouldIncrease("function f() {"));
        CHECK(not support.shouldIncrease("f();"));

        CHECK(support.shouldDecrease("} else"));
        CHECK(not support.shouldDecrease("  }"));

        CHECK(support.shouldIndentNextLine("  if (a)"));
        CHECK(not support.shouldIndentNextLine("  if (a) {"));

        CHECK(support.shouldIgnore("#pragma once"));
        CHECK(not support.shouldIgnore("  #x"));
    }

    SECTION("metadata")
    {
        CHECK(support.getIndentMetadata("} else {") == (IncreaseMask | DecreaseMask));
        CHECK(support.getIndentMetadata("while (x)") == IndentNextLineMask);
        CHECK(support.getIndentMetadata("#if {") == (IncreaseMask | UnIndentMask));
        CHECK(support.getIndentMetadata("x = 1;") == 0);
    }

    SECTION("missing patterns never match")
    {
        IndentationRules rules;
        rules.increaseIndentPattern = std::string ("\\{$");

        IndentRulesSupport partial (rules);
        CHECK(partial.shouldIncrease("{"));
        CHECK(not partial.shouldDecrease("}"));
        CHECK(not partial.shouldIndentNextLine("if (a)"));
        CHECK(not partial.shouldIgnore(""));
    }

    SECTION("invalid pattern")
    {
        IndentationRules rules;
        rules.decreaseIndentPattern = std::string ("^(\\}");

        try {
            IndentRulesSupport broken (rules);
            FAIL("invalid pattern was accepted");
        }
        catch (invalid_pattern const & e) {
            CHECK(e.rule() == "decreaseIndentPattern");
            CHECK(e.pattern() == "^(\\}");
        }
    }
}


TEST_CASE("processed indent rules", "[rules]")
{
    LanguageConfigurationRegistry registry;

    LanguageConfiguration js;
    js.brackets = BracketPairSet {
        BracketPair ("(", ")"),
        BracketPair ("{", "}")
    };
    registry.registerLanguage("js", js);

    FakeModel model {
        // foo(); // {
        LineTokens::fromSegments({
            {"foo(); ", StandardTokenType::Other, "js"},
            {"// {", StandardTokenType::Comment, "js"}
        }),
        LineTokens::uniform("    }", "js"),
        LineTokens::fromSegments({
            {"if (", StandardTokenType::Other, "js"},
            {"\")\"", StandardTokenType::String, "js"},
            {")", StandardTokenType::Other, "js"}
        }),
        LineTokens::uniform("#region {", "js")
    };

    IndentRulesSupport support (braceRules());
    ProcessedIndentRulesSupport processed (model, support, registry);

    SECTION("brackets in comments do not trigger rules")
    {
        CHECK(support.shouldIncrease("foo(); // {"));
        CHECK(not processed.shouldIncrease(1));
    }

    SECTION("new indentation is applied before the rule")
    {
        CHECK(not processed.shouldDecrease(2));
        CHECK(processed.shouldDecrease(2, std::string ()));
        CHECK(not processed.shouldDecrease(2, std::string ("\t")));
    }

    SECTION("indent next line")
    {
        CHECK(processed.shouldIndentNextLine(3));
        CHECK(processed.shouldIndentNextLine(3, std::string ("  ")));
    }

    SECTION("ignore")
    {
        CHECK(processed.shouldIgnore(4));
        CHECK(not processed.shouldIgnore(4, std::string ("  ")));
    }

    SECTION("metadata")
    {
        CHECK(processed.getIndentMetadata(4) == (IncreaseMask | UnIndentMask));
        CHECK(processed.getIndentMetadata(2, std::string ()) == DecreaseMask);
    }
}


TEST_CASE("evaluator only sees processed lines", "[rules]")
{
    LanguageConfigurationRegistry registry;

    LanguageConfiguration js;
    js.brackets = BracketPairSet {BracketPair ("[", "]")};
    registry.registerLanguage("js", js);

    FakeModel model {
        LineTokens::fromSegments({
            {"  x = ", StandardTokenType::Other, "js"},
            {"'[1]'", StandardTokenType::String, "js"},
            {"[0]", StandardTokenType::Other, "js"}
        })
    };

    RecordingEvaluator recorder;
    ProcessedIndentRulesSupport processed (model, recorder, registry);

    CHECK(processed.shouldIncrease(1));
    CHECK(processed.shouldDecrease(1, std::string ("\t")));
    CHECK(processed.shouldIgnore(1));
    CHECK(processed.shouldIndentNextLine(1, std::string ()));

    CHECK(
        recorder.texts() == (std::vector<std::string> {
            "  x = '1'[0]",
            "\tx = '1'[0]",
            "  x = '1'[0]",
            "x = '1'[0]"
        })
    );
}

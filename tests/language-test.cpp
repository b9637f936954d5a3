#include <sstream>
#include <string>
#include <vector>

#include "indentproc/language.hpp"
#include "indentproc/trace.hpp"

using namespace indentproc;

#include "catch.hpp"

TEST_CASE("bracket pair set", "[language]")
{
    BracketPairSet brackets {
        BracketPair ("(", ")"),
        BracketPair (
            std::vector<std::string> {"begin", "do"},
            std::vector<std::string> {"end"}
        )
    };

    CHECK(brackets.getPairs().size() == 2);
    CHECK(
        brackets.getOpenBrackets()
        == (std::vector<std::string> {"(", "begin", "do"})
    );
    CHECK(
        brackets.getCloseBrackets()
        == (std::vector<std::string> {")", "end"})
    );
}


TEST_CASE("language configuration registry", "[language]")
{
    LanguageConfigurationRegistry registry;

    LanguageConfiguration js;
    js.brackets = BracketPairSet {
        BracketPair ("(", ")"), BracketPair ("{", "}")
    };

    SECTION("unknown language has no brackets")
    {
        CHECK(not registry.hasLanguage("js"));
        CHECK(not registry.getBracketPairs("js"));
        CHECK(not registry.getIndentationRules("js"));
    }

    SECTION("register and look up")
    {
        CHECK(not registry.registerLanguage("js", js));
        CHECK(registry.hasLanguage("js"));

        optional<BracketPairSet> brackets = registry.getBracketPairs("js");
        REQUIRE(brackets);
        CHECK(brackets->getPairs().size() == 2);
    }

    SECTION("configuration without brackets")
    {
        LanguageConfiguration plain;
        plain.indentationRules = IndentationRules ();
        plain.indentationRules->increaseIndentPattern = std::string ("^x");

        registry.registerLanguage("plain", plain);
        CHECK(registry.hasLanguage("plain"));
        CHECK(not registry.getBracketPairs("plain"));

        optional<IndentationRules> rules = registry.getIndentationRules("plain");
        REQUIRE(rules);
        CHECK(*rules->increaseIndentPattern == "^x");
        CHECK(not rules->decreaseIndentPattern);
    }

    SECTION("replace is traced")
    {
        std::ostringstream log;
        std::ostream * old = Trace::setStream(&log);

        registry.registerLanguage("js", js);
        CHECK(log.str().empty());

        LanguageConfiguration none;
        CHECK(registry.registerLanguage("js", none));
        CHECK(not registry.getBracketPairs("js"));

        Trace::setStream(old);
        CHECK(log.str() == "language configuration for js replaced\n");
    }

    SECTION("unregister")
    {
        registry.registerLanguage("js", js);
        CHECK(registry.unregisterLanguage("js"));
        CHECK(not registry.unregisterLanguage("js"));
        CHECK(not registry.getBracketPairs("js"));
    }
}

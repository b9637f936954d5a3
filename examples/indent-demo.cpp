#include <iostream>
#include <string>
#include <vector>

#include "indentproc/indentproc.hpp"

using namespace indentproc;

//
// Walks an HTML page with an embedded script the way an editor would when
// Enter is pressed at the end of each line: it prints the processed line,
// what the rules say about it, and the context the caret would see.  Trace
// output about skipped previous lines goes to std::cerr.
//

namespace {

class DemoModel : public TokenizedModel {
    std::vector<LineTokens> lines;

public:
    DemoModel (std::vector<LineTokens> const & lines) :
        lines (lines)
    {
    }

    void forceTokenization(int) override {
        // everything is tokenized up front
    }

    LineTokens getLineTokens(int lineNumber) const override {
        return lines.at(lineNumber - 1);
    }

    int getLineMaxColumn(int lineNumber) const override {
        return lines.at(lineNumber - 1).getLineLength() + 1;
    }

    int getLineCount() const {
        return static_cast<int>(lines.size());
    }
};

} // end anonymous namespace


int main(int, char **) {
    LanguageConfigurationRegistry registry;

    LanguageConfiguration html;
    html.brackets = BracketPairSet {
        BracketPair ("<!--", "-->"),
        BracketPair ("<", ">")
    };
    registry.registerLanguage("html", html);

    LanguageConfiguration js;
    js.brackets = BracketPairSet {
        BracketPair ("(", ")"),
        BracketPair ("[", "]"),
        BracketPair ("{", "}")
    };
    js.indentationRules = IndentationRules ();
    js.indentationRules->increaseIndentPattern = std::string ("\\{[^}]*$");
    js.indentationRules->decreaseIndentPattern = std::string ("^\\s*\\}");
    js.indentationRules->indentNextLinePattern
        = std::string ("^\\s*(if|while|for)\\s*\\(.*\\)\\s*$");
    registry.registerLanguage("js", js);

    DemoModel model ({
        LineTokens::uniform("<body>", "html"),
        LineTokens::fromSegments({
            {"<script>", StandardTokenType::Other, "html"},
            {"function f() {", StandardTokenType::Other, "js"}
        }),
        LineTokens::fromSegments({
            {"  var s = ", StandardTokenType::Other, "js"},
            {"\"}\"", StandardTokenType::String, "js"},
            {"; ", StandardTokenType::Other, "js"},
            {"// {", StandardTokenType::Comment, "js"}
        }),
        LineTokens::uniform("  if (s)", "js"),
        LineTokens::uniform("}", "js"),
        LineTokens::fromSegments({
            {"</script>", StandardTokenType::Other, "html"}
        })
    });

    Trace::setStream(&std::cerr);

    IndentRulesSupport jsRules (*registry.getIndentationRules("js"));
    ProcessedIndentRulesSupport rules (model, jsRules, registry);
    IndentationLineProcessor lines (model, registry);
    IndentationContextProcessor contexts (model, registry);

    for (int lineNumber = 1; lineNumber <= model.getLineCount(); ++lineNumber) {
        std::cout << lineNumber << ": " << lines.getProcessedLine(lineNumber)
            << "\n";

        int metadata = rules.getIndentMetadata(lineNumber);
        std::cout << "   increase " << ((metadata & IncreaseMask) != 0)
            << " decrease " << ((metadata & DecreaseMask) != 0)
            << " next " << ((metadata & IndentNextLineMask) != 0)
            << "\n";

        Range caret = Range::caret(
            lineNumber, model.getLineMaxColumn(lineNumber)
        );
        ProcessedContext context = contexts.getProcessedContextAroundRange(
            caret
        );
        std::cout << "   before [" << context.beforeRangeText << "]"
            << " previous [" << context.previousLineText << "]\n";
    }

    return 0;
}

#ifndef INDENTPROC_LINE_PROCESSOR_HPP
#define INDENTPROC_LINE_PROCESSOR_HPP

//
// line-processor.hpp
// This file is part of IndentProc
// Copyright (C) 2015-2018 HostileFork.com
//
// Licensed under the Boost License, Version 1.0 (the "License")
//
//      http://www.boost.org/LICENSE_1_0.txt
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied.  See the License for the specific language governing
// permissions and limitations under the License.
//

#include <string>
#include <vector>

#include "common.hpp"
#include "language.hpp"
#include "model.hpp"
#include "tokens.hpp"

namespace indentproc {

//
// INDENTATION LINE PROCESSOR
//

//
// Indentation rules are regular expressions, and a regular expression that
// asks "does this line end with an open brace" cannot tell the brace in
//
//     foo("{");
//
// from a real one.  The processor removes the language's configured bracket
// strings from every string, comment and regex token of a line and leaves
// everything else as it was, so the rules only ever see syntax brackets.
//
// The language is that of the first token.  If the language has no bracket
// configuration the text is returned exactly as it came in.
//
// For each literal-like token, all open spellings are removed first and then
// all close spellings, each removal applied to the result of the one before.
// See removeAllOccurrences() for what a single removal does.
//
// The model and the configuration service are borrowed and must outlive the
// processor.
//

class IndentationLineProcessor {
private:
    TokenizedModel const & model;
    LanguageConfigurationService const & languageConfigurationService;

public:
    IndentationLineProcessor (
        TokenizedModel const & model,
        LanguageConfigurationService const & languageConfigurationService
    ) :
        model (model),
        languageConfigurationService (languageConfigurationService)
    {
    }

public:
    //
    // The processed text of a line of the model.  If a new indentation is
    // given, the leading whitespace of the *processed* line is replaced with
    // it (an empty string removes the indentation).
    //
    std::string getProcessedLine(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;

    std::string getProcessedLineForTokens(LineTokens const & tokens) const;

private:
    static std::string removeBracketsFromText(
        std::string const & text,
        std::vector<std::string> const & openBrackets,
        std::vector<std::string> const & closeBrackets
    );
};

} // end namespace indentproc

#endif

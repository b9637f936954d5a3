#ifndef INDENTPROC_CONTEXT_PROCESSOR_HPP
#define INDENTPROC_CONTEXT_PROCESSOR_HPP

//
// context-processor.hpp
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

#include "language.hpp"
#include "line-processor.hpp"
#include "model.hpp"
#include "range.hpp"
#include "scope.hpp"

namespace indentproc {

//
// PROCESSED CONTEXT
//

struct ProcessedContext {
    // Start of the scope up to the start of the range, on the start line
    std::string beforeRangeText;

    // End of the range up to the end of the scope, on the end line
    std::string afterRangeText;

    // The same language's text on the line above, or empty
    std::string previousLineText;
};



//
// INDENTATION CONTEXT PROCESSOR
//

//
// When Enter is pressed the editor wants to know how to indent the new line,
// and the rules need to see the text around the caret.  In a document that
// embeds one language in another only the text of the caret's language is
// meaningful to its rules: the `<script>` tag on the left of some JavaScript
// must not make the JavaScript rules think a line opened something.
//
// So all of the text is clipped to the scope the start of the range is in.
// The previous line is only included when the scope begins at column 1 and
// the end of the line above is in the same language, i.e. when the region
// plausibly runs across the line break.  Everything returned is processed
// with the IndentationLineProcessor.
//
// Columns past the end of a line are clamped to it.  The model and the
// configuration service are borrowed and must outlive the processor.
//

class IndentationContextProcessor {
private:
    TokenizedModel & model;
    IndentationLineProcessor indentationLineProcessor;

public:
    IndentationContextProcessor (
        TokenizedModel & model,
        LanguageConfigurationService const & languageConfigurationService
    ) :
        model (model),
        indentationLineProcessor (model, languageConfigurationService)
    {
    }

public:
    ProcessedContext getProcessedContextAroundRange(Range const & range);

private:
    std::string getProcessedTextBeforeRange(
        Range const & range,
        ScopedLineTokens const & scopedLineTokens
    );

    std::string getProcessedTextAfterRange(
        Range const & range,
        ScopedLineTokens const & scopedLineTokens
    );

    std::string getProcessedPreviousLine(
        Range const & range,
        ScopedLineTokens const & scopedLineTokens
    );

    ScopedLineTokens getScopedLineTokensAtEndColumnOfLine(int lineNumber);
};

} // end namespace indentproc

#endif

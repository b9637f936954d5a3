//
// context-processor.cpp
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

#include "indentproc/context-processor.hpp"
#include "indentproc/trace.hpp"


namespace indentproc {

ProcessedContext IndentationContextProcessor::getProcessedContextAroundRange(
    Range const & range
) {
    model.forceTokenization(range.startLineNumber);
    LineTokens lineTokens = model.getLineTokens(range.startLineNumber);
    ScopedLineTokens scopedLineTokens = createScopedLineTokens(
        lineTokens, range.startColumn - 1
    );

    ProcessedContext context;
    context.beforeRangeText = getProcessedTextBeforeRange(
        range, scopedLineTokens
    );
    context.afterRangeText = getProcessedTextAfterRange(
        range, scopedLineTokens
    );
    context.previousLineText = getProcessedPreviousLine(
        range, scopedLineTokens
    );
    return context;
}


std::string IndentationContextProcessor::getProcessedTextBeforeRange(
    Range const & range,
    ScopedLineTokens const & scopedLineTokens
) {
    LineTokens lineTokens = model.getLineTokens(range.startLineNumber);

    LineTokens slicedTokensBefore = lineTokens.sliceAndInflate(
        scopedLineTokens.firstCharOffset(),
        range.startColumn - 1
    );
    return indentationLineProcessor.getProcessedLineForTokens(
        slicedTokensBefore
    );
}


//
// For a caret the text after it is on the same line.  For a selection it is
// on the line the selection ends on, from the end of the selection up to
// where the scope ends on the *start* line: the scope of the end line is
// not resolved separately.
//

std::string IndentationContextProcessor::getProcessedTextAfterRange(
    Range const & range,
    ScopedLineTokens const & scopedLineTokens
) {
    int firstCharacterOffset;
    int lineNumber;
    if (range.isEmpty()) {
        firstCharacterOffset = range.startColumn - 1;
        lineNumber = range.startLineNumber;
    }
    else {
        firstCharacterOffset = range.endColumn - 1;
        lineNumber = range.endLineNumber;
    }

    LineTokens lineTokens = model.getLineTokens(lineNumber);

    int lastCharacterOffset = scopedLineTokens.firstCharOffset()
        + scopedLineTokens.getLength();

    LineTokens slicedTokensAfter = lineTokens.sliceAndInflate(
        firstCharacterOffset, lastCharacterOffset
    );
    return indentationLineProcessor.getProcessedLineForTokens(
        slicedTokensAfter
    );
}


ScopedLineTokens
IndentationContextProcessor::getScopedLineTokensAtEndColumnOfLine(
    int lineNumber
) {
    model.forceTokenization(lineNumber);
    LineTokens lineTokens = model.getLineTokens(lineNumber);
    int endOffsetOfLine = model.getLineMaxColumn(lineNumber) - 1;
    return createScopedLineTokens(lineTokens, endOffsetOfLine);
}


std::string IndentationContextProcessor::getProcessedPreviousLine(
    Range const & range,
    ScopedLineTokens const & scopedLineTokens
) {
    int previousLineNumber = range.startLineNumber - 1;
    if (previousLineNumber < 1)
        return std::string ();

    if (not scopedLineTokens.doesScopeStartAtOffsetZero()) {
        trace(
            "previous line", previousLineNumber, "skipped:",
            scopedLineTokens.languageId(), "opens at offset",
            scopedLineTokens.firstCharOffset()
        );
        return std::string ();
    }

    ScopedLineTokens previousScope
        = getScopedLineTokensAtEndColumnOfLine(previousLineNumber);

    if (previousScope.languageId() != scopedLineTokens.languageId()) {
        trace(
            "previous line", previousLineNumber, "skipped: ends in",
            previousScope.languageId(), "not", scopedLineTokens.languageId()
        );
        return std::string ();
    }

    LineTokens previousLineTokens = model.getLineTokens(previousLineNumber);
    LineTokens previousSlicedLineTokens = previousLineTokens.sliceAndInflate(
        previousScope.firstCharOffset(),
        previousScope.lastCharOffset()
    );
    return indentationLineProcessor.getProcessedLineForTokens(
        previousSlicedLineTokens
    );
}

} // end namespace indentproc

//
// scope.cpp
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

#include "indentproc/scope.hpp"


namespace indentproc {

ScopedLineTokens::ScopedLineTokens (
    LineTokens const & actual,
    LanguageId const & languageId,
    int firstTokenIndex,
    int lastTokenIndex,
    int firstCharOffset,
    int lastCharOffset
) :
    scopeLanguageId (languageId),
    firstTokenIndex (firstTokenIndex),
    lastTokenIndex (lastTokenIndex),
    firstOffset (firstCharOffset),
    lastOffset (lastCharOffset),
    content (
        actual.getLineContent().substr(
            firstCharOffset, lastCharOffset - firstCharOffset
        )
    )
{
}


ScopedLineTokens createScopedLineTokens(
    LineTokens const & lineTokens,
    int offset
) {
    int tokenCount = lineTokens.getCount();
    if (tokenCount == 0)
        return ScopedLineTokens (lineTokens, LanguageId (), 0, 0, 0, 0);

    int tokenIndex = lineTokens.findTokenIndexAtOffset(offset);
    LanguageId const & desiredLanguageId = lineTokens.getLanguageId(tokenIndex);

    int lastTokenIndex = tokenIndex;
    while (
        lastTokenIndex + 1 < tokenCount
        and lineTokens.getLanguageId(lastTokenIndex + 1) == desiredLanguageId
    ) {
        lastTokenIndex++;
    }

    int firstTokenIndex = tokenIndex;
    while (
        firstTokenIndex > 0
        and lineTokens.getLanguageId(firstTokenIndex - 1) == desiredLanguageId
    ) {
        firstTokenIndex--;
    }

    return ScopedLineTokens (
        lineTokens,
        desiredLanguageId,
        firstTokenIndex,
        lastTokenIndex + 1,
        lineTokens.getStartOffset(firstTokenIndex),
        lineTokens.getEndOffset(lastTokenIndex)
    );
}

} // end namespace indentproc

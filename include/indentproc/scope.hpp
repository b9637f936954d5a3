#ifndef INDENTPROC_SCOPE_HPP
#define INDENTPROC_SCOPE_HPP

//
// scope.hpp
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

#include "common.hpp"
#include "tokens.hpp"

namespace indentproc {

//
// SCOPED LINE TOKENS
//

//
// A line of an HTML document may hold a `<script>` tag opening, some
// JavaScript, and the tag closing.  Each embedded language region is a run
// of adjacent tokens that share a language id, and that run is the "scope"
// that indentation rules for the language get to see.
//
// The scope is a value: the language id plus the half-open character range
// [firstCharOffset, lastCharOffset) on the line it was resolved on.  All of
// the boundary arithmetic of context extraction is done against these two
// numbers, so nothing recomputes them from the tokens after resolution.
//

class ScopedLineTokens {
private:
    LanguageId scopeLanguageId;
    int firstTokenIndex;
    int lastTokenIndex; // one past the last token in the scope
    int firstOffset;
    int lastOffset;
    std::string content;

public:
    ScopedLineTokens (
        LineTokens const & actual,
        LanguageId const & languageId,
        int firstTokenIndex,
        int lastTokenIndex,
        int firstCharOffset,
        int lastCharOffset
    );

public:
    LanguageId const & languageId() const {
        return scopeLanguageId;
    }

    int firstCharOffset() const {
        return firstOffset;
    }

    int lastCharOffset() const {
        return lastOffset;
    }

    int getTokenCount() const {
        return lastTokenIndex - firstTokenIndex;
    }

    int getFirstTokenIndex() const {
        return firstTokenIndex;
    }

    std::string const & getLineContent() const {
        return content;
    }

    int getLength() const {
        return lastOffset - firstOffset;
    }

    // If the scope does not start at column 1, the language was opened on
    // this line and cannot be continuing from the line above.
    bool doesScopeStartAtOffsetZero() const {
        return firstOffset == 0;
    }
};


//
// Resolves the scope that the character at `offset` belongs to, by widening
// from its token to the left and right across tokens of the same language.
// Offsets outside the line clamp to its first or last token.  A line with
// no tokens resolves to an empty scope with an empty language id.
//

ScopedLineTokens createScopedLineTokens(
    LineTokens const & lineTokens,
    int offset
);

} // end namespace indentproc

#endif

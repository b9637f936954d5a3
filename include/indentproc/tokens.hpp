#ifndef INDENTPROC_TOKENS_HPP
#define INDENTPROC_TOKENS_HPP

//
// tokens.hpp
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

#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include "common.hpp"

namespace indentproc {

//
// STANDARD TOKEN TYPES
//

//
// The tokenizer knows a great deal more about a token than this (keyword,
// operator, tag name...) but indentation processing only cares whether the
// text of a token is *data* or *syntax*.  Brackets inside a string, a
// comment or a regular expression literal are data.
//

enum class StandardTokenType {
    Other = 0,
    Comment = 1,
    String = 2,
    RegEx = 3
};

bool isLiteralLike(StandardTokenType type);

char const * toString(StandardTokenType type);

inline std::ostream & operator<<(std::ostream & os, StandardTokenType type) {
    return os << toString(type);
}



//
// TOKEN
//

struct Token {
    int startOffset;
    StandardTokenType type;
    LanguageId languageId;

    Token (
        int startOffset,
        StandardTokenType type,
        LanguageId const & languageId
    ) :
        startOffset (startOffset),
        type (type),
        languageId (languageId)
    {
    }
};


//
// A segment is a token given by its text instead of its offset, which is the
// natural way to write one down by hand or to receive one from a tokenizer
// that produces strings.
//

struct TokenSegment {
    std::string text;
    StandardTokenType type;
    LanguageId languageId;
};



//
// LINE TOKENS
//

//
// The text of one line together with its tokens.  The tokens are contiguous:
// the first starts at offset 0, each one ends where the next begins, and the
// last one ends at the end of the line.  A token's text is derived by
// slicing the line, it is not stored separately.
//
// An empty line still has one (empty) token, so that it can say what
// language it is in.  Only a slice of an empty span has no tokens at all.
//
// Construction checks the offsets and throws std::invalid_argument if they
// are not contiguous.
//

class LineTokens {
private:
    std::string text;
    std::vector<Token> tokens;

public:
    LineTokens (std::string const & text, std::vector<Token> const & tokens);

    static LineTokens fromSegments(std::vector<TokenSegment> const & segments);

    static LineTokens fromSegments(
        std::initializer_list<TokenSegment> segments
    ) {
        return fromSegments(std::vector<TokenSegment> (segments));
    }

    // A whole line in one language and one classification
    static LineTokens uniform(
        std::string const & text,
        LanguageId const & languageId,
        StandardTokenType type = StandardTokenType::Other
    );

public:
    int getCount() const {
        return static_cast<int>(tokens.size());
    }

    int getStartOffset(int tokenIndex) const;

    int getEndOffset(int tokenIndex) const;

    StandardTokenType getStandardTokenType(int tokenIndex) const;

    LanguageId const & getLanguageId(int tokenIndex) const;

    std::string getTokenText(int tokenIndex) const;

    std::string const & getLineContent() const {
        return text;
    }

    int getLineLength() const {
        return static_cast<int>(text.size());
    }

    //
    // Index of the token that contains the character at `offset`.  An offset
    // on a boundary belongs to the token that starts there; an offset at or
    // past the end of the line belongs to the last token.  Negative offsets
    // belong to the first token.  The line must have at least one token.
    //
    int findTokenIndexAtOffset(int offset) const;

    //
    // A new LineTokens holding the text in [startOffset, endOffset) and the
    // tokens that overlap it, clipped so that the first one starts at 0.
    // Classifications and language ids are preserved.  Offsets are clamped
    // to the line, and an end before the start gives an empty slice.
    //
    LineTokens sliceAndInflate(int startOffset, int endOffset) const;
};

} // end namespace indentproc

#endif

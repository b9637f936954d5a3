//
// tokens.cpp
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

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "indentproc/tokens.hpp"


namespace indentproc {

//
// TOKEN TYPE CLASSIFICATION
//

bool isLiteralLike(StandardTokenType type) {
    switch (type) {
    case StandardTokenType::String:
    case StandardTokenType::Comment:
    case StandardTokenType::RegEx:
        return true;

    case StandardTokenType::Other:
        return false;
    }
    UNREACHABLE_CODE();
}


char const * toString(StandardTokenType type) {
    switch (type) {
    case StandardTokenType::Other:
        return "other";
    case StandardTokenType::Comment:
        return "comment";
    case StandardTokenType::String:
        return "string";
    case StandardTokenType::RegEx:
        return "regex";
    }
    UNREACHABLE_CODE();
}



//
// CONSTRUCTION
//

LineTokens::LineTokens (
    std::string const & text,
    std::vector<Token> const & tokens
) :
    text (text),
    tokens (tokens)
{
    int length = static_cast<int>(text.size());

    if (tokens.empty()) {
        if (length != 0)
            throw std::invalid_argument(
                "LineTokens for non-empty text must have at least one token"
            );
        return;
    }

    if (tokens.front().startOffset != 0)
        throw std::invalid_argument("First token must start at offset 0");

    int previous = 0;
    for (Token const & token : tokens) {
        if (token.startOffset < previous or token.startOffset > length) {
            std::ostringstream ss;
            ss << "Token start offset " << token.startOffset
                << " out of order on line of length " << length;
            throw std::invalid_argument(ss.str());
        }
        previous = token.startOffset;
    }
}


LineTokens LineTokens::fromSegments(std::vector<TokenSegment> const & segments) {
    std::string text;
    std::vector<Token> tokens;
    tokens.reserve(segments.size());

    for (TokenSegment const & segment : segments) {
        tokens.emplace_back(
            static_cast<int>(text.size()), segment.type, segment.languageId
        );
        text += segment.text;
    }

    return LineTokens (text, tokens);
}


LineTokens LineTokens::uniform(
    std::string const & text,
    LanguageId const & languageId,
    StandardTokenType type
) {
    return LineTokens (text, {Token (0, type, languageId)});
}



//
// TOKEN ACCESS
//

int LineTokens::getStartOffset(int tokenIndex) const {
    return tokens.at(tokenIndex).startOffset;
}


int LineTokens::getEndOffset(int tokenIndex) const {
    if (tokenIndex < 0 or tokenIndex >= getCount())
        throw std::out_of_range("Token index out of range");
    if (tokenIndex + 1 < getCount())
        return tokens[tokenIndex + 1].startOffset;
    return getLineLength();
}


StandardTokenType LineTokens::getStandardTokenType(int tokenIndex) const {
    return tokens.at(tokenIndex).type;
}


LanguageId const & LineTokens::getLanguageId(int tokenIndex) const {
    return tokens.at(tokenIndex).languageId;
}


std::string LineTokens::getTokenText(int tokenIndex) const {
    int start = getStartOffset(tokenIndex);
    return text.substr(start, getEndOffset(tokenIndex) - start);
}


int LineTokens::findTokenIndexAtOffset(int offset) const {
    int count = getCount();
    if (count == 0)
        throw std::out_of_range("findTokenIndexAtOffset on a line with no tokens");

    // First token whose end is past the offset, i.e. the last token whose
    // start is not past it (skipping over any empty tokens at the offset).

    int low = 0;
    int high = count - 1;
    while (low < high) {
        int mid = low + (high - low) / 2;
        if (getEndOffset(mid) <= offset)
            low = mid + 1;
        else
            high = mid;
    }
    return low;
}



//
// SLICING
//

LineTokens LineTokens::sliceAndInflate(int startOffset, int endOffset) const {
    int length = getLineLength();
    startOffset = std::max(0, std::min(startOffset, length));
    endOffset = std::max(startOffset, std::min(endOffset, length));

    std::string sliced = text.substr(startOffset, endOffset - startOffset);
    std::vector<Token> inflated;

    if (tokens.empty() or startOffset == endOffset)
        return LineTokens (sliced, inflated);

    for (
        int index = findTokenIndexAtOffset(startOffset);
        index < getCount();
        ++index
    ) {
        Token const & token = tokens[index];
        if (token.startOffset >= endOffset)
            break;

        inflated.emplace_back(
            std::max(0, token.startOffset - startOffset),
            token.type,
            token.languageId
        );
    }

    return LineTokens (sliced, inflated);
}

} // end namespace indentproc

//
// line-processor.cpp
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

#include "indentproc/line-processor.hpp"
#include "indentproc/text.hpp"


namespace indentproc {

std::string IndentationLineProcessor::getProcessedLine(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    LineTokens tokens = model.getLineTokens(lineNumber);
    std::string processedLine = getProcessedLineForTokens(tokens);

    if (newIndentation)
        processedLine = replaceIndentation(processedLine, *newIndentation);

    return processedLine;
}


std::string IndentationLineProcessor::removeBracketsFromText(
    std::string const & text,
    std::vector<std::string> const & openBrackets,
    std::vector<std::string> const & closeBrackets
) {
    std::string processed = text;
    for (std::string const & bracket : openBrackets)
        processed = removeAllOccurrences(processed, bracket);
    for (std::string const & bracket : closeBrackets)
        processed = removeAllOccurrences(processed, bracket);
    return processed;
}


std::string IndentationLineProcessor::getProcessedLineForTokens(
    LineTokens const & tokens
) const {
    if (tokens.getCount() == 0)
        return tokens.getLineContent();

    optional<BracketPairSet> brackets
        = languageConfigurationService.getBracketPairs(tokens.getLanguageId(0));

    if (not brackets)
        return tokens.getLineContent();

    std::vector<std::string> openBrackets = brackets->getOpenBrackets();
    std::vector<std::string> closeBrackets = brackets->getCloseBrackets();

    std::string processedLine;
    processedLine.reserve(tokens.getLineLength());

    for (int index = 0; index < tokens.getCount(); ++index) {
        std::string text = tokens.getTokenText(index);
        if (isLiteralLike(tokens.getStandardTokenType(index)))
            processedLine += removeBracketsFromText(
                text, openBrackets, closeBrackets
            );
        else
            processedLine += text;
    }

    return processedLine;
}

} // end namespace indentproc

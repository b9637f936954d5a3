//
// rules.cpp
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

#include "indentproc/rules.hpp"
#include "indentproc/exceptions.hpp"


namespace indentproc {

int IndentRulesEvaluator::getIndentMetadata(std::string const & text) const {
    int result = 0;
    if (shouldIncrease(text))
        result |= IncreaseMask;
    if (shouldDecrease(text))
        result |= DecreaseMask;
    if (shouldIndentNextLine(text))
        result |= IndentNextLineMask;
    if (shouldIgnore(text))
        result |= UnIndentMask;
    return result;
}



//
// CONSTRUCTION
//

optional<std::regex> IndentRulesSupport::compile(
    char const * ruleName,
    optional<std::string> const & pattern
) {
    if (not pattern)
        return nullopt;

    try {
        return std::regex (*pattern, std::regex::ECMAScript);
    }
    catch (std::regex_error const & e) {
        throw invalid_pattern (ruleName, *pattern, e.what());
    }
}


IndentRulesSupport::IndentRulesSupport (IndentationRules const & rules) :
    increaseIndent (
        compile("increaseIndentPattern", rules.increaseIndentPattern)
    ),
    decreaseIndent (
        compile("decreaseIndentPattern", rules.decreaseIndentPattern)
    ),
    indentNextLine (
        compile("indentNextLinePattern", rules.indentNextLinePattern)
    ),
    unIndentedLine (
        compile("unIndentedLinePattern", rules.unIndentedLinePattern)
    )
{
}



//
// EVALUATION
//

bool IndentRulesSupport::test(
    optional<std::regex> const & regex,
    std::string const & text
) {
    if (not regex)
        return false;
    return std::regex_search(text, *regex);
}


bool IndentRulesSupport::shouldIncrease(std::string const & text) const {
    return test(increaseIndent, text);
}


bool IndentRulesSupport::shouldDecrease(std::string const & text) const {
    return test(decreaseIndent, text);
}


bool IndentRulesSupport::shouldIndentNextLine(std::string const & text) const {
    return test(indentNextLine, text);
}


bool IndentRulesSupport::shouldIgnore(std::string const & text) const {
    return test(unIndentedLine, text);
}

} // end namespace indentproc

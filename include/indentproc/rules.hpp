#ifndef INDENTPROC_RULES_HPP
#define INDENTPROC_RULES_HPP

//
// rules.hpp
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

#include <regex>
#include <string>

#include "common.hpp"
#include "language.hpp"

namespace indentproc {

//
// INDENT METADATA BITS
//

//
// The four answers packed into one integer, for callers that want to ask
// all of the questions about a line at once.
//

enum IndentConsts {
    IncreaseMask = 0x1,
    DecreaseMask = 0x2,
    IndentNextLineMask = 0x4,
    UnIndentMask = 0x8
};



//
// INDENT RULES EVALUATOR
//

//
// The four questions asked of a line of text.  The text given is assumed to
// be already processed (see IndentationLineProcessor), so an evaluator is
// free to match brackets with a plain regular expression.
//
//   shouldIncrease       -- lines after this one go one level deeper
//   shouldDecrease       -- this line goes one level shallower
//   shouldIndentNextLine -- only the next line goes one level deeper,
//                           e.g. the body of a brace-less `if`
//   shouldIgnore         -- automatic rules should leave this line alone
//

class IndentRulesEvaluator {
public:
    virtual bool shouldIncrease(std::string const & text) const = 0;

    virtual bool shouldDecrease(std::string const & text) const = 0;

    virtual bool shouldIndentNextLine(std::string const & text) const = 0;

    virtual bool shouldIgnore(std::string const & text) const = 0;

    int getIndentMetadata(std::string const & text) const;

    virtual ~IndentRulesEvaluator () {
    }
};


//
// Evaluator driven by the IndentationRules of a language configuration.
// Each pattern is compiled once, with the ECMAScript grammar, and a question
// is answered "yes" if its pattern is found anywhere in the text.  A
// pattern that does not compile throws indentproc::invalid_pattern from the
// constructor, naming the rule it was given for.
//

class IndentRulesSupport : public IndentRulesEvaluator {
private:
    optional<std::regex> increaseIndent;
    optional<std::regex> decreaseIndent;
    optional<std::regex> indentNextLine;
    optional<std::regex> unIndentedLine;

    static optional<std::regex> compile(
        char const * ruleName,
        optional<std::string> const & pattern
    );

    static bool test(optional<std::regex> const & regex, std::string const & text);

public:
    explicit IndentRulesSupport (IndentationRules const & rules);

public:
    bool shouldIncrease(std::string const & text) const override;

    bool shouldDecrease(std::string const & text) const override;

    bool shouldIndentNextLine(std::string const & text) const override;

    bool shouldIgnore(std::string const & text) const override;
};

} // end namespace indentproc

#endif

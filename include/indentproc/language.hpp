#ifndef INDENTPROC_LANGUAGE_HPP
#define INDENTPROC_LANGUAGE_HPP

//
// language.hpp
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
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"

namespace indentproc {

//
// BRACKET PAIRS
//

//
// Brackets are strings, not characters: Ruby has `do`/`end`, templating
// languages have `{%`/`%}`.  A pair may also accept more than one spelling
// for either side.
//

struct BracketPair {
    std::vector<std::string> open;
    std::vector<std::string> close;

    BracketPair (std::string const & open, std::string const & close) :
        open {open},
        close {close}
    {
    }

    BracketPair (
        std::vector<std::string> const & open,
        std::vector<std::string> const & close
    ) :
        open (open),
        close (close)
    {
    }
};


class BracketPairSet {
private:
    std::vector<BracketPair> pairs;

public:
    BracketPairSet ()
    {
    }

    BracketPairSet (std::vector<BracketPair> const & pairs) :
        pairs (pairs)
    {
    }

    BracketPairSet (std::initializer_list<BracketPair> pairs) :
        pairs (pairs)
    {
    }

    std::vector<BracketPair> const & getPairs() const {
        return pairs;
    }

    // Every open spelling of every pair, in pair order
    std::vector<std::string> getOpenBrackets() const;

    // Every close spelling of every pair, in pair order
    std::vector<std::string> getCloseBrackets() const;
};



//
// INDENTATION RULES
//

//
// Regular expression sources (ECMAScript grammar) that the rule evaluator
// tests against a processed line.  Any of them may be absent, in which case
// the corresponding question is always answered "no".
//

struct IndentationRules {
    optional<std::string> increaseIndentPattern;
    optional<std::string> decreaseIndentPattern;
    optional<std::string> indentNextLinePattern;
    optional<std::string> unIndentedLinePattern;
};


struct LanguageConfiguration {
    optional<BracketPairSet> brackets;
    optional<IndentationRules> indentationRules;
};



//
// LANGUAGE CONFIGURATION SERVICE
//

//
// What the processors need to know about a language.  It is an interface so
// an editor can answer from its own registry; LanguageConfigurationRegistry
// below is a straightforward in-memory implementation.
//
// No answer means the language has no bracket configuration, and lines in
// that language are passed through untouched.
//

class LanguageConfigurationService {
public:
    virtual optional<BracketPairSet> getBracketPairs(
        LanguageId const & languageId
    ) const = 0;

    virtual ~LanguageConfigurationService () {
    }
};


class LanguageConfigurationRegistry : public LanguageConfigurationService {
private:
    std::unordered_map<LanguageId, LanguageConfiguration> configurations;

public:
    LanguageConfigurationRegistry ()
    {
    }

    LanguageConfigurationRegistry (
        LanguageConfigurationRegistry const & other
    ) = delete;
    LanguageConfigurationRegistry & operator= (
        LanguageConfigurationRegistry const & other
    ) = delete;

public:
    // Returns true if an existing configuration was replaced
    bool registerLanguage(
        LanguageId const & languageId,
        LanguageConfiguration const & configuration
    );

    // Returns true if there was a configuration to remove
    bool unregisterLanguage(LanguageId const & languageId);

    bool hasLanguage(LanguageId const & languageId) const;

    optional<BracketPairSet> getBracketPairs(
        LanguageId const & languageId
    ) const override;

    optional<IndentationRules> getIndentationRules(
        LanguageId const & languageId
    ) const;
};

} // end namespace indentproc

#endif

#ifndef INDENTPROC_PROCESSED_RULES_HPP
#define INDENTPROC_PROCESSED_RULES_HPP

//
// processed-rules.hpp
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
#include "language.hpp"
#include "line-processor.hpp"
#include "model.hpp"
#include "rules.hpp"

namespace indentproc {

//
// PROCESSED INDENT RULES SUPPORT
//

//
// Asks an IndentRulesEvaluator about a line of the model, but hands it the
// processed line instead of the raw one, so that brackets in strings,
// comments and regular expressions never trigger a rule.
//
// Each question optionally takes the indentation the line *would* have,
// which replaces the line's own before the rule sees it.  This is how the
// editor asks "if I indented this line like so, would it then decrease?".
//
// All collaborators are borrowed and must outlive this object.
//

class ProcessedIndentRulesSupport {
private:
    IndentRulesEvaluator const & indentRulesSupport;
    IndentationLineProcessor indentationLineProcessor;

public:
    ProcessedIndentRulesSupport (
        TokenizedModel const & model,
        IndentRulesEvaluator const & indentRulesSupport,
        LanguageConfigurationService const & languageConfigurationService
    ) :
        indentRulesSupport (indentRulesSupport),
        indentationLineProcessor (model, languageConfigurationService)
    {
    }

public:
    bool shouldIncrease(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;

    bool shouldDecrease(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;

    bool shouldIgnore(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;

    bool shouldIndentNextLine(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;

    // All four answers as IndentConsts bits, from one processing of the line
    int getIndentMetadata(
        int lineNumber,
        optional<std::string> const & newIndentation = nullopt
    ) const;
};

} // end namespace indentproc

#endif

//
// processed-rules.cpp
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

#include "indentproc/processed-rules.hpp"


namespace indentproc {

bool ProcessedIndentRulesSupport::shouldIncrease(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    std::string processedLine = indentationLineProcessor.getProcessedLine(
        lineNumber, newIndentation
    );
    return indentRulesSupport.shouldIncrease(processedLine);
}


bool ProcessedIndentRulesSupport::shouldDecrease(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    std::string processedLine = indentationLineProcessor.getProcessedLine(
        lineNumber, newIndentation
    );
    return indentRulesSupport.shouldDecrease(processedLine);
}


bool ProcessedIndentRulesSupport::shouldIgnore(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    std::string processedLine = indentationLineProcessor.getProcessedLine(
        lineNumber, newIndentation
    );
    return indentRulesSupport.shouldIgnore(processedLine);
}


bool ProcessedIndentRulesSupport::shouldIndentNextLine(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    std::string processedLine = indentationLineProcessor.getProcessedLine(
        lineNumber, newIndentation
    );
    return indentRulesSupport.shouldIndentNextLine(processedLine);
}


int ProcessedIndentRulesSupport::getIndentMetadata(
    int lineNumber,
    optional<std::string> const & newIndentation
) const {
    std::string processedLine = indentationLineProcessor.getProcessedLine(
        lineNumber, newIndentation
    );
    return indentRulesSupport.getIndentMetadata(processedLine);
}

} // end namespace indentproc

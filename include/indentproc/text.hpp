#ifndef INDENTPROC_TEXT_HPP
#define INDENTPROC_TEXT_HPP

//
// text.hpp
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

namespace indentproc {

//
// TEXT HELPERS
//

//
// Leading whitespace is the run of spaces and tabs at the start of the
// line.  Other whitespace characters (form feeds, non-breaking spaces) are
// considered content, as the editor does when it computes indentation.
//

std::string getLeadingWhitespace(std::string const & line);


//
// Removes every non-overlapping occurrence of `needle` from `text`, scanning
// left to right.  Text that becomes adjacent because of a removal is *not*
// scanned again in the same call, so removing "ab" from "aabb" leaves "ab".
// The match is literal: a needle such as "[" or "${" has no special meaning.
// An empty needle leaves the text alone.
//

std::string removeAllOccurrences(
    std::string const & text,
    std::string const & needle
);


//
// Returns `line` with its leading whitespace replaced by `indentation`.  The
// leading whitespace is measured on `line` itself.
//

std::string replaceIndentation(
    std::string const & line,
    std::string const & indentation
);

} // end namespace indentproc

#endif

//
// text.cpp
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

#include "indentproc/text.hpp"


namespace indentproc {

std::string getLeadingWhitespace(std::string const & line) {
    std::string::size_type index = line.find_first_not_of(" \t");
    if (index == std::string::npos)
        return line;
    return line.substr(0, index);
}


std::string removeAllOccurrences(
    std::string const & text,
    std::string const & needle
) {
    if (needle.empty())
        return text;

    std::string result;
    result.reserve(text.size());

    std::string::size_type pos = 0;
    while (true) {
        std::string::size_type found = text.find(needle, pos);
        if (found == std::string::npos)
            break;
        result.append(text, pos, found - pos);
        pos = found + needle.size();
    }
    result.append(text, pos, std::string::npos);
    return result;
}


std::string replaceIndentation(
    std::string const & line,
    std::string const & indentation
) {
    std::string current = getLeadingWhitespace(line);
    return indentation + line.substr(current.size());
}

} // end namespace indentproc

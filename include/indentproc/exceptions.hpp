#ifndef INDENTPROC_EXCEPTIONS_HPP
#define INDENTPROC_EXCEPTIONS_HPP

//
// exceptions.hpp
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

#include <stdexcept>
#include <string>

//
// This is where to place any custom exceptions that are part of the contract
// between the library and the user, who may wish to catch these named
// exceptions and handle them.
//
// The processing itself does not fail: columns are clamped, and a language
// without configuration is simply passed through.  What *can* go wrong is
// the configuration that is handed in, e.g. an indentation rule that is not
// a valid regular expression.  Faults in the caller's model (such as asking
// for a line that does not exist) are the model's to report, and they are
// allowed to propagate as whatever the model throws.
//

namespace indentproc {


class invalid_pattern : public std::runtime_error {
private:
    std::string ruleName;
    std::string patternSource;

public:
    invalid_pattern (
        std::string const & rule,
        std::string const & pattern,
        std::string const & reason
    ) :
        std::runtime_error (
            "indentproc::invalid_pattern in " + rule
            + " /" + pattern + "/: " + reason
        ),
        ruleName (rule),
        patternSource (pattern)
    {
    }

    std::string const & rule() const noexcept {
        return ruleName;
    }

    std::string const & pattern() const noexcept {
        return patternSource;
    }
};

} // end namespace indentproc

#endif

#ifndef INDENTPROC_COMMON_HPP
#define INDENTPROC_COMMON_HPP

//
// common.hpp
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

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>



//
// UNREACHABLE CODE MACRO
//

//
// A few switches run over enumerations that are closed sets.  If a value
// outside the set ever shows up it means memory was scribbled on or a cast
// went wrong upstream.  Throwing a runtime error stops the code, which is
// better than guessing at a classification and producing a wrong answer.
//

#define UNREACHABLE_CODE() (throw std::runtime_error("Unreachable code"))




//
// INDENTPROC::OPTIONAL
//
// Several lookups have a legitimate "nothing here" answer: a language may
// have no bracket configuration, a caller may not want the indentation of
// a line replaced, a rule set may lack one of its four patterns.  These
// are not errors, so they are not exceptions, and an empty string or an
// empty vector would be ambiguous (an empty indentation string is a valid
// replacement, and means "strip the indentation").
//
// `std::optional` is not in C++11, so the library targets the draft that
// was borrowed by the standards committee:
//
//      https://github.com/akrzemi1/Optional
//
// Code in the library says `indentproc::optional` so that it can be
// re-aliased to `std::optional` on compilers that provide it.
//

#include "optional/optional.hpp"

namespace indentproc {

using nullopt_t = std::experimental::nullopt_t;

constexpr indentproc::nullopt_t nullopt{
    std::experimental::nullopt_t::init{}
};

using bad_optional_access = std::experimental::bad_optional_access;

template<typename T>
using optional = std::experimental::optional<T>;



//
// LANGUAGE IDENTIFIERS
//

//
// Languages are named by strings such as "html" or "javascript", as they
// are in the editor's language registry.  An empty string is never a
// registered language, and it is what a token stream with no tokens
// reports as its language.
//

using LanguageId = std::string;

} // end namespace indentproc

#endif // end include guard

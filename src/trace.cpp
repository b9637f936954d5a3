//
// trace.cpp
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

#include <iostream>

#include "indentproc/trace.hpp"


namespace indentproc {

#ifdef INDENTPROC_TRACE_DEFAULT_STDERR
std::ostream * Trace::osPtr = &std::cerr;
#else
std::ostream * Trace::osPtr = nullptr;
#endif

Printer trace;


std::ostream * Trace::setStream(std::ostream * os) {
    auto temp = osPtr;
    osPtr = os;
    return temp;
}


std::ostream * Trace::getStream() {
    return osPtr;
}

} // end namespace indentproc

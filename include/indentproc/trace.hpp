#ifndef INDENTPROC_TRACE_HPP
#define INDENTPROC_TRACE_HPP

//
// trace.hpp
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

#include <ostream>
#include <utility>

#include "common.hpp"

namespace indentproc {

///
/// TRACE STREAM HOOK
///

//
// When an indentation decision comes out wrong in an editor it is rarely
// obvious which fragment of context was missing.  So the processors report
// their decisions (e.g. "previous line skipped, language changed") to a
// stream you can hook up:
//
//     std::ostringstream log;
//     std::ostream * old = indentproc::Trace::setStream(&log);
//     ...
//     indentproc::Trace::setStream(old);
//
// By default there is no stream and tracing costs one pointer test.  If the
// library is built with INDENTPROC_TRACE_DEFAULT_STDERR the default stream
// is std::cerr instead.
//
// The hook is process global and is not synchronized, so install it before
// any processing starts.
//

class Trace {
private:
    static std::ostream * osPtr;

public:
    static std::ostream * setStream(std::ostream * os);

    static std::ostream * getStream();
};



///
/// VARIADIC PRINTER
///

//
// Writes its arguments to the trace stream separated by spaces, and ends
// the line:
//
//     indentproc::trace("previous line", lineNumber, "skipped");
//

class Printer {
public:
    Printer ()
    {
    }

    template <typename T>
    void writeArgs(std::ostream & os, bool, T && t) {
        os << std::forward<T>(t);
    }

    template <typename T, typename... Ts>
    void writeArgs(std::ostream & os, bool spaced, T && t, Ts &&... args) {
        writeArgs(os, spaced, std::forward<T>(t));
        if (spaced)
            os << " ";
        writeArgs(os, spaced, std::forward<Ts>(args)...);
    }

    template <typename... Ts>
    void corePrint(bool spaced, bool linefeed, Ts &&... args) {
        std::ostream * os = Trace::getStream();
        if (os == nullptr)
            return;

        writeArgs(*os, spaced, std::forward<Ts>(args)...);
        if (linefeed)
            *os << std::endl;
    }

    template <typename... Ts>
    void operator()(Ts &&... args) {
        corePrint(true, true, std::forward<Ts>(args)...);
    }

    ~Printer () {
    }
};

extern Printer trace;

} // end namespace indentproc

#endif

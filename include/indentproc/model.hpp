#ifndef INDENTPROC_MODEL_HPP
#define INDENTPROC_MODEL_HPP

//
// model.hpp
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

#include "tokens.hpp"

namespace indentproc {

//
// TOKENIZED TEXT MODEL
//

//
// The document as the processors see it: numbered lines that can be asked
// for their tokens.  The editor owns the text and the tokenizer, and the
// library only ever reads through this interface.
//
// Tokenization may be lazy.  forceTokenization() asks the model to bring
// the tokens of a line up to date before getLineTokens() is called, which
// can mean tokenizing every line above it first (a string or comment can
// be opened many lines earlier).  The call is synchronous.
//
// Line numbers are 1-based.  Asking for a line that does not exist is a
// precondition violation, and the model is free to throw whatever it likes;
// the library does not catch it.
//

class TokenizedModel {
public:
    virtual void forceTokenization(int lineNumber) = 0;

    virtual LineTokens getLineTokens(int lineNumber) const = 0;

    // The column after the last character of the line (length + 1)
    virtual int getLineMaxColumn(int lineNumber) const = 0;

    virtual ~TokenizedModel () {
    }
};

} // end namespace indentproc

#endif

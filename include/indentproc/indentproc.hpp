#ifndef INDENTPROC_INDENTPROC_HPP
#define INDENTPROC_INDENTPROC_HPP

//
// indentproc.hpp
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

//
// This is the main include file for using IndentProc in projects.  The
// individual headers can also be included on their own; an editor that only
// wants processed lines does not need the context processor, for instance.
//

#include "common.hpp"
#include "exceptions.hpp"
#include "range.hpp"
#include "text.hpp"
#include "tokens.hpp"
#include "scope.hpp"
#include "language.hpp"
#include "model.hpp"
#include "rules.hpp"
#include "line-processor.hpp"
#include "context-processor.hpp"
#include "processed-rules.hpp"

//
// HELPER TOOLS
//

#include "trace.hpp"

#endif

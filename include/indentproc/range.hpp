#ifndef INDENTPROC_RANGE_HPP
#define INDENTPROC_RANGE_HPP

//
// range.hpp
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

namespace indentproc {

//
// POSITION AND RANGE
//

//
// Line numbers and columns are 1-based, the way the editor reports them:
// the caret before the first character of the first line is (1, 1), and
// the caret after the last character of a line of length N is at column
// N + 1.  Character offsets into a line's text are 0-based, so code that
// goes from one to the other subtracts 1 from the column.
//

struct Position {
    int lineNumber;
    int column;

    Position () :
        lineNumber (1),
        column (1)
    {
    }

    Position (int lineNumber, int column) :
        lineNumber (lineNumber),
        column (column)
    {
    }

    bool operator==(Position const & other) const {
        return lineNumber == other.lineNumber and column == other.column;
    }

    bool operator!=(Position const & other) const {
        return not (*this == other);
    }
};


//
// A Range is always stored with its start before (or equal to) its end, so
// a selection made "backwards" by dragging up the document is normalized
// when the range is constructed.  A collapsed range is a caret.
//

class Range {
public:
    int startLineNumber;
    int startColumn;
    int endLineNumber;
    int endColumn;

public:
    Range (
        int startLine,
        int startCol,
        int endLine,
        int endCol
    ) :
        startLineNumber (startLine),
        startColumn (startCol),
        endLineNumber (endLine),
        endColumn (endCol)
    {
        if (
            startLine > endLine
            or (startLine == endLine and startCol > endCol)
        ) {
            startLineNumber = endLine;
            startColumn = endCol;
            endLineNumber = startLine;
            endColumn = startCol;
        }
    }

    Range (Position const & start, Position const & end) :
        Range (start.lineNumber, start.column, end.lineNumber, end.column)
    {
    }

    static Range caret(int lineNumber, int column) {
        return Range (lineNumber, column, lineNumber, column);
    }

    Position getStartPosition() const {
        return Position (startLineNumber, startColumn);
    }

    Position getEndPosition() const {
        return Position (endLineNumber, endColumn);
    }

    bool isEmpty() const {
        return startLineNumber == endLineNumber
            and startColumn == endColumn;
    }
};

} // end namespace indentproc

#endif

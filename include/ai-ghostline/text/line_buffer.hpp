/*
 * AI-Ghostline Line Buffer Model
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Value types describing an editor snapshot: cursor positions expressed in
 *   UTF-16 code units (the unit editors report columns in), ranges, and the
 *   line array where every line keeps its own terminator. Helpers split a
 *   flat string into lines and join them back losslessly.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <ostream>

namespace ghostline {

using Lines = std::vector<std::string>;

struct CursorPosition {
    std::size_t line = 0;       // zero-based line index
    std::size_t character = 0;  // UTF-16 code units from line start

    bool operator==(const CursorPosition& o) const { return line == o.line && character == o.character; }
    bool operator!=(const CursorPosition& o) const { return !(*this == o); }
    bool operator<(const CursorPosition& o) const {
        return line < o.line || (line == o.line && character < o.character);
    }
    bool operator<=(const CursorPosition& o) const { return !(o < *this); }
};

struct CursorRange {
    CursorPosition start;
    CursorPosition end;

    bool empty() const { return start == end; }
    bool operator==(const CursorRange& o) const { return start == o.start && end == o.end; }
    bool operator!=(const CursorRange& o) const { return !(*this == o); }
};

// What the editor integration hands us on every request.
struct EditorSnapshot {
    std::string content;
    Lines lines;
    std::string uti;                  // document type identifier, informational only
    CursorPosition cursor_position;
    std::vector<CursorRange> selections;
    int tab_size = 4;
    int indent_size = 4;
    bool uses_tabs_for_indentation = false;
};

// Builds a snapshot whose content and lines agree.
EditorSnapshot make_snapshot(const Lines& lines, CursorPosition cursor = {});
EditorSnapshot make_snapshot(const std::string& content, CursorPosition cursor = {});

// Splits keeping "\n" / "\r\n" attached to each line. Never yields a trailing empty line.
Lines split_lines(const std::string& content);
std::string join_lines(const Lines& lines);

bool has_terminator(const std::string& line);
// Line text without its terminator.
std::string strip_terminator(const std::string& line);
// "\r\n" if the first terminated line uses it, "\n" otherwise.
std::string detect_terminator(const Lines& lines);

// UTF-16 length of a UTF-8 string (terminator excluded when present).
std::size_t utf16_length(const std::string& line);
// Byte offset for a UTF-16 column, clamped to the end of the line text.
std::size_t utf16_to_byte_offset(const std::string& line, std::size_t character);

// Byte offset of `pos` in join_lines(lines). Positions past the last line map to the end.
std::size_t offset_of(const Lines& lines, const CursorPosition& pos);
// Inverse of offset_of; an offset right after a final terminator lands on line lines.size().
CursorPosition position_of(const Lines& lines, std::size_t offset);

std::ostream& operator<<(std::ostream& os, const CursorPosition& p);

} // namespace ghostline

/*
 * AI-Ghostline Line Modifications
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Line-granularity edit primitives (Insert, Delete, Replace) and the patch
 *   applicator that merges an ordered modification list into a line array in
 *   a single left-to-right pass. All ranges in one list refer to the lines of
 *   the buffer the list is applied to; the applicator tracks the shifting
 *   itself so callers never adjust indices.
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
#include <ai-ghostline/text/line_buffer.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ghostline {

// Half-open line interval [start, end).
struct LineRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - start; }
    bool contains(std::size_t line) const { return line >= start && line < end; }
    bool operator==(const LineRange& o) const { return start == o.start && end == o.end; }
};

struct Insert {
    std::size_t at_line = 0;  // new lines go before this index
    Lines new_lines;
    bool operator==(const Insert& o) const { return at_line == o.at_line && new_lines == o.new_lines; }
};

struct Delete {
    LineRange range;
    bool operator==(const Delete& o) const { return range == o.range; }
};

struct Replace {
    LineRange range;
    Lines new_lines;
    bool operator==(const Replace& o) const { return range == o.range && new_lines == o.new_lines; }
};

using Modification = std::variant<Insert, Delete, Replace>;
using Modifications = std::vector<Modification>;

// Thrown for overlapping, unsorted, inverted or out-of-bounds modification lists.
class MalformedPatch : public std::runtime_error {
public:
    MalformedPatch(std::size_t index, const std::string& reason);
    std::size_t index() const { return m_index; }
private:
    std::size_t m_index;
};

// Lines of the original buffer a modification consumes (empty range for Insert).
LineRange affected_range(const Modification& m);
// Net change in line count.
long line_delta(const Modification& m);
std::string describe(const Modification& m);

// Pure: returns the patched copy, throws MalformedPatch before producing anything.
Lines apply_modifications(const Lines& lines, const Modifications& mods);

// Minimal single-hunk patch turning `from` into `to` (empty if equal).
Modifications diff_lines(const Lines& from, const Lines& to);

} // namespace ghostline

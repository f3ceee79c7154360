/*
 * AI-Ghostline Suggestion Injector
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Renders a completion candidate as a comment-marked block of lines that
 *   sits below the code it completes, finds such blocks again in a buffer
 *   the user may have edited meanwhile, and computes the modifications that
 *   put a block in or take it out. The block opens with a C block-comment
 *   start line carrying "Suggestion i/n" and closes with a line that ends the
 *   comment and opens a line comment ("End of Suggestion"), so an editor shows
 *   the suggestion without any overlay support and the surrounding code still
 *   parses as it did.
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
#include <ai-ghostline/suggest/completion.hpp>
#include <ai-ghostline/text/line_buffer.hpp>
#include <ai-ghostline/text/modification.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ghostline {

extern const char* const kSuggestionStartMarker;
extern const char* const kSuggestionEndMarker;

// Where a block goes and what it takes to put it there.
struct Injection {
    std::size_t anchor = 0;        // index of the block's first line after injection
    Lines block;                   // markers + candidate text, every line terminated
    bool terminator_added = false; // line anchor-1 got a terminator so the block starts on its own line
    Modifications modifications;   // against the buffer passed to plan_injection
};

// Block lines for candidate `index` of `count`, using `terminator` for every line.
Lines render_block(const CompletionCandidate& candidate, std::size_t index, std::size_t count,
                   const std::string& terminator);

// Line the block for `range` is inserted before: just below the last line the range touches.
std::size_t anchor_for(const CursorRange& range, std::size_t line_count);

Injection plan_injection(const Lines& lines, const CompletionCandidate& candidate,
                         std::size_t index, std::size_t count);

bool is_block_start(const std::string& line);
bool is_block_end(const std::string& line);
// Every [start, end) span from a start marker through the matching end marker.
std::vector<LineRange> locate_blocks(const Lines& lines);
// True if `range` still holds a complete block in `lines`.
bool block_at(const Lines& lines, const LineRange& range);

// Modifications removing `block`; when `restore_terminator` and the block is the tail of
// the buffer, the terminator on the line above it is taken back off.
Modifications plan_removal(const Lines& lines, const LineRange& block, bool restore_terminator);

} // namespace ghostline

/*
 * AI-Ghostline Suggestion Handler
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Entry points the editor integration calls: present candidates as a
 *   suggestion block, reject it, accept it, or cycle to another candidate.
 *   Every call takes the editor's current snapshot and returns the new
 *   content together with the modifications (against the snapshot's lines)
 *   and the cursor to set, or nothing when there is nothing to do. The
 *   per-document presentation state lives in a PresentationStore owned by
 *   the caller; it is only written after the whole result was computed.
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
#include <ai-ghostline/suggest/presentation_store.hpp>
#include <ai-ghostline/text/line_buffer.hpp>
#include <ai-ghostline/text/modification.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace ghostline {

struct UpdatedContent {
    std::string content;
    Modifications modifications; // against the lines of the snapshot passed in
    CursorPosition new_cursor;
};

// What a suggestion panel shows for the active presentation.
struct SuggestionInfo {
    std::size_t start_line_index = 0;
    Lines code;                          // candidate text, one entry per line, no terminators
    std::size_t suggestion_count = 0;
    std::size_t current_suggestion_index = 0;
};

class SuggestionHandler {
public:
    explicit SuggestionHandler(PresentationStore& store) : m_store(store) {}

    std::optional<UpdatedContent> present_suggestions(const std::string& document,
                                                      const EditorSnapshot& editor,
                                                      const CompletionCandidates& candidates);
    std::optional<UpdatedContent> reject_suggestion(const std::string& document, const EditorSnapshot& editor);
    // Commits the shown candidate with the document's line endings. The cursor lands after the
    // committed text; when that text ends the buffer with a line terminator the cursor is
    // (lines.size(), 0), one past the last line.
    std::optional<UpdatedContent> accept_suggestion(const std::string& document, const EditorSnapshot& editor);
    std::optional<UpdatedContent> next_suggestion(const std::string& document, const EditorSnapshot& editor);
    std::optional<UpdatedContent> previous_suggestion(const std::string& document, const EditorSnapshot& editor);

    std::optional<SuggestionInfo> current_suggestion(const std::string& document) const;

private:
    struct Stripped {
        Lines lines;
        Modifications modifications;
        CursorPosition cursor;
        bool found = false;
    };
    Stripped strip(const Lines& lines, const PresentationState& state, CursorPosition cursor) const;
    std::optional<UpdatedContent> cycle(const std::string& document, const EditorSnapshot& editor, long step);

    PresentationStore& m_store;
};

// Cursor after `block` was deleted: inside -> start of the line above it, after -> moved up.
CursorPosition cursor_after_removal(CursorPosition cursor, const LineRange& block);
// Cursor after `count` lines were inserted before `anchor`.
CursorPosition cursor_after_insertion(CursorPosition cursor, std::size_t anchor, std::size_t count);

} // namespace ghostline

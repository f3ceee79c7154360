/*
 * AI-Ghostline Suggestion Handler
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <ai-ghostline/suggest/handler.hpp>
#include <ai-ghostline/suggest/injector.hpp>
#include <algorithm>

namespace ghostline {

static Lines lines_of(const EditorSnapshot& editor) {
    if (editor.lines.empty() && !editor.content.empty()) return split_lines(editor.content);
    return editor.lines;
}

// `text` with every line ending rewritten to `terminator`; an unterminated last line stays so.
static std::string with_terminator(const std::string& text, const std::string& terminator) {
    std::string out;
    for (auto& line : split_lines(text)) {
        out += strip_terminator(line);
        if (has_terminator(line)) out += terminator;
    }
    return out;
}

CursorPosition cursor_after_removal(CursorPosition cursor, const LineRange& block) {
    if (cursor.line < block.start) return cursor;
    if (block.contains(cursor.line)) {
        // every removed line from block.start up to the cursor row counts, which lands on the line above
        return {block.start == 0 ? 0 : block.start - 1, 0};
    }
    cursor.line -= block.size();
    return cursor;
}

CursorPosition cursor_after_insertion(CursorPosition cursor, std::size_t anchor, std::size_t count) {
    if (cursor.line >= anchor) cursor.line += count;
    return cursor;
}

SuggestionHandler::Stripped SuggestionHandler::strip(const Lines& lines, const PresentationState& state,
                                                     CursorPosition cursor) const {
    Stripped s;
    LineRange block{state.anchor_line_index, state.anchor_line_index + state.injected_line_count};
    if (!block_at(lines, block)) {
        auto blocks = locate_blocks(lines);
        if (blocks.empty()) {
            s.lines = lines;
            s.cursor = cursor;
            return s;
        }
        block = blocks.front();
    }
    s.modifications = plan_removal(lines, block, state.terminator_added);
    s.lines = apply_modifications(lines, s.modifications);
    s.cursor = cursor_after_removal(cursor, block);
    s.found = true;
    return s;
}

std::optional<UpdatedContent> SuggestionHandler::present_suggestions(const std::string& document,
                                                                     const EditorSnapshot& editor,
                                                                     const CompletionCandidates& candidates) {
    if (candidates.empty()) return std::nullopt;
    Lines original = lines_of(editor);
    Lines base = original;
    CursorPosition cursor = editor.cursor_position;
    bool replaced = false;
    if (auto* previous = m_store.find(document)) {
        Stripped s = strip(original, *previous, cursor);
        if (s.found) {
            base = std::move(s.lines);
            cursor = s.cursor;
            replaced = true;
        }
    }
    Injection inj = plan_injection(base, candidates.front(), 0, candidates.size());
    Lines presented = apply_modifications(base, inj.modifications);

    UpdatedContent out;
    out.content = join_lines(presented);
    out.modifications = replaced ? diff_lines(original, presented) : inj.modifications;
    out.new_cursor = cursor_after_insertion(cursor, inj.anchor, inj.block.size());

    PresentationState state;
    state.candidates = candidates;
    state.current_index = 0;
    state.anchor_line_index = inj.anchor;
    state.injected_line_count = inj.block.size();
    state.terminator_added = inj.terminator_added;
    m_store.put(document, std::move(state));
    return out;
}

std::optional<UpdatedContent> SuggestionHandler::reject_suggestion(const std::string& document,
                                                                   const EditorSnapshot& editor) {
    const PresentationState* state = m_store.find(document);
    if (!state) return std::nullopt;
    Stripped s = strip(lines_of(editor), *state, editor.cursor_position);
    UpdatedContent out{join_lines(s.lines), std::move(s.modifications), s.cursor};
    m_store.erase(document);
    return out;
}

std::optional<UpdatedContent> SuggestionHandler::accept_suggestion(const std::string& document,
                                                                   const EditorSnapshot& editor) {
    const PresentationState* state = m_store.find(document);
    if (!state) return std::nullopt;
    Lines original = lines_of(editor);
    Stripped s = strip(original, *state, editor.cursor_position);
    const CompletionCandidate& candidate = state->candidates[state->current_index];

    std::string content = join_lines(s.lines);
    size_t begin = offset_of(s.lines, candidate.range.start);
    size_t end = std::max(begin, offset_of(s.lines, candidate.range.end));
    std::string text = with_terminator(candidate.text, detect_terminator(s.lines));
    std::string committed = content.substr(0, begin) + text + content.substr(end);
    Lines result = split_lines(committed);

    UpdatedContent out;
    out.content = committed;
    out.modifications = diff_lines(original, result);
    out.new_cursor = position_of(result, begin + text.size());
    m_store.erase(document);
    return out;
}

std::optional<UpdatedContent> SuggestionHandler::next_suggestion(const std::string& document,
                                                                 const EditorSnapshot& editor) {
    return cycle(document, editor, 1);
}

std::optional<UpdatedContent> SuggestionHandler::previous_suggestion(const std::string& document,
                                                                     const EditorSnapshot& editor) {
    return cycle(document, editor, -1);
}

std::optional<UpdatedContent> SuggestionHandler::cycle(const std::string& document, const EditorSnapshot& editor,
                                                       long step) {
    const PresentationState* state = m_store.find(document);
    if (!state) return std::nullopt;
    long count = static_cast<long>(state->candidates.size());
    size_t index = static_cast<size_t>(((static_cast<long>(state->current_index) + step) % count + count) % count);

    Lines original = lines_of(editor);
    Stripped s = strip(original, *state, editor.cursor_position);
    Injection inj = plan_injection(s.lines, state->candidates[index], index, state->candidates.size());
    Lines presented = apply_modifications(s.lines, inj.modifications);

    UpdatedContent out;
    out.content = join_lines(presented);
    out.modifications = diff_lines(original, presented);
    out.new_cursor = cursor_after_insertion(s.cursor, inj.anchor, inj.block.size());

    PresentationState next = *state;
    next.current_index = index;
    next.anchor_line_index = inj.anchor;
    next.injected_line_count = inj.block.size();
    next.terminator_added = inj.terminator_added;
    m_store.put(document, std::move(next));
    return out;
}

std::optional<SuggestionInfo> SuggestionHandler::current_suggestion(const std::string& document) const {
    const PresentationState* state = m_store.find(document);
    if (!state) return std::nullopt;
    SuggestionInfo info;
    info.start_line_index = state->anchor_line_index;
    for (auto& line : split_lines(state->candidates[state->current_index].text)) {
        info.code.push_back(strip_terminator(line));
    }
    info.suggestion_count = state->candidates.size();
    info.current_suggestion_index = state->current_index;
    return info;
}

} // namespace ghostline

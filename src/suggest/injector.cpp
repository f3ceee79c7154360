/*
 * AI-Ghostline Suggestion Injector
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <ai-ghostline/suggest/injector.hpp>
#include <algorithm>

namespace ghostline {

const char* const kSuggestionStartMarker = "/*========== Suggestion";
const char* const kSuggestionEndMarker = "*///======== End of Suggestion";

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

Lines render_block(const CompletionCandidate& candidate, std::size_t index, std::size_t count,
                   const std::string& terminator) {
    Lines block;
    block.push_back(std::string(kSuggestionStartMarker) + " " + std::to_string(index + 1) + "/"
                    + std::to_string(count) + terminator);
    for (auto& line : split_lines(candidate.text)) {
        block.push_back(strip_terminator(line) + terminator);
    }
    block.push_back(std::string(kSuggestionEndMarker) + terminator);
    return block;
}

std::size_t anchor_for(const CursorRange& range, std::size_t line_count) {
    if (line_count == 0) return 0;
    size_t last = std::max(range.start.line, range.end.line);
    return std::min(last, line_count - 1) + 1;
}

Injection plan_injection(const Lines& lines, const CompletionCandidate& candidate,
                         std::size_t index, std::size_t count) {
    Injection inj;
    std::string term = detect_terminator(lines);
    inj.anchor = anchor_for(candidate.range, lines.size());
    inj.block = render_block(candidate, index, count, term);
    if (inj.anchor > 0 && inj.anchor == lines.size() && !has_terminator(lines[inj.anchor - 1])) {
        // last line is unterminated; give it one or the start marker would be glued to it
        inj.modifications.push_back(Replace{{inj.anchor - 1, inj.anchor}, {lines[inj.anchor - 1] + term}});
        inj.terminator_added = true;
    }
    inj.modifications.push_back(Insert{inj.anchor, inj.block});
    return inj;
}

bool is_block_start(const std::string& line) { return starts_with(line, kSuggestionStartMarker); }
bool is_block_end(const std::string& line) { return starts_with(line, kSuggestionEndMarker); }

std::vector<LineRange> locate_blocks(const Lines& lines) {
    std::vector<LineRange> blocks;
    bool open = false;
    size_t start = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_block_start(lines[i])) {
            open = true; start = i; // an unterminated earlier start is dropped
        } else if (open && is_block_end(lines[i])) {
            blocks.push_back({start, i + 1});
            open = false;
        }
    }
    return blocks;
}

bool block_at(const Lines& lines, const LineRange& range) {
    if (range.end > lines.size() || range.size() < 2) return false;
    if (!is_block_start(lines[range.start]) || !is_block_end(lines[range.end - 1])) return false;
    for (size_t i = range.start + 1; i + 1 < range.end; ++i) {
        if (is_block_start(lines[i]) || is_block_end(lines[i])) return false;
    }
    return true;
}

Modifications plan_removal(const Lines& lines, const LineRange& block, bool restore_terminator) {
    Modifications mods;
    if (restore_terminator && block.start > 0 && block.end == lines.size()
        && has_terminator(lines[block.start - 1])) {
        mods.push_back(Replace{{block.start - 1, block.start}, {strip_terminator(lines[block.start - 1])}});
    }
    mods.push_back(Delete{block});
    return mods;
}

} // namespace ghostline

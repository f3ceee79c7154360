/*
 * Completion candidate - AI-Ghostline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-ghostline/text/line_buffer.hpp>
#include <string>
#include <vector>

namespace ghostline {

// One proposed suggestion. Range is in the document as it was before any presentation.
struct CompletionCandidate {
    std::string text;          // replacement text, may span lines
    CursorRange range;         // zero width for pure insertion
    std::string display_text;  // optional short form shown by panels
    std::string uuid;          // provider id, empty if none

    bool operator==(const CompletionCandidate& o) const {
        return text == o.text && range == o.range && display_text == o.display_text && uuid == o.uuid;
    }
};

using CompletionCandidates = std::vector<CompletionCandidate>;

} // namespace ghostline

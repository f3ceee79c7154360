/*
 * Presentation state store - AI-Ghostline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-ghostline/suggest/completion.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace ghostline {

// What is currently rendered in one document.
struct PresentationState {
    CompletionCandidates candidates;     // cycle order
    std::size_t current_index = 0;
    std::size_t anchor_line_index = 0;   // first block line in the presented buffer
    std::size_t injected_line_count = 0; // block size, markers included
    bool terminator_added = false;
};

// At most one presentation per document id. Not thread safe: callers serialize per document.
class PresentationStore {
public:
    PresentationStore() = default;
    const PresentationState* find(const std::string& document) const;
    bool contains(const std::string& document) const { return find(document) != nullptr; }
    void put(const std::string& document, PresentationState state); // replaces wholesale
    bool erase(const std::string& document);
    std::size_t size() const { return m_states.size(); }
    void clear() { m_states.clear(); }
private:
    std::map<std::string, PresentationState> m_states;
};

} // namespace ghostline

#include <ai-ghostline/suggest/presentation_store.hpp>

namespace ghostline {

const PresentationState* PresentationStore::find(const std::string& document) const {
    auto it = m_states.find(document);
    return it == m_states.end() ? nullptr : &it->second;
}

void PresentationStore::put(const std::string& document, PresentationState state) {
    m_states[document] = std::move(state);
}

bool PresentationStore::erase(const std::string& document) {
    return m_states.erase(document) > 0;
}

} // namespace ghostline

#pragma once
#include <ai-ghostline/config.hpp>
#include <ai-ghostline/suggest/completion.hpp>
#include <ai-ghostline/text/line_buffer.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ghostline::ai {

// Shared flag: copies observe the same cancellation.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() const { m_flag->store(true); }
    bool cancelled() const { return m_flag->load(); }
private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// Produces candidates for a snapshot, best first. nullopt on failure or cancellation.
class CompletionSource {
public:
    virtual ~CompletionSource() = default;
    virtual std::optional<CompletionCandidates> fetch(const EditorSnapshot& editor,
                                                      const CancellationToken& token) = 0;
};

// Reads candidates from cfg.stub_file (see parse_stub_candidates).
class StubCompletionSource : public CompletionSource {
public:
    explicit StubCompletionSource(const GhostlineConfig& cfg) : m_cfg(cfg) {}
    std::optional<CompletionCandidates> fetch(const EditorSnapshot& editor, const CancellationToken& token) override;
private:
    GhostlineConfig m_cfg;
};

// OpenAI-compatible /v1/completions client (prompt = text before cursor, suffix = after). Requires libcurl.
class HttpCompletionSource : public CompletionSource {
public:
    explicit HttpCompletionSource(const GhostlineConfig& cfg) : m_cfg(cfg) {}
    std::optional<CompletionCandidates> fetch(const EditorSnapshot& editor, const CancellationToken& token) override;
private:
    GhostlineConfig m_cfg;
};

// Stub format: "@@ <sl>:<sc>-<el>:<ec>" starts a candidate, the lines below up to the next
// header are its text (the newline ending the last of them is not part of it). Data without
// any header is a single zero-width candidate at `cursor`.
CompletionCandidates parse_stub_candidates(const std::string& data, CursorPosition cursor);

std::string escape_json(const std::string& in);
std::string build_completion_request(const GhostlineConfig& cfg, const std::string& prompt,
                                     const std::string& suffix);
// Every choices[].text of a completions response, JSON escapes decoded.
std::vector<std::string> extract_choice_texts(const std::string& response);

std::unique_ptr<CompletionSource> make_completion_source(const GhostlineConfig& cfg);

} // namespace ghostline::ai

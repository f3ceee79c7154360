#include <ai-ghostline/ai/completion_source.hpp>
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace ghostline::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
static int curl_progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<const CancellationToken*>(userdata);
    return token->cancelled() ? 1 : 0;
}

std::optional<CompletionCandidates> HttpCompletionSource::fetch(const EditorSnapshot& editor,
                                                                const CancellationToken& token) {
    if (token.cancelled()) return std::nullopt;
    const char* env_key = nullptr;
    if (!m_cfg.api_key_env.empty()) env_key = std::getenv(m_cfg.api_key_env.c_str());
    std::string key = (env_key && *env_key) ? env_key : m_cfg.api_key;
    if (key.empty()) {
        if (m_cfg.debug) {
            std::cerr << "[ghostline] no API key"
                      << (m_cfg.api_key_env.empty() ? std::string() : " (env " + m_cfg.api_key_env + " unset)") << "\n";
        }
        return std::nullopt;
    }
    std::string endpoint = m_cfg.endpoint.empty() ? "https://api.openai.com/v1/completions" : m_cfg.endpoint;

    Lines lines = editor.lines.empty() ? split_lines(editor.content) : editor.lines;
    std::string content = join_lines(lines);
    size_t split = offset_of(lines, editor.cursor_position);
    std::string body = build_completion_request(m_cfg, content.substr(0, split), content.substr(split));

    CURL* curl = curl_easy_init();
    if (!curl) {
        if (m_cfg.debug) std::cerr << "[ghostline] curl init failed\n";
        return std::nullopt;
    }
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_cfg.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curl_progress_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth = std::string("Authorization: Bearer ") + key;
    headers = curl_slist_append(headers, auth.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    auto res = curl_easy_perform(curl);
    long code = 0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        if (m_cfg.debug) std::cerr << "[ghostline] request cancelled\n";
        return std::nullopt;
    }
    if (res != CURLE_OK || code/100 != 2) {
        if (m_cfg.debug) {
            std::cerr << "[ghostline] completion request failed: " << curl_easy_strerror(res)
                      << " code=" << code << "\n";
        }
        return std::nullopt;
    }
    CompletionCandidates candidates;
    for (auto& text : extract_choice_texts(response)) {
        if (text.empty()) continue;
        CompletionCandidate c;
        c.text = text;
        c.range = {editor.cursor_position, editor.cursor_position};
        c.uuid = "http-" + std::to_string(candidates.size() + 1);
        candidates.push_back(c);
    }
    if (m_cfg.debug) std::cerr << "[ghostline] http: " << candidates.size() << " candidate(s)\n";
    return candidates;
}

} // namespace ghostline::ai

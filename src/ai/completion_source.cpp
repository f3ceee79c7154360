#include <ai-ghostline/ai/completion_source.hpp>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <iostream>

namespace ghostline::ai {

static bool parse_header(const std::string& line, CursorRange& range) {
    unsigned long sl=0, sc=0, el=0, ec=0;
    if (line.rfind("@@", 0) != 0) return false;
    if (std::sscanf(line.c_str() + 2, " %lu:%lu-%lu:%lu", &sl, &sc, &el, &ec) != 4) return false;
    range.start = {sl, sc};
    range.end = {el, ec};
    return true;
}

CompletionCandidates parse_stub_candidates(const std::string& data, CursorPosition cursor) {
    CompletionCandidates out;
    bool any_header = false;
    auto finish = [&](){
        if (out.empty()) return;
        std::string& t = out.back().text;
        if (!t.empty() && t.back()=='\n') { t.pop_back(); if (!t.empty() && t.back()=='\r') t.pop_back(); }
    };
    for (auto& line : split_lines(data)) {
        CursorRange r;
        if (parse_header(strip_terminator(line), r)) {
            finish();
            any_header = true;
            CompletionCandidate c; c.range = r; c.uuid = "stub-" + std::to_string(out.size() + 1);
            out.push_back(c);
            continue;
        }
        if (any_header) out.back().text += line;
    }
    finish();
    if (!any_header && !data.empty()) {
        CompletionCandidate c; c.text = data; c.range = {cursor, cursor}; c.uuid = "stub-1";
        out.push_back(c);
    }
    return out;
}

std::optional<CompletionCandidates> StubCompletionSource::fetch(const EditorSnapshot& editor,
                                                                const CancellationToken& token) {
    if (token.cancelled()) return std::nullopt;
    if (m_cfg.stub_file.empty()) return std::nullopt;
    std::ifstream in(m_cfg.stub_file);
    if (!in) {
        if (m_cfg.debug) std::cerr << "[ghostline] stub file not readable: " << m_cfg.stub_file << "\n";
        return std::nullopt;
    }
    std::ostringstream oss; oss << in.rdbuf();
    auto candidates = parse_stub_candidates(oss.str(), editor.cursor_position);
    if (m_cfg.debug) std::cerr << "[ghostline] stub: " << candidates.size() << " candidate(s)\n";
    return candidates;
}

std::string escape_json(const std::string& in) {
    std::string out; out.reserve(in.size()+32);
    for(char c: in){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf,sizeof(buf),"\\u%04x", (unsigned char)c); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string build_completion_request(const GhostlineConfig& cfg, const std::string& prompt,
                                     const std::string& suffix) {
    std::ostringstream body;
    body << "{\"model\":\"" << escape_json(cfg.model.empty()?"gpt-3.5-turbo-instruct":cfg.model) << "\","
         << "\"prompt\":\"" << escape_json(prompt) << "\","
         << "\"suffix\":\"" << escape_json(suffix) << "\","
         << "\"max_tokens\":" << cfg.max_tokens << ",\"temperature\":" << cfg.temperature
         << ",\"n\":" << (cfg.candidates > 0 ? cfg.candidates : 1) << "}";
    return body.str();
}

static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) out.push_back(static_cast<char>(cp));
    else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else if (cp < 0x10000) { out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else { out.push_back(static_cast<char>(0xF0 | (cp >> 18))); out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
}

static unsigned read_hex4(const std::string& s, size_t pos) {
    if (pos + 4 > s.size()) return 0xFFFD;
    unsigned v = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i]; v <<= 4;
        if (c >= '0' && c <= '9') v |= c - '0';
        else if (c >= 'a' && c <= 'f') v |= c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') v |= c - 'A' + 10;
        else return 0xFFFD;
    }
    return v;
}

// Decodes the JSON string starting at the opening quote `q`; `end` receives the index past the closing quote.
static std::string decode_json_string(const std::string& s, size_t q, size_t& end) {
    std::string out;
    size_t i = q + 1;
    while (i < s.size()) {
        char c = s[i];
        if (c == '"') { end = i + 1; return out; }
        if (c != '\\') { out.push_back(c); ++i; continue; }
        if (i + 1 >= s.size()) break;
        char e = s[i+1];
        i += 2;
        switch (e) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                unsigned cp = read_hex4(s, i); i += 4;
                if (cp >= 0xD800 && cp < 0xDC00 && i + 6 <= s.size() && s[i]=='\\' && s[i+1]=='u') {
                    unsigned lo = read_hex4(s, i + 2);
                    if (lo >= 0xDC00 && lo < 0xE000) { cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00); i += 6; }
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(e); // \" \\ \/
        }
    }
    end = s.size();
    return out;
}

std::vector<std::string> extract_choice_texts(const std::string& response) {
    std::vector<std::string> texts;
    size_t choices = response.find("\"choices\"");
    if (choices == std::string::npos) return texts;
    size_t pos = response.find('[', choices);
    while (pos != std::string::npos) {
        size_t key = response.find("\"text\"", pos);
        if (key == std::string::npos) break;
        size_t colon = response.find(':', key);
        if (colon == std::string::npos) break;
        size_t q = colon + 1;
        while (q < response.size() && std::isspace((unsigned char)response[q])) ++q;
        if (q >= response.size() || response[q] != '"') { pos = colon; continue; }
        size_t end = q;
        texts.push_back(decode_json_string(response, q, end));
        pos = end;
    }
    return texts;
}

std::unique_ptr<CompletionSource> make_completion_source(const GhostlineConfig& cfg) {
    if (cfg.source == "http") return std::make_unique<HttpCompletionSource>(cfg);
    return std::make_unique<StubCompletionSource>(cfg);
}

} // namespace ghostline::ai

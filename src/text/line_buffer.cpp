/*
 * AI-Ghostline Line Buffer Model
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <ai-ghostline/text/line_buffer.hpp>

namespace ghostline {

EditorSnapshot make_snapshot(const Lines& lines, CursorPosition cursor) {
    EditorSnapshot s;
    s.lines = lines;
    s.content = join_lines(lines);
    s.cursor_position = cursor;
    return s;
}

EditorSnapshot make_snapshot(const std::string& content, CursorPosition cursor) {
    EditorSnapshot s;
    s.content = content;
    s.lines = split_lines(content);
    s.cursor_position = cursor;
    return s;
}

Lines split_lines(const std::string& content) {
    Lines out;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(content.substr(start));
            break;
        }
        out.push_back(content.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return out;
}

std::string join_lines(const Lines& lines) {
    size_t total = 0;
    for (auto& l : lines) total += l.size();
    std::string out;
    out.reserve(total);
    for (auto& l : lines) out += l;
    return out;
}

bool has_terminator(const std::string& line) {
    return !line.empty() && line.back() == '\n';
}

std::string strip_terminator(const std::string& line) {
    size_t n = line.size();
    if (n && line[n-1] == '\n') {
        --n;
        if (n && line[n-1] == '\r') --n;
    }
    return line.substr(0, n);
}

std::string detect_terminator(const Lines& lines) {
    for (auto& l : lines) {
        if (!has_terminator(l)) continue;
        return (l.size() >= 2 && l[l.size()-2] == '\r') ? "\r\n" : "\n";
    }
    return "\n";
}

// Byte length of the UTF-8 sequence starting with lead byte c (1 for invalid bytes).
static size_t utf8_seq_len(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

std::size_t utf16_length(const std::string& line) {
    std::string text = strip_terminator(line);
    size_t units = 0;
    for (size_t i = 0; i < text.size();) {
        size_t len = utf8_seq_len(static_cast<unsigned char>(text[i]));
        units += (len == 4) ? 2 : 1; // astral plane -> surrogate pair
        i += len;
    }
    return units;
}

std::size_t utf16_to_byte_offset(const std::string& line, std::size_t character) {
    std::string text = strip_terminator(line);
    size_t units = 0, i = 0;
    while (i < text.size() && units < character) {
        size_t len = utf8_seq_len(static_cast<unsigned char>(text[i]));
        units += (len == 4) ? 2 : 1;
        i += len;
    }
    return i < text.size() ? i : text.size();
}

std::size_t offset_of(const Lines& lines, const CursorPosition& pos) {
    size_t off = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i == pos.line) return off + utf16_to_byte_offset(lines[i], pos.character);
        off += lines[i].size();
    }
    return off;
}

CursorPosition position_of(const Lines& lines, std::size_t offset) {
    size_t off = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (offset < off + lines[i].size()) {
            std::string head = lines[i].substr(0, offset - off);
            return {i, utf16_length(head)};
        }
        off += lines[i].size();
    }
    if (!lines.empty() && !has_terminator(lines.back())) {
        return {lines.size() - 1, utf16_length(lines.back())};
    }
    return {lines.size(), 0};
}

std::ostream& operator<<(std::ostream& os, const CursorPosition& p) {
    return os << "(" << p.line << "," << p.character << ")";
}

} // namespace ghostline

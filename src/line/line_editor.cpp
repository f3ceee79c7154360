/*
 * Command prompt implementation
 */
#include <ai-ghostline/line/line_editor.hpp>
#include <termios.h>
#include <unistd.h>
#include <cstdio>

namespace ghostline {

namespace {

// Non-canonical, no-echo input for the lifetime of the object; leaves a non-tty stdin alone.
class RawMode {
public:
    RawMode() {
        if (tcgetattr(STDIN_FILENO, &m_saved) != 0) return;
        struct termios t = m_saved;
        t.c_lflag &= ~(ICANON | ECHO);
        t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
        m_active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &t) == 0;
    }
    ~RawMode() { if (m_active) tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_saved); }
    RawMode(const RawMode&) = delete;
    RawMode& operator=(const RawMode&) = delete;
private:
    struct termios m_saved{};
    bool m_active = false;
};

int read_key() {
    unsigned char c;
    return read(STDIN_FILENO, &c, 1) == 1 ? c : -1;
}

void out(const std::string& s) {
    if (::write(STDOUT_FILENO, s.data(), s.size()) < 0) std::perror("write");
}

} // namespace

std::vector<std::string> CommandPrompt::matches(const std::string& word) const {
    std::vector<std::string> found;
    for (auto& c : m_commands) if (c.rfind(word, 0) == 0) found.push_back(c);
    return found;
}

std::string CommandPrompt::read_line(const std::string& prompt, bool& eof) {
    eof = false;
    RawMode raw;
    out(prompt);
    std::string buf;
    size_t hist = m_history.size();
    auto show = [&](const std::string& line) {
        out("\r" + std::string(prompt.size() + buf.size(), ' ') + "\r" + prompt + line);
        buf = line;
    };
    for (;;) {
        int k = read_key();
        if (k == -1) { eof = true; return ""; }
        switch (k) {
        case '\n': case '\r':
            out("\n");
            if (!buf.empty()) m_history.push_back(buf);
            return buf;
        case 3: // Ctrl-C
            out("^C\n");
            return "";
        case 4: // Ctrl-D
            if (!buf.empty()) break;
            out("\n"); eof = true;
            return "";
        case 127: case 8:
            if (!buf.empty()) { buf.pop_back(); out("\b \b"); }
            break;
        case '\t': {
            if (buf.find(' ') != std::string::npos) break; // arguments are not completed
            auto found = matches(buf);
            if (found.size() == 1) {
                std::string add = found[0].substr(buf.size()) + " ";
                buf += add; out(add);
            } else if (found.size() > 1) {
                out("\n");
                for (auto& m : found) out(m + "  ");
                out("\n" + prompt + buf);
            }
            break;
        }
        case 27: // ESC [ A / ESC [ B
            if (read_key() != '[') break;
            switch (read_key()) {
            case 'A': if (hist > 0) show(m_history[--hist]); break;
            case 'B':
                if (hist < m_history.size()) { ++hist; show(hist == m_history.size() ? "" : m_history[hist]); }
                break;
            }
            break;
        default:
            if (k >= 32 && k < 127) { buf.push_back(static_cast<char>(k)); out(std::string(1, static_cast<char>(k))); }
        }
    }
}

} // namespace ghostline

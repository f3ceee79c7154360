// AI-Ghostline main: inline suggestion session over one file
#include <ai-ghostline/ai/completion_source.hpp>
#include <ai-ghostline/config.hpp>
#include <ai-ghostline/line/line_editor.hpp>
#include <ai-ghostline/suggest/handler.hpp>
#include <ai-ghostline/suggest/injector.hpp>
#include <ai-ghostline/suggest/presentation_store.hpp>
#include <ai-ghostline/text/line_buffer.hpp>
#include <ai-ghostline/text/modification.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace ghostline;

static GhostlineConfig g_cfg;

static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static const char* kCommands[] = {"suggest","accept","reject","next","prev","cursor","show","info","write","help","quit"};

struct Session {
    std::string path;
    Lines lines;
    CursorPosition cursor;
};

static void print_help() {
    std::cout << "Commands:\n"
              << "  suggest [L[:C]]  fetch candidates at the cursor (or L:C) and present them\n"
              << "  accept | reject  commit or discard the presented suggestion\n"
              << "  next | prev      cycle through candidates\n"
              << "  cursor L C       move the cursor\n"
              << "  show | info      print the buffer / the active suggestion\n"
              << "  write [path]     save the buffer\n"
              << "  quit\n";
}

static void show(const Session& s) {
    bool in_block = false;
    for (size_t i = 0; i < s.lines.size(); ++i) {
        std::string text = strip_terminator(s.lines[i]);
        if (is_block_start(s.lines[i])) in_block = true;
        char num[16]; std::snprintf(num, sizeof(num), "%4zu%c ", i, i == s.cursor.line ? '>' : ' ');
        std::cout << apply_color(num, "90") << (in_block ? apply_color(text, "2;36") : text) << "\n";
        if (is_block_end(s.lines[i])) in_block = false;
    }
    std::cout << "cursor " << s.cursor << "\n";
}

static void apply(Session& s, const std::optional<UpdatedContent>& res, const char* what) {
    if (!res) { std::cout << what << ": nothing to do\n"; return; }
    try {
        Lines next = apply_modifications(s.lines, res->modifications);
        if (g_cfg.debug) {
            for (auto& m : res->modifications) std::cerr << "[ghostline] " << describe(m) << "\n";
            if (join_lines(next) != res->content) std::cerr << "[ghostline] content mismatch after " << what << "\n";
        }
        s.lines = std::move(next);
        s.cursor = res->new_cursor;
        std::cout << what << ": " << res->modifications.size() << " modification(s), cursor " << s.cursor << "\n";
    } catch (const MalformedPatch& e) {
        std::cerr << what << ": " << e.what() << "\n";
    }
}

static bool write_file(const std::string& path, const Lines& lines) {
    std::ofstream out(path, std::ios::binary);
    if (!out) { std::perror(path.c_str()); return false; }
    out << join_lines(lines);
    return static_cast<bool>(out);
}

static bool parse_position(const std::string& arg, CursorPosition& pos) {
    unsigned long l=0, c=0;
    int n = std::sscanf(arg.c_str(), "%lu:%lu", &l, &c);
    if (n < 1) return false;
    pos.line = l; pos.character = (n == 2) ? c : 0;
    return true;
}

// Returns false when the session should end.
static bool run_command(const std::string& line, Session& s, SuggestionHandler& handler,
                        ai::CompletionSource& source) {
    std::istringstream iss(line); std::string cmd; iss >> cmd;
    if (cmd.empty()) return true;
    EditorSnapshot snap = make_snapshot(s.lines, s.cursor);
    if (cmd == "quit" || cmd == "exit") return false;
    if (cmd == "help") { print_help(); return true; }
    if (cmd == "show") { show(s); return true; }
    if (cmd == "cursor") {
        unsigned long l=0, c=0;
        if (!(iss >> l >> c)) { std::cerr << "usage: cursor L C\n"; return true; }
        s.cursor = {l, c};
        return true;
    }
    if (cmd == "suggest") {
        std::string arg; iss >> arg;
        if (!arg.empty() && !parse_position(arg, snap.cursor_position)) { std::cerr << "bad position: " << arg << "\n"; return true; }
        ai::CancellationToken token;
        auto candidates = source.fetch(snap, token);
        if (!candidates) { std::cerr << "completion source failed" << (g_cfg.debug ? "" : " (run with --debug for details)") << "\n"; return true; }
        apply(s, handler.present_suggestions(s.path, snap, *candidates), "suggest");
        return true;
    }
    if (cmd == "accept") { apply(s, handler.accept_suggestion(s.path, snap), "accept"); return true; }
    if (cmd == "reject") { apply(s, handler.reject_suggestion(s.path, snap), "reject"); return true; }
    if (cmd == "next") { apply(s, handler.next_suggestion(s.path, snap), "next"); return true; }
    if (cmd == "prev") { apply(s, handler.previous_suggestion(s.path, snap), "prev"); return true; }
    if (cmd == "info") {
        auto info = handler.current_suggestion(s.path);
        if (!info) { std::cout << "no active suggestion\n"; return true; }
        std::cout << "suggestion " << info->current_suggestion_index + 1 << "/" << info->suggestion_count
                  << " at line " << info->start_line_index << "\n";
        for (auto& l : info->code) std::cout << "  " << apply_color(l, "36") << "\n";
        return true;
    }
    if (cmd == "write") {
        std::string path; iss >> path;
        if (path.empty()) path = s.path;
        if (write_file(path, s.lines)) std::cout << "written " << path << "\n";
        return true;
    }
    std::cerr << "unknown command: " << cmd << " (try 'help')\n";
    return true;
}

int main(int argc, char* argv[]) {
    std::string config_path = default_config_path();
    std::string file;
    bool batch = false, debug = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--debug" || a == "-d") debug = true;
        else if (a == "--batch" || a == "-b") batch = true;
        else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (file.empty()) file = a;
        else { std::cerr << "unexpected argument: " << a << "\n"; return 2; }
    }
    if (file.empty()) {
        std::cerr << "Usage: ai-ghostline [--config FILE] [--debug] [--batch] <file>" << std::endl;
        return 2;
    }
    g_cfg = load_config(config_path);
    if (debug) g_cfg.debug = true;
    if (batch || !isatty(STDOUT_FILENO)) g_cfg.color = false;

    Session s;
    s.path = file;
    {
        std::ifstream in(file, std::ios::binary);
        if (!in) { std::perror(file.c_str()); return 1; }
        std::ostringstream oss; oss << in.rdbuf();
        s.lines = split_lines(oss.str());
    }

    PresentationStore store;
    SuggestionHandler handler(store);
    auto source = ai::make_completion_source(g_cfg);
    if (g_cfg.debug) {
        std::cerr << "[ghostline] source=" << g_cfg.source << " lines=" << s.lines.size()
                  << " config=" << (config_path.empty() ? "(none)" : config_path) << "\n";
    }

    if (batch) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line[0] == '#') continue;
            if (!run_command(line, s, handler, *source)) break;
        }
        return 0;
    }

    std::cout << apply_color("AI-Ghostline","1;36") << " " << file << " (" << s.lines.size() << " lines)\n";
    std::cout << "Type 'help' for commands, 'quit' to leave.\n";
    CommandPrompt prompt(std::vector<std::string>(std::begin(kCommands), std::end(kCommands)));
    while (true) {
        bool eof = false;
        std::string line = prompt.read_line(apply_color("ghostline> ", "32"), eof);
        if (eof) break;
        if (line.empty()) continue;
        if (!run_command(line, s, handler, *source)) break;
    }
    return 0;
}

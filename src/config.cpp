#include <ai-ghostline/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace ghostline {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static bool truthy(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

void parse_config(std::istream& in, GhostlineConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq));
        auto val = trim(line.substr(eq + 1));
        try {
            if (key == "color") cfg.color = truthy(val);
            else if (key == "debug") cfg.debug = truthy(val);
            else if (key == "source") cfg.source = val;
            else if (key == "endpoint") cfg.endpoint = val;
            else if (key == "model") cfg.model = val;
            else if (key == "api_key_env") cfg.api_key_env = val;
            else if (key == "api_key") cfg.api_key = val;
            else if (key == "stub_file") cfg.stub_file = val;
            else if (key == "max_tokens") cfg.max_tokens = std::stoi(val);
            else if (key == "temperature") cfg.temperature = std::stod(val);
            else if (key == "timeout_seconds") cfg.timeout_seconds = std::stoi(val);
            else if (key == "candidates") cfg.candidates = std::stoi(val);
        } catch (const std::invalid_argument&) {
            // keep default
        } catch (const std::out_of_range&) {
            // keep default
        }
    }
}

GhostlineConfig load_config(const std::string& path) {
    GhostlineConfig cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path);
    if (!in) return cfg;
    parse_config(in, cfg);
    return cfg;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return std::string();
    return std::string(home) + "/.ai-ghostlinerc";
}

} // namespace ghostline

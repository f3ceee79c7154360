/*
 * Configuration - AI-Ghostline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <istream>
#include <string>

namespace ghostline {

struct GhostlineConfig {
    bool color = true;
    bool debug = false;               // diagnostics on stderr
    std::string source = "stub";      // stub|http
    std::string endpoint;             // HTTP completions endpoint
    std::string model;                // model id
    std::string api_key_env;          // env var containing key
    std::string api_key;              // direct key (prefer env)
    std::string stub_file;            // canned candidates for offline use
    int max_tokens = 128;
    double temperature = 0.2;
    int timeout_seconds = 20;
    int candidates = 3;               // how many completions to ask for
};

// key=value lines, '#' comments; unknown keys ignored, bad numbers keep the default.
void parse_config(std::istream& in, GhostlineConfig& cfg);
// Missing file leaves defaults untouched.
GhostlineConfig load_config(const std::string& path);
// $HOME/.ai-ghostlinerc, empty if HOME is unset.
std::string default_config_path();

} // namespace ghostline

/*
 * Generator configuration implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/config/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace shellgen {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static bool parse_bool(const std::string& val, bool& out) {
    if (val=="1"||val=="true"||val=="on") { out = true; return true; }
    if (val=="0"||val=="false"||val=="off") { out = false; return true; }
    return false;
}

bool apply_config_line(GeneratorConfig& cfg, const std::string& raw, std::string& error) {
    std::string line = trim(raw);
    if (line.empty() || line[0]=='#') return true;
    auto eq = line.find('=');
    if (eq == std::string::npos) { error = "missing '=' in: " + line; return false; }
    std::string key = trim(line.substr(0, eq)), val = trim(line.substr(eq + 1));
    if (key=="mode") {
        if (val=="multiline") cfg.mode = RenderMode::MultiLine;
        else if (val=="linear") cfg.mode = RenderMode::SingleLine;
        else { error = "mode: expected multiline or linear, got " + val; return false; }
    } else if (key=="output") {
        if (val.empty()) { error = "output: empty path"; return false; }
        cfg.output = val;
    } else if (key=="verbose") {
        if (!parse_bool(val, cfg.verbose)) { error = "verbose: not a boolean: " + val; return false; }
    } else if (key=="stop_on_failure") {
        if (!parse_bool(val, cfg.stop_on_failure)) { error = "stop_on_failure: not a boolean: " + val; return false; }
    } else {
        error = "unknown key: " + key;
        return false;
    }
    return true;
}

// Applies every line of `in`; a warning reads "<where><line number>: <error>".
static void apply_config_stream(std::istream& in, GeneratorConfig& cfg, const std::string& where,
                                std::vector<std::string>& warnings) {
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string error;
        if (!apply_config_line(cfg, line, error)) warnings.push_back(where + std::to_string(lineno) + ": " + error);
    }
}

GeneratorConfig parse_config(std::istream& in, std::vector<std::string>& warnings) {
    GeneratorConfig cfg;
    apply_config_stream(in, cfg, "line ", warnings);
    return cfg;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return "";
    return std::string(home) + "/.shell-genrc";
}

bool load_config(const std::string& path, GeneratorConfig& cfg, std::vector<std::string>& warnings) {
    if (path.empty()) return false;
    std::ifstream in(path);
    if (!in) return false;
    apply_config_stream(in, cfg, path + ":", warnings);
    return true;
}

} // namespace shellgen

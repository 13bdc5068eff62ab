/*
 * Generator configuration - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Settings of the generator front end, read from $HOME/.shell-genrc
 *   (key=value lines, '#' comments) and then overridden by command-line
 *   flags. Booleans accept 1/true/on.
 */
#pragma once
#include <istream>
#include <string>
#include <vector>
#include <shell-gen/render/render.hpp>

namespace shellgen {

struct GeneratorConfig {
    RenderMode mode = RenderMode::MultiLine; // mode=multiline|linear
    std::string output = "-";                // output path, "-" for stdout
    bool verbose = false;                    // report progress on stderr
    bool stop_on_failure = false;            // prepend "set -e"
};

// Applies one "key=value" line. Blank lines and comments are accepted.
// Returns false with a message in `error` for unknown keys or bad values.
bool apply_config_line(GeneratorConfig& cfg, const std::string& line, std::string& error);

// Reads every line; problems are collected in `warnings` and skipped.
GeneratorConfig parse_config(std::istream& in, std::vector<std::string>& warnings);

// $HOME/.shell-genrc, or empty when HOME is not set.
std::string default_config_path();

// Loads `path` over `cfg`. A missing file is not an error.
bool load_config(const std::string& path, GeneratorConfig& cfg, std::vector<std::string>& warnings);

} // namespace shellgen

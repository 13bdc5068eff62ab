/*
 * Shell-Gen demo generator
 * Builds one of the bundled demo scripts and writes it to stdout or a file.
 * Settings come from $HOME/.shell-genrc, then from the command line.
 */
#include <shell-gen/config/config.hpp>
#include <shell-gen/control/control.hpp>
#include <shell-gen/demo/demos.hpp>
#include <shell-gen/render/render.hpp>
#include <shell-gen/script/error.hpp>
#include <shell-gen/script/script.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace shellgen;

static void usage() {
    std::cerr << "Usage: shell-gen-demo [--linear|--multiline] [-o FILE] [-e] [-v] <name>\n";
    std::cerr << "       shell-gen-demo --list" << std::endl;
}

int main(int argc, char* argv[]) {
    GeneratorConfig cfg;
    std::vector<std::string> warnings;
    std::string rc = default_config_path();
    load_config(rc, cfg, warnings);
    for (auto& w : warnings) std::cerr << "shell-gen: " << w << '\n';

    std::string name;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--linear") cfg.mode = RenderMode::SingleLine;
        else if (a == "--multiline") cfg.mode = RenderMode::MultiLine;
        else if (a == "-v" || a == "--verbose") cfg.verbose = true;
        else if (a == "-e" || a == "--stop-on-failure") cfg.stop_on_failure = true;
        else if (a == "-o" || a == "--output") {
            if (i + 1 >= argc) { usage(); return 1; }
            cfg.output = argv[++i];
        } else if (a == "--list") {
            for (auto& n : demo::names()) std::cout << n << '\n';
            return 0;
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "shell-gen: unknown option " << a << '\n';
            usage();
            return 1;
        } else {
            name = a;
        }
    }
    if (name.empty()) { usage(); return 1; }

    Block demo = demo::lookup(name);
    if (!demo) { std::cerr << "shell-gen: no demo named " << name << '\n'; return 1; }
    if (cfg.verbose) {
        std::cerr << "shell-gen: building " << name
                  << " (" << (cfg.mode == RenderMode::MultiLine ? "multiline" : "linear") << ")";
        if (!rc.empty()) std::cerr << " config=" << rc;
        std::cerr << std::endl;
    }

    std::string text;
    try {
        ScriptResult built = run_script(Env{}, [&](Script& s) {
            if (cfg.stop_on_failure) stop_on_failure(s, true);
            demo(s);
        });
        if (cfg.verbose) {
            std::cerr << "shell-gen: " << built.exprs.size() << " top-level nodes, "
                      << built.env.vars().size() << " variables, "
                      << built.env.funcs().size() << " functions" << std::endl;
        }
        text = render(cfg.mode, built.exprs);
        if (cfg.mode == RenderMode::SingleLine) text += '\n';
    } catch (const ScriptError& e) {
        std::cerr << "shell-gen: " << e.what() << std::endl;
        return 1;
    }

    if (cfg.output == "-") {
        std::cout << text;
        std::cout.flush();
        return 0;
    }
    std::ofstream out(cfg.output);
    if (!out) { std::perror(("open " + cfg.output).c_str()); return 1; }
    out << text;
    if (!out) { std::perror(("write " + cfg.output).c_str()); return 1; }
    if (cfg.verbose) std::cerr << "shell-gen: wrote " << cfg.output << std::endl;
    return 0;
}

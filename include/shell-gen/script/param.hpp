/*
 * Command parameters - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Param is the single conversion point for everything that can be passed
 *   to a command: text (quoted), Val (shown, unquoted), variables (quoted
 *   expansion), WithVar, pre-quoted text (as is), captured Output and
 *   arithmetic expressions. Conversion is deferred until the command is
 *   added, because variable expansions and captured output need the
 *   environment at that point.
 */
#pragma once
#include <functional>
#include <string>
#include <vector>
#include <shell-gen/arith/arith.hpp>
#include <shell-gen/quote/quote.hpp>
#include <shell-gen/script/script.hpp>
#include <shell-gen/var/var.hpp>

namespace shellgen {

// The output of a sub-script, passed as "$(...)".
struct Output {
    Block block;
};

class Param {
public:
    Param(const char* text);
    Param(const std::string& text);
    Param(const Quoted& q);
    Param(const UntypedVar& v);
    Param(const Output& out);
    Param(const Arith& a);

    template <typename T>
    Param(const Val<T>& v)
        : m_render([text = show(v)](Env&) { return text; }),
          m_in_quotes([text = escape_double_quoted(show(v)).text()](Env&) { return text; }) {}

    template <typename T>
    Param(const Var<T>& v) : Param(v.untyped()) {}

    template <typename T>
    Param(const WithVar<T>& w)
        : m_render([inner = Param(w.var), modify = w.modify](Env& env) {
              return modify(Quoted(inner.render(env))).text();
          }) {}

    std::string render(Env& env) const { return m_render(env); }

    // Text for a position that is already inside double quotes, such as the
    // word of "${v:-word}". Falls back to render() for pre-quoted text.
    std::string render_in_double_quotes(Env& env) const {
        return m_in_quotes ? m_in_quotes(env) : m_render(env);
    }

private:
    std::function<std::string(Env&)> m_render;
    std::function<std::string(Env&)> m_in_quotes;
};

// Adds a command: every word is rendered and joined with spaces.
void cmd_list(Script& s, const Param& command, const std::vector<Param>& params);

template <typename... Ps>
void cmd(Script& s, const Param& command, const Ps&... params) {
    cmd_list(s, command, std::vector<Param>{Param(params)...});
}

// Adds a command built from plain text; every word is quoted.
void run(Script& s, const std::string& command, const std::vector<std::string>& args = {});

} // namespace shellgen

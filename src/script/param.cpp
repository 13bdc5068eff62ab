/*
 * Command parameters implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/script/param.hpp>
#include <shell-gen/render/render.hpp>

namespace shellgen {

// Plain text between double quotes. A '}' would end an enclosing ${...}
// early; a command substitution is skipped when that brace is matched.
static std::string text_in_double_quotes(const std::string& text) {
    if (text.find('}') != std::string::npos) return "$(printf %s " + quote(text).text() + ")";
    return escape_double_quoted(text).text();
}

// "$(...)" body of a captured block; the nested run allocates from, and
// hands back, the same environment.
static std::string substitute(const Block& block, Env& env) {
    Script nested(std::move(env));
    try {
        block(nested);
    } catch (...) {
        env = nested.take_env();
        throw;
    }
    env = nested.take_env();
    return "$(" + linearize(nested.exprs()) + ")";
}

Param::Param(const char* text) : Param(std::string(text)) {}

Param::Param(const std::string& text)
    : m_render([q = quote(text).text()](Env&) { return q; }),
      m_in_quotes([t = text_in_double_quotes(text)](Env&) { return t; }) {}

Param::Param(const Quoted& q) : m_render([t = q.text()](Env&) { return t; }) {}

Param::Param(const UntypedVar& v)
    : m_render([v](Env& env) { return "\"" + v.expand(env).text() + "\""; }),
      m_in_quotes([v](Env& env) { return v.expand(env).text(); }) {}

Param::Param(const Output& out)
    : m_render([block = out.block](Env& env) { return "\"" + substitute(block, env) + "\""; }),
      m_in_quotes([block = out.block](Env& env) { return substitute(block, env); }) {}

Param::Param(const Arith& a)
    : m_render([a](Env& env) { return "\"$((" + format_arith(env, a) + "))\""; }),
      m_in_quotes([a](Env& env) { return "$((" + format_arith(env, a) + "))"; }) {}

void cmd_list(Script& s, const Param& command, const std::vector<Param>& params) {
    std::string text = command.render(s.env());
    for (auto& p : params) text += " " + p.render(s.env());
    s.add(make_cmd(std::move(text)));
}

void run(Script& s, const std::string& command, const std::vector<std::string>& args) {
    std::string text = quote(command).text();
    for (auto& a : args) text += " " + quote(a).text();
    s.add(make_cmd(std::move(text)));
}

} // namespace shellgen

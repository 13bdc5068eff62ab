/*
 * Script builder implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/script/script.hpp>
#include <iterator>

namespace shellgen {

void Script::add_all(std::vector<Expr> exprs) {
    m_exprs.insert(m_exprs.end(), std::make_move_iterator(exprs.begin()), std::make_move_iterator(exprs.end()));
}

std::vector<Expr> Script::capture(const Block& block) {
    Script nested(std::move(m_env));
    try {
        block(nested);
    } catch (...) {
        m_env = nested.take_env();
        throw;
    }
    m_env = nested.take_env();
    return nested.take_exprs();
}

ScriptResult run_script(Env env, const Block& block) {
    Script s(std::move(env));
    block(s);
    ScriptResult r;
    r.exprs = s.take_exprs();
    r.env = s.take_env();
    return r;
}

std::vector<Expr> gen(const Block& block) {
    return run_script(Env{}, block).exprs;
}

Block sequence(Block first, Block second) {
    return [first = std::move(first), second = std::move(second)](Script& s) {
        first(s);
        second(s);
    };
}

void comment(Script& s, const std::string& text) {
    s.add(make_comment(text));
}

} // namespace shellgen

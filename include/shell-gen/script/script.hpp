/*
 * Script builder - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A Script owns the naming environment of one build and the list of
 *   expressions emitted so far. Builder steps are callables taking the
 *   Script; sub-builders are run with capture(), which hands the same
 *   environment to the nested run and takes it back afterwards, so names
 *   allocated inside loop, conditional and function bodies stay unique
 *   across the whole script.
 */
#pragma once
#include <functional>
#include <utility>
#include <vector>
#include <shell-gen/script/ast.hpp>
#include <shell-gen/script/env.hpp>

namespace shellgen {

class Script;

// A builder step producing no value.
using Block = std::function<void(Script&)>;

// A builder step producing a value for the next step.
template <typename T>
using Step = std::function<T(Script&)>;

class Script {
public:
    Script() = default;
    explicit Script(Env env) : m_env(std::move(env)) {}

    Script(const Script&) = delete;
    Script& operator=(const Script&) = delete;

    void add(Expr e) { m_exprs.push_back(std::move(e)); }
    void add_all(std::vector<Expr> exprs);

    Env& env() { return m_env; }
    const Env& env() const { return m_env; }
    const std::vector<Expr>& exprs() const { return m_exprs; }

    // Runs `block` against this script's environment and returns what it
    // emitted, without adding it here.
    std::vector<Expr> capture(const Block& block);

    std::vector<Expr> take_exprs() { return std::move(m_exprs); }
    Env take_env() { return std::move(m_env); }

private:
    Env m_env;
    std::vector<Expr> m_exprs;
};

struct ScriptResult {
    std::vector<Expr> exprs;
    Env env;
};

// Runs a finished builder once, starting from `env`.
ScriptResult run_script(Env env, const Block& block);

// Runs a builder from an empty environment and keeps only its expressions.
std::vector<Expr> gen(const Block& block);

// Sequential composition: runs `first`, feeds its result to `next` and runs
// the step that returns. Both emit into the same script, in order.
template <typename A, typename B>
Step<B> bind(Step<A> first, std::function<Step<B>(A)> next) {
    return [first = std::move(first), next = std::move(next)](Script& s) -> B {
        A value = first(s);
        return next(std::move(value))(s);
    };
}

// bind for steps without a result.
Block sequence(Block first, Block second);

// Adds a comment that is embedded in the generated script.
void comment(Script& s, const std::string& text);

} // namespace shellgen

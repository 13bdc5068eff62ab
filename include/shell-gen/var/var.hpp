/*
 * Shell variables - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A variable is a reference to shell state: an allocated name plus the
 *   way it expands. Plain variables expand to $name; modified variables
 *   (defaulted, trimmed, length) carry their own expander and only read the
 *   base name when a command is built. Var<T> tags the handle with the type
 *   of value it is meant to hold.
 */
#pragma once
#include <functional>
#include <string>
#include <utility>
#include <shell-gen/quote/quote.hpp>
#include <shell-gen/script/env.hpp>

namespace shellgen {

class UntypedVar {
public:
    using Expander = std::function<Quoted(Env&, const std::string&)>;

    explicit UntypedVar(std::string name) : m_name(std::move(name)) {}
    UntypedVar(std::string name, Expander expander)
        : m_name(std::move(name)), m_expander(std::move(expander)) {}

    const std::string& name() const { return m_name; }

    // Unquoted expansion text, e.g. $name or ${name:-x}.
    Quoted expand(Env& env) const {
        if (m_expander) return m_expander(env, m_name);
        return Quoted("$" + m_name);
    }

    // True when the variable expands to something other than $name.
    bool is_modified() const { return static_cast<bool>(m_expander); }

private:
    std::string m_name;
    Expander m_expander;
};

template <typename T>
class Var {
public:
    using value_type = T;

    explicit Var(UntypedVar v) : m_var(std::move(v)) {}

    const std::string& name() const { return m_var.name(); }
    const UntypedVar& untyped() const { return m_var; }
    Quoted expand(Env& env) const { return m_var.expand(env); }

private:
    UntypedVar m_var;
};

// Re-tags a variable. Unchecked: reserved for operations that change what
// a variable means without changing how it is represented.
template <typename B, typename A>
Var<B> unsafe_cast_var(const Var<A>& v) { return Var<B>(v.untyped()); }

// Passes a variable to a command after rewriting its quoted expansion,
// e.g. prefixing a directory.
template <typename T>
struct WithVar {
    Var<T> var;
    std::function<Quoted(Quoted)> modify;
};

// True for names usable in an assignment: [A-Za-z_][A-Za-z0-9_]*.
bool is_identifier(const std::string& name);

// $@ : the parameters of the script, or of the enclosing function.
template <typename T = std::string>
Var<T> positional_parameters() { return Var<T>(UntypedVar("@")); }

} // namespace shellgen

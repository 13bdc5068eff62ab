/*
 * Naming environment - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Records every variable and function name handed out while a script is
 *   built, and allocates fresh names from an optional hint. Names are never
 *   released, so a name stays unique across the whole emitted script even
 *   when the fragment that allocated it is later dropped.
 */
#pragma once
#include <optional>
#include <set>
#include <string>

namespace shellgen {

enum class NameKind { Variable, Function };

// Optional suggestion for the generated name; only letters are kept.
struct NameHint {
    std::optional<std::string> text;
};

inline NameHint named_like(std::string text) { return NameHint{std::move(text)}; }

class Env {
public:
    // "_" is reserved up front: bash rewrites $_ after every command.
    Env() { m_vars.insert("_"); }

    // Returns "_" + letters of the hint (or "v"/"p") + a numeric suffix when
    // the plain candidate is already taken. The name is recorded. Because "_"
    // is reserved, a variable hint without letters yields "_2", not "_".
    std::string allocate(NameKind kind, const NameHint& hint = {});

    bool has_var(const std::string& name) const { return m_vars.count(name) != 0; }
    bool has_func(const std::string& name) const { return m_funcs.count(name) != 0; }
    void add_var(const std::string& name) { m_vars.insert(name); }

    const std::set<std::string>& vars() const { return m_vars; }
    const std::set<std::string>& funcs() const { return m_funcs; }

private:
    std::set<std::string> m_vars;
    std::set<std::string> m_funcs;
};

} // namespace shellgen

/*
 * Variable operations implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/var/variables.hpp>
#include <shell-gen/script/error.hpp>
#include <cctype>

namespace shellgen {

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        bool ok = std::isalpha(c) || c == '_' || (i > 0 && std::isdigit(c));
        if (!ok) return false;
    }
    return true;
}

static void require_assignable(const UntypedVar& v, const char* what) {
    if (v.is_modified()) throw ScriptError(std::string(what) + ": cannot assign to derived variable " + v.name());
    if (!is_identifier(v.name())) throw ScriptError(std::string(what) + ": cannot assign to special parameter $" + v.name());
}

namespace detail {

UntypedVar new_var_unsafe(Script& s, const NameHint& hint) {
    return UntypedVar(s.env().allocate(NameKind::Variable, hint));
}

UntypedVar new_var_containing(Script& s, const Quoted& value, const NameHint& hint) {
    UntypedVar v = new_var_unsafe(s, hint);
    s.add(make_cmd(v.name() + "=" + value.text()));
    return v;
}

UntypedVar global_var(Script& s, const std::string& name) {
    if (!is_identifier(name)) throw ScriptError("global_var: not a variable name: " + name);
    s.env().add_var(name);
    return UntypedVar(name);
}

UntypedVar take_parameter(Script& s, const NameHint& hint) {
    UntypedVar v = new_var_unsafe(s, hint);
    s.add(make_cmd(v.name() + "=\"$1\""));
    s.add(make_cmd("shift"));
    return v;
}

void set_var(Script& s, const UntypedVar& v, const Param& p) {
    require_assignable(v, "set_var");
    s.add(make_cmd(v.name() + "=" + p.render(s.env())));
}

UntypedVar modify_var(Script& s, const UntypedVar& v, const std::string& op, const Param& p) {
    // ${${x:-a}:-b} is not shell syntax
    if (v.is_modified()) throw ScriptError("cannot modify derived variable " + v.name() + " again");
    UntypedVar fresh = new_var_unsafe(s, named_like(v.name()));
    std::string base = v.name();
    return UntypedVar(fresh.name(), [base, op, p](Env& env, const std::string&) {
        return Quoted("${" + base + op + p.render_in_double_quotes(env) + "}");
    });
}

UntypedVar length_var(Script& s, const UntypedVar& v) {
    if (v.name() == "@" && !v.is_modified()) return UntypedVar("#");
    UntypedVar fresh = new_var_unsafe(s, named_like(v.name()));
    if (!v.is_modified()) {
        std::string base = v.name();
        return UntypedVar(fresh.name(), [base](Env&, const std::string&) { return Quoted("${#" + base + "}"); });
    }
    // ${#${x:-y}} is not shell syntax: copy the expansion into a temporary
    // inside a command substitution and take the length of that.
    UntypedVar tmp = new_var_containing(s, Quoted(), named_like("tmp"));
    std::string tname = tmp.name();
    return UntypedVar(fresh.name(), [tname, v](Env& env, const std::string&) {
        std::string inner = tname + "=" + Param(v).render(env) + "; echo ${#" + tname + "}";
        return Quoted("${" + tname + ":-$(" + inner + ")}");
    });
}

UntypedVar trim_var(Script& s, Greediness g, Direction d, const UntypedVar& v, const Quoted& pattern) {
    if (!v.is_modified() && !is_identifier(v.name()))
        throw ScriptError("trim_var: cannot trim special parameter $" + v.name());
    const bool longest = (g == Greediness::LongestMatch);
    std::string op;
    if (d == Direction::FromBeginning) op = longest ? "##" : "#";
    else op = longest ? "%%" : "%";
    return modify_var(s, v, op, Param(pattern));
}

} // namespace detail

void read_var(Script& s, const Var<std::string>& v) {
    require_assignable(v.untyped(), "read_var");
    s.add(make_cmd("read " + quote(v.name()).text()));
}

} // namespace shellgen

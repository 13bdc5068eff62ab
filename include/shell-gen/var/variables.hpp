/*
 * Variable operations - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Creating, assigning and reading shell variables, and deriving modified
 *   variables (${v:-x}, ${v#pat}, ${#v}, ...). Misuse, such as assigning to
 *   a derived variable or trimming a special parameter, throws ScriptError
 *   at the call.
 */
#pragma once
#include <string>
#include <shell-gen/quote/quote.hpp>
#include <shell-gen/script/param.hpp>
#include <shell-gen/script/script.hpp>
#include <shell-gen/var/var.hpp>

namespace shellgen {

enum class Greediness { ShortestMatch, LongestMatch };
enum class Direction { FromBeginning, FromEnd };

namespace detail {

// Allocates a name without emitting anything; the caller must emit code
// that sets it.
UntypedVar new_var_unsafe(Script& s, const NameHint& hint);
UntypedVar new_var_containing(Script& s, const Quoted& value, const NameHint& hint);
UntypedVar global_var(Script& s, const std::string& name);
UntypedVar take_parameter(Script& s, const NameHint& hint);
void set_var(Script& s, const UntypedVar& v, const Param& p);
// Derived variable expanding to ${<name><op><param>}.
UntypedVar modify_var(Script& s, const UntypedVar& v, const std::string& op, const Param& p);
UntypedVar length_var(Script& s, const UntypedVar& v);
UntypedVar trim_var(Script& s, Greediness g, Direction d, const UntypedVar& v, const Quoted& pattern);

} // namespace detail

// A new, unset variable (emits "name=").
template <typename T = std::string>
Var<T> new_var(Script& s, const NameHint& hint = {}) {
    return Var<T>(detail::new_var_containing(s, Quoted(), hint));
}

inline Var<std::string> new_var_containing(Script& s, const std::string& value, const NameHint& hint = {}) {
    return Var<std::string>(detail::new_var_containing(s, quote(value), hint));
}

template <typename T>
Var<T> new_var_containing(Script& s, const Val<T>& value, const NameHint& hint = {}) {
    return Var<T>(detail::new_var_containing(s, quote(value), hint));
}

template <typename T>
void set_var(Script& s, const Var<T>& v, const Param& p) { detail::set_var(s, v.untyped(), p); }

// Refers to an existing variable such as PATH; reserves the name.
template <typename T = std::string>
Var<T> global_var(Script& s, const std::string& name) { return Var<T>(detail::global_var(s, name)); }

// Moves $1 into a new variable and shifts the positional parameters.
template <typename T = std::string>
Var<T> take_parameter(Script& s, const NameHint& hint = {}) {
    return Var<T>(detail::take_parameter(s, hint));
}

// Reads a line of stdin into the variable.
void read_var(Script& s, const Var<std::string>& v);

// ${v:-p}: the value of v, or p when v is empty.
template <typename T>
Var<T> default_var(Script& s, const Var<T>& v, const Param& p) {
    return Var<T>(detail::modify_var(s, v.untyped(), ":-", p));
}

// ${v:+p}: empty when v is empty, p otherwise.
template <typename T>
Var<T> when_var(Script& s, const Var<T>& v, const Param& p) {
    return Var<T>(detail::modify_var(s, v.untyped(), ":+", p));
}

// ${v:?p}: the value of v; aborts the script with message p when v is empty.
template <typename T>
Var<T> err_unless_var(Script& s, const Var<T>& v, const Param& p) {
    return Var<T>(detail::modify_var(s, v.untyped(), ":?", p));
}

// Length of the expansion of v. For positional_parameters() it is the
// number of parameters ($#).
template <typename T>
Var<int> length_var(Script& s, const Var<T>& v) { return Var<int>(detail::length_var(s, v.untyped())); }

// Removes `pattern` (possibly a glob()) from one end of the value.
template <typename T = std::string>
Var<T> trim_var(Script& s, Greediness g, Direction d, const Var<std::string>& v, const Quoted& pattern) {
    return Var<T>(detail::trim_var(s, g, d, v.untyped(), pattern));
}

} // namespace shellgen

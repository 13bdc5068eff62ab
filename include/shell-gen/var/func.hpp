/*
 * Shell functions - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <utility>
#include <shell-gen/script/param.hpp>
#include <shell-gen/script/script.hpp>

namespace shellgen {

// Handle of a defined shell function; calling it emits "name params...".
class Func {
public:
    explicit Func(std::string name) : m_name(std::move(name)) {}

    const std::string& name() const { return m_name; }

    template <typename... Ps>
    void operator()(Script& s, const Ps&... params) const {
        cmd(s, Quoted(m_name), params...);
    }

private:
    std::string m_name;
};

// Defines a function with a fresh name ("_" + letters of the hint, or "_p").
// The body is built against the script's environment, so its variable names
// do not collide with the caller's. Inside the body positional_parameters()
// are the function's arguments.
Func func(Script& s, const NameHint& hint, const Block& body);

} // namespace shellgen

/*
 * Demo scripts - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <shell-gen/script/script.hpp>
#include <shell-gen/var/var.hpp>

namespace shellgen::demo {

// Emits a loop computing a Fibonacci-like sequence up to `n`; returns the
// variable holding the result.
Var<long long> fib(Script& s, const Var<long long>& n);

// fib.sh: prints fib($1).
void fib_script(Script& s);

// hohoho.sh: defines a function that greets $1 times and calls it twice.
void hohoho_script(Script& s);

// Names accepted by lookup().
std::vector<std::string> names();

// The builder of a demo, or an empty Block for an unknown name.
Block lookup(const std::string& name);

} // namespace shellgen::demo

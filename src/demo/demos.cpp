/*
 * Demo scripts implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/demo/demos.hpp>
#include <shell-gen/arith/arith.hpp>
#include <shell-gen/control/control.hpp>
#include <shell-gen/script/param.hpp>
#include <shell-gen/var/func.hpp>
#include <shell-gen/var/variables.hpp>

namespace shellgen::demo {

Var<long long> fib(Script& s, const Var<long long>& n) {
    auto prev = new_var_containing(s, val(1LL));
    auto acc = new_var_containing(s, val(1LL));
    for_cmd(s, [&](Script& src) { cmd(src, "seq", prev, n); },
            [&](Script& body, const Var<std::string>&) {
                set_var(body, acc, Arith::var(acc) + Arith::var(prev));
                set_var(body, prev, Arith::var(acc) - Arith::var(prev));
            });
    return acc;
}

void fib_script(Script& s) {
    auto n = take_parameter<long long>(s);
    auto result = fib(s, n);
    cmd(s, "echo", result);
}

void hohoho_script(Script& s) {
    Func hohoho = func(s, named_like("hohoho"), [](Script& f) {
        auto num = take_parameter<int>(f);
        for_cmd(f, [&](Script& src) { cmd(src, "seq", "1", num); },
                [](Script& body, const Var<std::string>&) { cmd(body, "echo", "Ho, ho, ho!", "Merry xmas!"); });
    });
    hohoho(s, val(1));
    cmd(s, "echo", "And I heard him exclaim, ere he rode out of sight ...");
    hohoho(s, val(3));
}

std::vector<std::string> names() { return {"fib", "hohoho"}; }

Block lookup(const std::string& name) {
    if (name == "fib") return fib_script;
    if (name == "hohoho") return hohoho_script;
    return Block();
}

} // namespace shellgen::demo

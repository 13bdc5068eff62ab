/*
 * Shell functions implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/var/func.hpp>

namespace shellgen {

Func func(Script& s, const NameHint& hint, const Block& body) {
    std::string name = s.env().allocate(NameKind::Function, hint);
    std::vector<Expr> lines = s.capture(body);
    s.add(make_cmd(name + " () { :"));
    for (auto& e : lines) s.add(indent(e));
    s.add(make_cmd("}"));
    return Func(name);
}

} // namespace shellgen

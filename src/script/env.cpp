/*
 * Naming environment implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/script/env.hpp>
#include <cctype>

namespace shellgen {

static std::string seed_of(NameKind kind, const NameHint& hint) {
    if (!hint.text) return kind == NameKind::Variable ? "v" : "p";
    std::string out;
    for (char c : *hint.text) if (std::isalpha(static_cast<unsigned char>(c))) out.push_back(c);
    return out;
}

std::string Env::allocate(NameKind kind, const NameHint& hint) {
    std::set<std::string>& taken = (kind == NameKind::Variable) ? m_vars : m_funcs;
    const std::string base = "_" + seed_of(kind, hint);
    for (unsigned long attempt = 0;; ++attempt) {
        std::string candidate = base;
        if (attempt > 0) candidate += std::to_string(attempt + 1);
        if (taken.insert(candidate).second) return candidate;
    }
}

} // namespace shellgen

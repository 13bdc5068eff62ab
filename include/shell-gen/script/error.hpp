/*
 * Construction errors - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace shellgen {

// Thrown when a builder operation is asked to do something that cannot be
// expressed as valid shell code. Raised at the call, never at render time.
class ScriptError : public std::logic_error {
public:
    explicit ScriptError(const std::string& what) : std::logic_error(what) {}
};

} // namespace shellgen

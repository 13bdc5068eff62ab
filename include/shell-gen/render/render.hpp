/*
 * Script rendering - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Turns a list of expressions into shell source, either as a multi-line
 *   script (shebang, one node per line) or as a single line joined with
 *   "; ". A single line cannot hold a here-document, so there the document
 *   is fed to the command by a subshell of echo commands instead. The tree
 *   itself is never modified.
 */
#pragma once
#include <string>
#include <vector>
#include <shell-gen/script/ast.hpp>
#include <shell-gen/script/script.hpp>

namespace shellgen {

enum class RenderMode { MultiLine, SingleLine };

// MultiLine: "#!/bin/sh", the nodes one per line, trailing newline.
// SingleLine: the nodes joined with "; ", no trailing newline.
std::string render(RenderMode mode, const std::vector<Expr>& exprs);

// Single-line text of a fragment, for command substitutions and conditions.
std::string linearize(const std::vector<Expr>& exprs);

// First of EOF, EOF2, EOF3, ... that does not occur in `body`.
std::string eof_marker(const std::string& body);

// Builds and renders a whole script.
std::string script(const Block& block);
std::string linear_script(const Block& block);

} // namespace shellgen

/*
 * Shell-Gen AST Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines the expression tree emitted while a script is built: commands
 *   (already joined and quoted), comments, subshells, pipes, logical AND/OR
 *   and redirections. Nodes are immutable; indent() and the failure
 *   rewrite in control.hpp produce new trees. The tree is consumed by the
 *   renderer.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace shellgen {

constexpr int kStdin = 0;
constexpr int kStdout = 1;
constexpr int kStderr = 2;

struct RedirSpec {
    enum class Type { ToFile, ToFileAppend, FromFile, Output, Input, HereDoc } type;
    int fd = kStdout;        // descriptor being redirected (unused for HereDoc)
    std::string target;      // path, or here-document text
    int target_fd = kStdout; // for Output / Input
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct CmdNode { std::string text; };
struct CommentNode { std::string text; };
struct SubshellNode {
    std::string indent;      // prefix before '(' and ')'
    std::vector<Expr> body;
};
struct PipeNode { ExprPtr left, right; };
struct AndNode { ExprPtr left, right; };
struct OrNode { ExprPtr left, right; };
struct RedirNode { ExprPtr expr; RedirSpec spec; };

struct Expr {
    using Node = std::variant<CmdNode, CommentNode, SubshellNode, PipeNode, AndNode, OrNode, RedirNode>;
    Node node;
};

Expr make_cmd(std::string text);
Expr make_comment(std::string text);
Expr make_subshell(std::vector<Expr> body, std::string indent = "");
Expr make_pipe(Expr left, Expr right);
Expr make_and(Expr left, Expr right);
Expr make_or(Expr left, Expr right);
Expr make_redir(Expr expr, RedirSpec spec);

// One level deeper: a tab before every command and comment, and before the
// parentheses of every subshell.
Expr indent(const Expr& e);

// A list of exactly one node is returned as is, an empty list becomes the
// no-op ":", anything else is grouped in an anonymous subshell.
Expr to_single_expr(std::vector<Expr> exprs);

} // namespace shellgen

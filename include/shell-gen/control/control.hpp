/*
 * Control flow, error handling and redirection - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Combinators that run sub-builders and assemble shell syntax around
 *   what they emitted. Bodies are introduced by a "do :" / "then :" style
 *   line and indented one level, so an empty body is still valid and the
 *   same nodes render correctly on one line.
 */
#pragma once
#include <string>
#include <utility>
#include <vector>
#include <shell-gen/quote/quote.hpp>
#include <shell-gen/script/ast.hpp>
#include <shell-gen/script/param.hpp>
#include <shell-gen/script/script.hpp>
#include <shell-gen/var/var.hpp>

namespace shellgen {

// "<word> :" followed by the indented body.
void block(Script& s, const std::string& word, const Block& body);

namespace detail {
void for_cmd(Script& s, const Block& source, const std::function<void(Script&, const UntypedVar&)>& body);
}

// Runs `body` once per field of the output of `source`:
//   for _x in $(source)
//   do :
//       body
//   done
template <typename T = std::string, typename F>
void for_cmd(Script& s, const Block& source, F body) {
    detail::for_cmd(s, source, [&body](Script& inner, const UntypedVar& v) { body(inner, Var<T>(v)); });
}

// Runs `body` while the output of `cond`, executed as a command, succeeds.
// Conditions of while/if/when/unless must emit something (ScriptError).
void while_cmd(Script& s, const Block& cond, const Block& body);

void if_cmd(Script& s, const Block& cond, const Block& then_body, const Block& else_body);
void when_cmd(Script& s, const Block& cond, const Block& then_body);
void unless_cmd(Script& s, const Block& cond, const Block& then_body);

using CaseAlternative = std::pair<Quoted, Block>;

// Runs the body of the first pattern (see glob()) matching the variable.
// An empty list emits nothing.
void case_of(Script& s, const UntypedVar& v, const std::vector<CaseAlternative>& alternatives);

template <typename T>
void case_of(Script& s, const Var<T>& v, const std::vector<CaseAlternative>& alternatives) {
    case_of(s, v.untyped(), alternatives);
}

// "set -e" / "set +e".
void stop_on_failure(Script& s, bool stop);

// Rewrites nodes so that a failing command does not fail the script:
// commands and && chains become "x || true", subshells and redirections are
// rewritten inside, only the last stage of a pipe is rewritten (pipefail is
// assumed off), and the right side of || is rewritten.
std::vector<Expr> ignore_failure_exprs(const std::vector<Expr>& exprs);
void ignore_failure(Script& s, const Block& body);

// Each side is collapsed to one node (a subshell when it emitted several,
// ":" when it emitted nothing).
void pipe_to(Script& s, const Block& left, const Block& right);
void and_then(Script& s, const Block& left, const Block& right);
void or_else(Script& s, const Block& left, const Block& right);

// cmd > path, cmd >> path, cmd < path; `fd` overrides the default descriptor.
void redirect_to(Script& s, const Block& body, const std::string& path, int fd = kStdout);
void redirect_append(Script& s, const Block& body, const std::string& path, int fd = kStdout);
void redirect_from(Script& s, const Block& body, const std::string& path, int fd = kStdin);
// cmd fd1>&fd2, cmd fd1<&fd2
void redirect_output(Script& s, const Block& body, int fd1, int fd2);
void redirect_input(Script& s, const Block& body, int fd1, int fd2);
void to_stderr(Script& s, const Block& body);
// Feeds `text` to the body's standard input.
void here_document(Script& s, const Block& body, const std::string& text);

} // namespace shellgen

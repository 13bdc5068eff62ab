/*
 * Control flow, error handling and redirection implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/control/control.hpp>
#include <shell-gen/render/render.hpp>
#include <shell-gen/script/error.hpp>
#include <shell-gen/var/variables.hpp>
#include <type_traits>

namespace shellgen {

void block(Script& s, const std::string& word, const Block& body) {
    s.add(make_cmd(word + " :"));
    for (auto& e : s.capture(body)) s.add(indent(e));
}

namespace detail {

void for_cmd(Script& s, const Block& source, const std::function<void(Script&, const UntypedVar&)>& body) {
    UntypedVar v = new_var_unsafe(s, named_like("x"));
    std::string src = linearize(s.capture(source));
    s.add(make_cmd("for " + v.name() + " in $(" + src + ")"));
    block(s, "do", [&](Script& inner) { body(inner, v); });
    s.add(make_cmd("done"));
}

} // namespace detail

static std::vector<Expr> capture_condition(Script& s, const Block& cond, const char* what) {
    std::vector<Expr> exprs = s.capture(cond);
    if (exprs.empty()) throw ScriptError(std::string(what) + ": empty condition");
    return exprs;
}

void while_cmd(Script& s, const Block& cond, const Block& body) {
    std::string c = linearize(capture_condition(s, cond, "while_cmd"));
    s.add(make_cmd("while $(" + c + ")"));
    block(s, "do", body);
    s.add(make_cmd("done"));
}

// Condition text: a lone command or subshell stays as is, anything else is
// grouped in a subshell.
static std::string condition(Script& s, const Block& cond) {
    std::vector<Expr> exprs = capture_condition(s, cond, "if_cmd");
    bool single = exprs.size() == 1 &&
                  (std::holds_alternative<CmdNode>(exprs[0].node) || std::holds_alternative<SubshellNode>(exprs[0].node));
    if (single) return linearize(exprs);
    return linearize({make_subshell(std::move(exprs))});
}

void if_cmd(Script& s, const Block& cond, const Block& then_body, const Block& else_body) {
    s.add(make_cmd("if " + condition(s, cond)));
    block(s, "then", then_body);
    block(s, "else", else_body);
    s.add(make_cmd("fi"));
}

void when_cmd(Script& s, const Block& cond, const Block& then_body) {
    s.add(make_cmd("if " + condition(s, cond)));
    block(s, "then", then_body);
    s.add(make_cmd("fi"));
}

void unless_cmd(Script& s, const Block& cond, const Block& then_body) {
    s.add(make_cmd("if ! " + condition(s, cond)));
    block(s, "then", then_body);
    s.add(make_cmd("fi"));
}

void case_of(Script& s, const UntypedVar& v, const std::vector<CaseAlternative>& alternatives) {
    if (alternatives.empty()) return;
    // Laid out so that it also works joined on one line:
    //   case "$v" in a) :
    //       body
    //   : ;; b) :
    //       body
    //   ;; esac
    std::string subject = Param(v).render(s.env());
    bool first = true;
    for (auto& alt : alternatives) {
        std::string leader = first ? "case " + subject + " in " : ": ;; ";
        s.add(make_cmd(leader + alt.first.text() + ") :"));
        for (auto& e : s.capture(alt.second)) s.add(indent(e));
        first = false;
    }
    s.add(make_cmd(";; esac"));
}

void stop_on_failure(Script& s, bool stop) {
    s.add(make_cmd(stop ? "set -e" : "set +e"));
}

static Expr suppress(const Expr& e) {
    return std::visit([&e](const auto& n) -> Expr {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, CmdNode> || std::is_same_v<T, AndNode>) {
            // a && b || true is already true; no grouping needed
            return make_or(e, make_cmd("true"));
        } else if constexpr (std::is_same_v<T, CommentNode>) {
            return e;
        } else if constexpr (std::is_same_v<T, SubshellNode>) {
            return make_subshell(ignore_failure_exprs(n.body), n.indent);
        } else if constexpr (std::is_same_v<T, PipeNode>) {
            // without pipefail only the last stage decides the status
            return make_pipe(*n.left, suppress(*n.right));
        } else if constexpr (std::is_same_v<T, OrNode>) {
            return make_or(*n.left, suppress(*n.right));
        } else {
            return make_redir(suppress(*n.expr), n.spec);
        }
    }, e.node);
}

std::vector<Expr> ignore_failure_exprs(const std::vector<Expr>& exprs) {
    std::vector<Expr> out; out.reserve(exprs.size());
    for (auto& e : exprs) out.push_back(suppress(e));
    return out;
}

void ignore_failure(Script& s, const Block& body) {
    s.add_all(ignore_failure_exprs(s.capture(body)));
}

void pipe_to(Script& s, const Block& left, const Block& right) {
    Expr l = to_single_expr(s.capture(left));
    Expr r = to_single_expr(s.capture(right));
    s.add(make_pipe(std::move(l), std::move(r)));
}

void and_then(Script& s, const Block& left, const Block& right) {
    Expr l = to_single_expr(s.capture(left));
    Expr r = to_single_expr(s.capture(right));
    s.add(make_and(std::move(l), std::move(r)));
}

void or_else(Script& s, const Block& left, const Block& right) {
    Expr l = to_single_expr(s.capture(left));
    Expr r = to_single_expr(s.capture(right));
    s.add(make_or(std::move(l), std::move(r)));
}

static void redir(Script& s, const Block& body, RedirSpec spec) {
    s.add(make_redir(to_single_expr(s.capture(body)), std::move(spec)));
}

void redirect_to(Script& s, const Block& body, const std::string& path, int fd) {
    redir(s, body, RedirSpec{RedirSpec::Type::ToFile, fd, path});
}

void redirect_append(Script& s, const Block& body, const std::string& path, int fd) {
    redir(s, body, RedirSpec{RedirSpec::Type::ToFileAppend, fd, path});
}

void redirect_from(Script& s, const Block& body, const std::string& path, int fd) {
    redir(s, body, RedirSpec{RedirSpec::Type::FromFile, fd, path});
}

void redirect_output(Script& s, const Block& body, int fd1, int fd2) {
    redir(s, body, RedirSpec{RedirSpec::Type::Output, fd1, "", fd2});
}

void redirect_input(Script& s, const Block& body, int fd1, int fd2) {
    redir(s, body, RedirSpec{RedirSpec::Type::Input, fd1, "", fd2});
}

void to_stderr(Script& s, const Block& body) {
    redirect_output(s, body, kStdout, kStderr);
}

void here_document(Script& s, const Block& body, const std::string& text) {
    redir(s, body, RedirSpec{RedirSpec::Type::HereDoc, kStdin, text});
}

} // namespace shellgen

/*
 * Shell-Gen AST helpers
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <shell-gen/script/ast.hpp>
#include <type_traits>

namespace shellgen {

static ExprPtr share(Expr e) { return std::make_shared<const Expr>(std::move(e)); }

Expr make_cmd(std::string text) { return Expr{CmdNode{std::move(text)}}; }
Expr make_comment(std::string text) { return Expr{CommentNode{std::move(text)}}; }
Expr make_subshell(std::vector<Expr> body, std::string indent) {
    return Expr{SubshellNode{std::move(indent), std::move(body)}};
}
Expr make_pipe(Expr left, Expr right) { return Expr{PipeNode{share(std::move(left)), share(std::move(right))}}; }
Expr make_and(Expr left, Expr right) { return Expr{AndNode{share(std::move(left)), share(std::move(right))}}; }
Expr make_or(Expr left, Expr right) { return Expr{OrNode{share(std::move(left)), share(std::move(right))}}; }
Expr make_redir(Expr expr, RedirSpec spec) { return Expr{RedirNode{share(std::move(expr)), std::move(spec)}}; }

Expr indent(const Expr& e) {
    return std::visit([](const auto& n) -> Expr {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, CmdNode>) {
            return make_cmd("\t" + n.text);
        } else if constexpr (std::is_same_v<T, CommentNode>) {
            return make_comment("\t" + n.text);
        } else if constexpr (std::is_same_v<T, SubshellNode>) {
            std::vector<Expr> body; body.reserve(n.body.size());
            for (auto& c : n.body) body.push_back(indent(c));
            return make_subshell(std::move(body), "\t" + n.indent);
        } else if constexpr (std::is_same_v<T, PipeNode>) {
            return make_pipe(indent(*n.left), indent(*n.right));
        } else if constexpr (std::is_same_v<T, AndNode>) {
            return make_and(indent(*n.left), indent(*n.right));
        } else if constexpr (std::is_same_v<T, OrNode>) {
            return make_or(indent(*n.left), indent(*n.right));
        } else {
            return make_redir(indent(*n.expr), n.spec);
        }
    }, e.node);
}

Expr to_single_expr(std::vector<Expr> exprs) {
    // "()" is not valid syntax
    if (exprs.empty()) return make_cmd(":");
    if (exprs.size() == 1) return std::move(exprs.front());
    return make_subshell(std::move(exprs));
}

} // namespace shellgen

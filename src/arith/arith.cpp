/*
 * Shell arithmetic expressions implementation - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shell-gen/arith/arith.hpp>
#include <shell-gen/script/error.hpp>

namespace shellgen {

static std::size_t arity(Arith::Op op) {
    switch (op) {
        case Arith::Op::Num: case Arith::Op::Var: return 0;
        case Arith::Op::Negate: case Arith::Op::Not: return 1;
        case Arith::Op::Cond: return 3;
        default: return 2;
    }
}

static const char* symbol(Arith::Op op) {
    switch (op) {
        case Arith::Op::Negate: return "-";
        case Arith::Op::Not: return "!";
        case Arith::Op::Plus: return "+";
        case Arith::Op::Minus: return "-";
        case Arith::Op::Mult: return "*";
        case Arith::Op::Div: return "/";
        case Arith::Op::Mod: return "%";
        case Arith::Op::Or: return "||";
        case Arith::Op::And: return "&&";
        case Arith::Op::Equal: return "==";
        case Arith::Op::NotEqual: return "!=";
        case Arith::Op::LT: return "<";
        case Arith::Op::GT: return ">";
        case Arith::Op::LE: return "<=";
        case Arith::Op::GE: return ">=";
        case Arith::Op::BitOr: return "|";
        case Arith::Op::BitXOr: return "^";
        case Arith::Op::BitAnd: return "&";
        case Arith::Op::ShiftLeft: return "<<";
        case Arith::Op::ShiftRight: return ">>";
        default: return "";
    }
}

Arith Arith::num(long long n) {
    Arith a; a.m_op = Op::Num; a.m_num = n;
    return a;
}

Arith Arith::var(const UntypedVar& v) {
    Arith a; a.m_op = Op::Var; a.m_var = v;
    return a;
}

Arith::Arith(Op op, std::vector<Arith> args) : m_op(op), m_args(std::move(args)) {
    if (op == Op::Num || op == Op::Var) throw ScriptError("arith: use Arith::num or Arith::var for leaves");
    if (m_args.size() != arity(op)) {
        throw ScriptError(std::string("arith: operator ") + symbol(op) + " expects " +
                          std::to_string(arity(op)) + " operands, got " + std::to_string(m_args.size()));
    }
}

static Arith unop(Arith::Op op, Arith a) { return Arith(op, {std::move(a)}); }
static Arith binop(Arith::Op op, Arith a, Arith b) { return Arith(op, {std::move(a), std::move(b)}); }

Arith negate(Arith a) { return unop(Arith::Op::Negate, std::move(a)); }
Arith logical_not(Arith a) { return unop(Arith::Op::Not, std::move(a)); }
Arith plus(Arith a, Arith b) { return binop(Arith::Op::Plus, std::move(a), std::move(b)); }
Arith minus(Arith a, Arith b) { return binop(Arith::Op::Minus, std::move(a), std::move(b)); }
Arith mult(Arith a, Arith b) { return binop(Arith::Op::Mult, std::move(a), std::move(b)); }
Arith div(Arith a, Arith b) { return binop(Arith::Op::Div, std::move(a), std::move(b)); }
Arith mod(Arith a, Arith b) { return binop(Arith::Op::Mod, std::move(a), std::move(b)); }
Arith logical_or(Arith a, Arith b) { return binop(Arith::Op::Or, std::move(a), std::move(b)); }
Arith logical_and(Arith a, Arith b) { return binop(Arith::Op::And, std::move(a), std::move(b)); }
Arith equal(Arith a, Arith b) { return binop(Arith::Op::Equal, std::move(a), std::move(b)); }
Arith not_equal(Arith a, Arith b) { return binop(Arith::Op::NotEqual, std::move(a), std::move(b)); }
Arith less(Arith a, Arith b) { return binop(Arith::Op::LT, std::move(a), std::move(b)); }
Arith greater(Arith a, Arith b) { return binop(Arith::Op::GT, std::move(a), std::move(b)); }
Arith less_equal(Arith a, Arith b) { return binop(Arith::Op::LE, std::move(a), std::move(b)); }
Arith greater_equal(Arith a, Arith b) { return binop(Arith::Op::GE, std::move(a), std::move(b)); }
Arith bit_or(Arith a, Arith b) { return binop(Arith::Op::BitOr, std::move(a), std::move(b)); }
Arith bit_xor(Arith a, Arith b) { return binop(Arith::Op::BitXOr, std::move(a), std::move(b)); }
Arith bit_and(Arith a, Arith b) { return binop(Arith::Op::BitAnd, std::move(a), std::move(b)); }
Arith shift_left(Arith a, Arith b) { return binop(Arith::Op::ShiftLeft, std::move(a), std::move(b)); }
Arith shift_right(Arith a, Arith b) { return binop(Arith::Op::ShiftRight, std::move(a), std::move(b)); }
Arith cond(Arith c, Arith then_value, Arith else_value) {
    return Arith(Arith::Op::Cond, {std::move(c), std::move(then_value), std::move(else_value)});
}

std::string format_arith(Env& env, const Arith& a) {
    auto paren = [](const std::string& t) { return "(" + t + ")"; };
    const auto& args = a.args();
    switch (a.op()) {
        case Arith::Op::Num:
            return std::to_string(a.number());
        case Arith::Op::Var:
            return a.variable().expand(env).text();
        case Arith::Op::Negate:
        case Arith::Op::Not:
            return paren(std::string(symbol(a.op())) + " " + format_arith(env, args[0]));
        case Arith::Op::Cond: {
            std::string c = format_arith(env, args[0]);
            std::string t = format_arith(env, args[1]);
            std::string e = format_arith(env, args[2]);
            return paren(c + " ? " + t + " : " + e);
        }
        default: {
            std::string l = format_arith(env, args[0]);
            std::string r = format_arith(env, args[1]);
            return paren(l + " " + symbol(a.op()) + " " + r);
        }
    }
}

} // namespace shellgen

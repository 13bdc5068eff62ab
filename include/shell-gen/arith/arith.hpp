/*
 * Shell arithmetic expressions - Shell-Gen
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Expression tree for $((...)). Comparisons and logical operators yield
 *   1 or 0, as in shell arithmetic. format_arith() parenthesizes every
 *   operator, so the result does not depend on the evaluator's precedence
 *   table.
 */
#pragma once
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <shell-gen/script/env.hpp>
#include <shell-gen/var/var.hpp>

namespace shellgen {

class Arith {
public:
    enum class Op {
        Num, Var,
        Negate, Not,
        Plus, Minus, Mult, Div, Mod,
        Or, And,
        Equal, NotEqual, LT, GT, LE, GE,
        BitOr, BitXOr, BitAnd, ShiftLeft, ShiftRight,
        Cond
    };

    static Arith num(long long n);
    static Arith var(const UntypedVar& v);

    template <typename T>
    static Arith var(const Var<T>& v) {
        static_assert(std::is_integral<T>::value, "arithmetic needs an integer variable");
        return var(v.untyped());
    }

    // Checks the operand count against the operator.
    Arith(Op op, std::vector<Arith> args);

    Op op() const { return m_op; }
    long long number() const { return m_num; }
    const UntypedVar& variable() const { return *m_var; }
    const std::vector<Arith>& args() const { return m_args; }

private:
    Arith() = default;

    Op m_op = Op::Num;
    long long m_num = 0;
    std::optional<UntypedVar> m_var;
    std::vector<Arith> m_args;
};

Arith negate(Arith a);
Arith logical_not(Arith a);
Arith plus(Arith a, Arith b);
Arith minus(Arith a, Arith b);
Arith mult(Arith a, Arith b);
Arith div(Arith a, Arith b);
Arith mod(Arith a, Arith b);
Arith logical_or(Arith a, Arith b);
Arith logical_and(Arith a, Arith b);
Arith equal(Arith a, Arith b);
Arith not_equal(Arith a, Arith b);
Arith less(Arith a, Arith b);
Arith greater(Arith a, Arith b);
Arith less_equal(Arith a, Arith b);
Arith greater_equal(Arith a, Arith b);
Arith bit_or(Arith a, Arith b);
Arith bit_xor(Arith a, Arith b);
Arith bit_and(Arith a, Arith b);
Arith shift_left(Arith a, Arith b);
Arith shift_right(Arith a, Arith b);
Arith cond(Arith c, Arith then_value, Arith else_value);

inline Arith operator-(Arith a) { return negate(std::move(a)); }
inline Arith operator+(Arith a, Arith b) { return plus(std::move(a), std::move(b)); }
inline Arith operator-(Arith a, Arith b) { return minus(std::move(a), std::move(b)); }
inline Arith operator*(Arith a, Arith b) { return mult(std::move(a), std::move(b)); }
inline Arith operator/(Arith a, Arith b) { return div(std::move(a), std::move(b)); }
inline Arith operator%(Arith a, Arith b) { return mod(std::move(a), std::move(b)); }

// Text to place inside $((...)). Variables expand unquoted.
std::string format_arith(Env& env, const Arith& a);

} // namespace shellgen

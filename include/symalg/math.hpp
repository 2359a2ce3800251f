#ifndef SYMALG_MATH_HPP
#define SYMALG_MATH_HPP

#include <utility>
#include <vector>

#include <symalg/ast.hpp>
#include <symalg/expr.hpp>

namespace symalg {

// --- Algebraic constructors ---
//
// Combining flattens one level: a Sum (Prod) on the left absorbs the right
// operand instead of being wrapped. No global normal form is implied.

namespace detail {

inline std::vector<Expr> pair_of(Expr a, Expr b) {
    std::vector<Expr> v;
    v.reserve(2);
    v.push_back(std::move(a));
    v.push_back(std::move(b));
    return v;
}

} // namespace detail

inline Expr operator+(Expr lhs, Expr rhs) {
    if (auto* s = lhs.get_if<Sum>()) {
        s->terms.push_back(std::move(rhs));
        return lhs;
    }
    return Expr::sum(detail::pair_of(std::move(lhs), std::move(rhs)));
}

inline Expr operator*(Expr lhs, Expr rhs) {
    if (auto* p = lhs.get_if<Prod>()) {
        p->factors.push_back(std::move(rhs));
        return lhs;
    }
    return Expr::prod(detail::pair_of(std::move(lhs), std::move(rhs)));
}

inline Expr operator-(Expr e) {
    if (auto* n = e.get_if<Neg>()) {
        Expr inner = std::move(*n->arg);
        return inner;
    }
    return Neg{Box(std::move(e))};
}

inline Expr operator-(Expr lhs, Expr rhs) {
    return std::move(lhs) + -std::move(rhs);
}

inline Expr pow(Expr base, Expr exponent) {
    return Pow{Box(std::move(base)), Box(std::move(exponent))};
}

inline Expr pow(Expr base, Int exponent) {
    return pow(std::move(base), Expr::lit(exponent));
}

// 1/e: Pow(a, b) becomes Pow(a, -b), anything else Pow(e, -1).
inline Expr recip(Expr e) {
    if (auto* p = e.get_if<Pow>()) {
        Expr base = std::move(*p->base);
        Expr exponent = std::move(*p->exponent);
        return pow(std::move(base), -std::move(exponent));
    }
    return pow(std::move(e), Expr::lit(-1));
}

inline Expr operator/(Expr lhs, Expr rhs) {
    return std::move(lhs) * recip(std::move(rhs));
}

inline Expr ln(Expr e) { return Ln{Box(std::move(e))}; }
inline Expr sin(Expr e) { return Sin{Box(std::move(e))}; }
inline Expr cos(Expr e) { return Cos{Box(std::move(e))}; }
inline Expr arcsin(Expr e) { return Arcsin{Box(std::move(e))}; }
inline Expr arccos(Expr e) { return Arccos{Box(std::move(e))}; }
inline Expr arctan(Expr e) { return Arctan{Box(std::move(e))}; }

// --- Integer on either side ---

inline Expr operator+(Int lhs, Expr rhs) {
    return Expr::lit(lhs) + std::move(rhs);
}
inline Expr operator-(Int lhs, Expr rhs) {
    return Expr::lit(lhs) - std::move(rhs);
}
inline Expr operator*(Int lhs, Expr rhs) {
    return Expr::lit(lhs) * std::move(rhs);
}
inline Expr operator/(Int lhs, Expr rhs) {
    return Expr::lit(lhs) / std::move(rhs);
}

inline Expr operator+(Expr lhs, Int rhs) {
    return std::move(lhs) + Expr::lit(rhs);
}
inline Expr operator-(Expr lhs, Int rhs) {
    return std::move(lhs) - Expr::lit(rhs);
}
inline Expr operator*(Expr lhs, Int rhs) {
    return std::move(lhs) * Expr::lit(rhs);
}
inline Expr operator/(Expr lhs, Int rhs) {
    return std::move(lhs) / Expr::lit(rhs);
}

// --- Compound assignment ---

inline Expr& operator+=(Expr& lhs, Expr rhs) {
    lhs = std::move(lhs) + std::move(rhs);
    return lhs;
}
inline Expr& operator-=(Expr& lhs, Expr rhs) {
    lhs = std::move(lhs) - std::move(rhs);
    return lhs;
}
inline Expr& operator*=(Expr& lhs, Expr rhs) {
    lhs = std::move(lhs) * std::move(rhs);
    return lhs;
}
inline Expr& operator/=(Expr& lhs, Expr rhs) {
    lhs = std::move(lhs) / std::move(rhs);
    return lhs;
}

inline Expr& operator+=(Expr& lhs, Int rhs) { return lhs += Expr::lit(rhs); }
inline Expr& operator-=(Expr& lhs, Int rhs) { return lhs -= Expr::lit(rhs); }
inline Expr& operator*=(Expr& lhs, Int rhs) { return lhs *= Expr::lit(rhs); }
inline Expr& operator/=(Expr& lhs, Int rhs) { return lhs /= Expr::lit(rhs); }

} // namespace symalg

#endif // SYMALG_MATH_HPP

#ifndef SYMALG_DIFFERENTIATE_HPP
#define SYMALG_DIFFERENTIATE_HPP

#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <symalg/arith.hpp>
#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/error.hpp>
#include <symalg/expr.hpp>
#include <symalg/math.hpp>
#include <symalg/simplify.hpp>
#include <symalg/transforms.hpp>

namespace symalg {

// --- differentiate: symbolic differentiation via structural recursion ---
//
// The result is not simplified.

inline Expr differentiate(const Expr& e, const Options& opts = {}) {
    return transform<Expr>(
        e,
        [](const Expr& n, auto recurse) -> Expr {
            return std::visit(
                detail::overloaded{
                    [](const Const&) { return Expr::lit(0); },
                    [](const Var&) { return Expr::lit(1); },
                    [&](const Sum& s) {
                        std::vector<Expr> terms;
                        terms.reserve(s.terms.size());
                        for (const auto& t : s.terms)
                            terms.push_back(recurse(t));
                        return Expr::sum(std::move(terms));
                    },
                    [&](const Neg& x) { return -recurse(*x.arg); },
                    // (ab)' = ab' + ba', with b the product of the tail.
                    [&](const Prod& p) {
                        const auto& v = p.factors;
                        if (v.empty())
                            return Expr::lit(0);
                        if (v.size() == 1)
                            return recurse(v.front());
                        const Expr& a = v.front();
                        Expr b = v.size() == 2
                                     ? v[1]
                                     : Expr::prod(std::vector<Expr>(
                                           v.begin() + 1, v.end()));
                        Expr db = recurse(b);
                        Expr da = recurse(a);
                        return a * std::move(db) + std::move(b) * std::move(da);
                    },
                    [&](const Pow& p) {
                        const Expr& a = *p.base;
                        const Expr& b = *p.exponent;
                        if (b.is_const(0))
                            return Expr::lit(0);
                        if (b.is_const(1))
                            return recurse(a);
                        if (const auto* c = b.get_if<Const>()) {
                            return Expr::lit(c->value) *
                                   pow(a, checked_sub(c->value, 1)) *
                                   recurse(a);
                        }
                        // a^b = e^(b ln a)
                        return n * recurse(ln(a) * b);
                    },
                    [&](const Ln& f) {
                        return recurse(*f.arg) * pow(*f.arg, -1);
                    },
                    [&](const Sin& f) { return recurse(*f.arg) * cos(*f.arg); },
                    [&](const Cos& f) {
                        return recurse(*f.arg) * -sin(*f.arg);
                    },
                    [&](const Arcsin& f) {
                        return recurse(*f.arg) *
                               recip(pow(1 - pow(*f.arg, 2),
                                         Expr::lit(1) / Expr::lit(2)));
                    },
                    [&](const Arccos& f) {
                        return recurse(*f.arg) *
                               -recip(pow(1 - pow(*f.arg, 2),
                                          Expr::lit(1) / Expr::lit(2)));
                    },
                    [&](const Arctan& f) {
                        return recurse(*f.arg) *
                               pow(1 + pow(*f.arg, 2), Expr::lit(-1));
                    },
                },
                n.node());
        },
        opts);
}

// n-th derivative, simplified after every step.
inline Expr differentiate(const Expr& e, int order, const Options& opts = {}) {
    if (order < 0)
        throw error(
            fmt::format("derivative order must be non-negative, got {}", order));
    Expr result = simplified(e, opts);
    for (int i = 0; i < order; ++i)
        result = simplified(differentiate(result, opts), opts);
    return result;
}

} // namespace symalg

#endif // SYMALG_DIFFERENTIATE_HPP

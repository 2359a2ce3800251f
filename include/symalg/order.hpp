#ifndef SYMALG_ORDER_HPP
#define SYMALG_ORDER_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <variant>
#include <vector>

#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/expr.hpp>

namespace symalg {

// --- Canonical order ---
//
// Variant rank first, then payloads recursively. The order carries no
// algebraic meaning; it only makes Sum/Prod children deterministic.

namespace detail {

inline std::strong_ordering compare(const Expr& a, const Expr& b,
                                    std::size_t depth, std::size_t max_depth);

inline std::strong_ordering compare_seq(const std::vector<Expr>& a,
                                        const std::vector<Expr>& b,
                                        std::size_t depth,
                                        std::size_t max_depth) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (auto c = compare(a[i], b[i], depth, max_depth); c != 0)
            return c;
    }
    return a.size() <=> b.size();
}

inline std::strong_ordering compare(const Expr& a, const Expr& b,
                                    std::size_t depth, std::size_t max_depth) {
    check_depth(depth, max_depth);
    if (auto c = a.rank() <=> b.rank(); c != 0)
        return c;

    const auto next = depth + 1;
    return std::visit(
        overloaded{
            [&](const Const& x) -> std::strong_ordering {
                return x.value <=> std::get<Const>(b.node()).value;
            },
            [](const Var&) -> std::strong_ordering {
                return std::strong_ordering::equal;
            },
            [&](const Sum& x) -> std::strong_ordering {
                return compare_seq(x.terms, std::get<Sum>(b.node()).terms,
                                   next, max_depth);
            },
            [&](const Prod& x) -> std::strong_ordering {
                return compare_seq(x.factors, std::get<Prod>(b.node()).factors,
                                   next, max_depth);
            },
            [&](const Pow& x) -> std::strong_ordering {
                const auto& y = std::get<Pow>(b.node());
                if (auto c = compare(*x.base, *y.base, next, max_depth); c != 0)
                    return c;
                return compare(*x.exponent, *y.exponent, next, max_depth);
            },
            [&]<unary_node T>(const T& x) -> std::strong_ordering {
                return compare(*x.arg, *std::get<T>(b.node()).arg, next,
                               max_depth);
            },
        },
        a.node());
}

} // namespace detail

inline std::strong_ordering compare(const Expr& a, const Expr& b) {
    return detail::compare(a, b, 0, Options{}.max_depth);
}

inline std::strong_ordering operator<=>(const Expr& a, const Expr& b) {
    return compare(a, b);
}

inline bool operator==(const Expr& a, const Expr& b) {
    return compare(a, b) == 0;
}

} // namespace symalg

#endif // SYMALG_ORDER_HPP

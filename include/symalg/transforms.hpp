#ifndef SYMALG_TRANSFORMS_HPP
#define SYMALG_TRANSFORMS_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/error.hpp>
#include <symalg/expr.hpp>
#include <symalg/order.hpp>

namespace symalg {

// --- for_each_child: visit the direct children of a node, in order ---

namespace detail {

template <typename E, typename F>
    requires std::same_as<std::remove_const_t<E>, Expr>
void for_each_child(E& e, F&& f) {
    std::visit(
        [&]<typename T>(T& n) {
            using N = std::remove_const_t<T>;
            if constexpr (std::same_as<N, Const> || std::same_as<N, Var>) {
            } else if constexpr (std::same_as<N, Sum>) {
                for (auto& t : n.terms)
                    f(t);
            } else if constexpr (std::same_as<N, Prod>) {
                for (auto& t : n.factors)
                    f(t);
            } else if constexpr (std::same_as<N, Pow>) {
                f(*n.base);
                f(*n.exponent);
            } else if constexpr (unary_node<N>) {
                f(*n.arg);
            } else {
                static_assert(always_false<N>, "unhandled expression node");
            }
        },
        e.node());
}

} // namespace detail

// --- fold: bottom-up accumulation over the tree ---

template <typename R, typename Visitor>
R fold(const Expr& e, Visitor visitor, const Options& opts = {}) {
    auto recurse = [&](auto self, const Expr& node, std::size_t depth) -> R {
        detail::check_depth(depth, opts.max_depth);
        std::vector<R> children;
        detail::for_each_child(node, [&](const Expr& c) {
            children.push_back(self(self, c, depth + 1));
        });
        return visitor(node, children);
    };
    return recurse(recurse, e, 0);
}

inline std::size_t node_count(const Expr& e, const Options& opts = {}) {
    return fold<std::size_t>(
        e,
        [](const Expr&, const std::vector<std::size_t>& children) {
            std::size_t n = 1;
            for (auto c : children)
                n += c;
            return n;
        },
        opts);
}

// A leaf has depth 1.
inline std::size_t depth(const Expr& e, const Options& opts = {}) {
    return fold<std::size_t>(
        e,
        [](const Expr&, const std::vector<std::size_t>& children) {
            std::size_t d = 0;
            for (auto c : children)
                d = std::max(d, c);
            return d + 1;
        },
        opts);
}

// --- transform: structural recursion with user visitor ---
//
// The visitor receives the node and a `recurse` callable; recurse may be
// applied to children or to temporaries built from them, and counts one
// level of depth per call.

template <typename R, typename Visitor>
R transform(const Expr& e, Visitor visitor, const Options& opts = {}) {
    auto recurse = [&](auto self, const Expr& node, std::size_t depth) -> R {
        detail::check_depth(depth, opts.max_depth);
        auto rec = [&](const Expr& child) -> R {
            return self(self, child, depth + 1);
        };
        return visitor(node, rec);
    };
    return recurse(recurse, e, 0);
}

// --- rewrite: bottom-up rule application until fixed point ---
//
// `rule(node, depth)` rewrites a node in place; its children have already
// been through the same pass.

namespace detail {

template <typename Rule>
void rewrite_bottom_up(Expr& e, Rule& rule, std::size_t depth,
                       const Options& opts) {
    check_depth(depth, opts.max_depth);
    for_each_child(e, [&](Expr& c) {
        rewrite_bottom_up(c, rule, depth + 1, opts);
    });
    rule(e, depth);
}

} // namespace detail

template <typename Rule>
void rewrite(Expr& e, Rule rule, const Options& opts = {}) {
    for (int pass = 0; pass < opts.max_passes; ++pass) {
        Expr before = e;
        detail::rewrite_bottom_up(e, rule, 0, opts);
        if (detail::compare(before, e, 0, opts.max_depth) == 0)
            return;
    }
    throw convergence_error(fmt::format(
        "no fixed point reached after {} passes", opts.max_passes));
}

} // namespace symalg

#endif // SYMALG_TRANSFORMS_HPP

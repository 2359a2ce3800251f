#ifndef SYMALG_PRETTY_PRINT_HPP
#define SYMALG_PRETTY_PRINT_HPP

#include <ostream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/expr.hpp>
#include <symalg/transforms.hpp>

namespace symalg {

// --- pretty_print: structural form, e.g. Sum(x, Prod(5, x)) ---

inline std::string pretty_print(const Expr& e, const Options& opts = {}) {
    return fold<std::string>(
        e,
        [](const Expr& n, const std::vector<std::string>& children) {
            if (const auto* c = n.get_if<Const>())
                return fmt::format("{}", c->value);
            if (n.is<Var>())
                return std::string("x");
            return fmt::format("{}({})", n.tag(), fmt::join(children, ", "));
        },
        opts);
}

inline std::ostream& operator<<(std::ostream& os, const Expr& e) {
    return os << pretty_print(e);
}

} // namespace symalg

#endif // SYMALG_PRETTY_PRINT_HPP

#ifndef SYMALG_LATEX_HPP
#define SYMALG_LATEX_HPP

#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/expr.hpp>
#include <symalg/transforms.hpp>

namespace symalg {

// --- to_latex: math-mode fragment, no enclosing $...$ ---

namespace detail {

inline bool is_negative_const(const Expr& e) {
    const auto* c = e.get_if<Const>();
    return c && c->value < 0;
}

inline std::string parens(std::string_view s) {
    return fmt::format("({})", s);
}

// Juxtaposed after another factor this would merge with it: "32^{-1}".
inline bool starts_number(std::string_view s) {
    return !s.empty() &&
           (s.front() == '-' ||
            std::isdigit(static_cast<unsigned char>(s.front())) != 0);
}

inline bool starts_minus(std::string_view s) {
    return !s.empty() && s.front() == '-';
}

// c*t with c < 0, rewritten as |c|*t so a Sum can print "-|c|t".
inline std::optional<Expr> negated_coefficient(const Expr& e) {
    const auto* p = e.get_if<Prod>();
    if (!p || p->factors.size() < 2)
        return std::nullopt;
    const auto* c = p->factors.front().get_if<Const>();
    if (!c || c->value >= 0 || c->value == std::numeric_limits<Int>::min())
        return std::nullopt;
    Expr out = e;
    out.get_if<Prod>()->factors.front() = Expr::lit(-c->value);
    return out;
}

} // namespace detail

inline std::string to_latex(const Expr& e, const Options& opts = {}) {
    return transform<std::string>(
        e,
        [](const Expr& n, auto recurse) -> std::string {
            return std::visit(
                detail::overloaded{
                    [](const Const& c) { return fmt::format("{}", c.value); },
                    [](const Var&) { return std::string("x"); },
                    [&](const Sum& s) {
                        if (s.terms.empty())
                            return std::string("0");
                        std::string out = recurse(s.terms.front());
                        for (std::size_t i = 1; i < s.terms.size(); ++i) {
                            const Expr& t = s.terms[i];
                            if (const auto* neg = t.get_if<Neg>()) {
                                const Expr& inner = *neg->arg;
                                auto body = recurse(inner);
                                out += '-';
                                out += inner.is<Sum>() ||
                                               detail::starts_minus(body)
                                           ? detail::parens(body)
                                           : body;
                            } else if (auto positive =
                                           detail::negated_coefficient(t)) {
                                out += '-';
                                out += recurse(*positive);
                            } else if (detail::is_negative_const(t)) {
                                out += recurse(t);
                            } else {
                                out += '+';
                                out += recurse(t);
                            }
                        }
                        return out;
                    },
                    [&](const Prod& p) {
                        if (p.factors.empty())
                            return std::string("1");
                        std::string out;
                        const bool several = p.factors.size() > 1;
                        for (std::size_t i = 0; i < p.factors.size(); ++i) {
                            const Expr& f = p.factors[i];
                            if (i == 0 && several && f.is_const(1))
                                continue;
                            if (i == 0 && several && f.is_const(-1)) {
                                out += '-';
                                continue;
                            }
                            auto body = recurse(f);
                            // Only the first printed factor may start with
                            // a digit or a sign.
                            const bool wrap =
                                f.is<Sum>() || f.is<Neg>() ||
                                (out.empty() ? detail::is_negative_const(f)
                                             : detail::starts_number(body));
                            out += wrap ? detail::parens(body) : body;
                        }
                        return out;
                    },
                    [&](const Neg& x) {
                        const Expr& inner = *x.arg;
                        auto body = recurse(inner);
                        const bool wrap =
                            inner.is<Sum>() || detail::starts_minus(body);
                        return "-" + (wrap ? detail::parens(body) : body);
                    },
                    [&](const Pow& p) {
                        const Expr& base = *p.base;
                        const Expr& exponent = *p.exponent;
                        auto b = recurse(base);
                        auto x = recurse(exponent);
                        if (base.is<Sum>() || base.is<Prod>() ||
                            base.is<Neg>() || base.is<Pow>() ||
                            detail::is_negative_const(base))
                            b = detail::parens(b);
                        if (exponent.is<Sum>() || exponent.is<Neg>())
                            x = detail::parens(x);
                        return fmt::format("{}^{{{}}}", b, x);
                    },
                    [&]<function_node T>(const T& f) {
                        return fmt::format("\\{}({})", T::name,
                                           recurse(*f.arg));
                    },
                },
                n.node());
        },
        opts);
}

} // namespace symalg

// Formats as LaTeX, e.g. fmt::format("{}", e).
template <>
struct fmt::formatter<symalg::Expr> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const symalg::Expr& e, FormatContext& ctx) const {
        const auto s = symalg::to_latex(e);
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};

#endif // SYMALG_LATEX_HPP

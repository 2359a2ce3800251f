#ifndef SYMALG_SIMPLIFY_HPP
#define SYMALG_SIMPLIFY_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include <symalg/arith.hpp>
#include <symalg/ast.hpp>
#include <symalg/config.hpp>
#include <symalg/expr.hpp>
#include <symalg/math.hpp>
#include <symalg/order.hpp>
#include <symalg/transforms.hpp>

namespace symalg {

// --- simplify: rewrite to canonical form ---

namespace detail {

// A Sum term split into integer coefficient and remaining factors, the
// factors sorted canonically. Pointers refer into the term.
struct Term {
    Int coeff{1};
    std::vector<const Expr*> factors;
};

class Simplifier {
  public:
    explicit Simplifier(const Options& opts) : m_opts(opts) {}

    // Node-local rules on a node whose children are already simplified.
    void operator()(Expr& e, std::size_t depth) {
        for (int i = 0; i < m_opts.max_passes; ++i) {
            if (!step(e, depth))
                break;
        }
        sort_children(e, depth);
    }

  private:
    Options m_opts;

    bool equal(const Expr& a, const Expr& b, std::size_t depth) const {
        return compare(a, b, depth, m_opts.max_depth) == 0;
    }

    void resimplify(Expr& e, std::size_t depth) {
        rewrite_bottom_up(e, *this, depth, m_opts);
    }

    bool step(Expr& e, std::size_t depth) {
        std::optional<Expr> replacement;
        const bool changed = std::visit(
            overloaded{
                [](Const&) { return false; },
                [](Var&) { return false; },
                [&](Sum& s) { return simplify_sum(s, replacement, depth); },
                [&](Prod& p) { return simplify_prod(p, replacement, depth); },
                [&](Neg& n) { return simplify_neg(n, replacement, depth); },
                [&](Pow& p) { return simplify_pow(p, replacement); },
                [](function_node auto&) { return false; },
            },
            e.node());
        if (replacement)
            e = std::move(*replacement);
        return changed;
    }

    void sort_children(Expr& e, std::size_t depth) const {
        auto less = [&](const Expr& a, const Expr& b) {
            return compare(a, b, depth + 1, m_opts.max_depth) < 0;
        };
        if (auto* s = e.get_if<Sum>())
            std::sort(s->terms.begin(), s->terms.end(), less);
        else if (auto* p = e.get_if<Prod>())
            std::sort(p->factors.begin(), p->factors.end(), less);
    }

    // Empty -> 0, singleton -> its element.
    static bool collapse(std::vector<Expr>& v, std::optional<Expr>& out) {
        if (v.empty()) {
            out = Expr::lit(0);
            return true;
        }
        if (v.size() == 1) {
            out = std::move(v.front());
            return true;
        }
        return false;
    }

    template <node_type T> static bool splice_nested(std::vector<Expr>& v) {
        auto children = [](Expr& e) -> std::vector<Expr>* {
            if (auto* s = e.get_if<T>()) {
                if constexpr (std::same_as<T, Sum>)
                    return &s->terms;
                else
                    return &s->factors;
            }
            return nullptr;
        };
        if (std::none_of(v.begin(), v.end(),
                         [](const Expr& e) { return e.is<T>(); }))
            return false;
        std::vector<Expr> flat;
        flat.reserve(v.size());
        for (auto& e : v) {
            if (auto* inner = children(e)) {
                for (auto& c : *inner)
                    flat.push_back(std::move(c));
            } else {
                flat.push_back(std::move(e));
            }
        }
        v = std::move(flat);
        return true;
    }

    // --- Sum ---

    bool simplify_sum(Sum& s, std::optional<Expr>& out, std::size_t depth) {
        auto& v = s.terms;
        if (splice_nested<Sum>(v))
            return true;
        if (std::erase_if(v, [](const Expr& t) { return t.is_const(0); }) > 0)
            return true;
        if (merge_like_terms(v, depth))
            return true;
        return collapse(v, out);
    }

    Term decompose(const Expr& t, std::size_t depth) const {
        check_depth(depth, m_opts.max_depth);
        if (const auto* c = t.get_if<Const>())
            return Term{c->value, {}};
        if (const auto* n = t.get_if<Neg>()) {
            Term inner = decompose(*n->arg, depth + 1);
            inner.coeff = checked_neg(inner.coeff);
            return inner;
        }
        Term term;
        if (const auto* p = t.get_if<Prod>()) {
            for (const auto& f : p->factors) {
                if (const auto* c = f.get_if<Const>())
                    term.coeff = checked_mul(term.coeff, c->value);
                else
                    term.factors.push_back(&f);
            }
            std::sort(term.factors.begin(), term.factors.end(),
                      [&](const Expr* a, const Expr* b) {
                          return compare(*a, *b, depth + 1,
                                         m_opts.max_depth) < 0;
                      });
        } else {
            term.factors.push_back(&t);
        }
        return term;
    }

    bool like_terms(const Term& a, const Term& b, std::size_t depth) const {
        if (a.factors.size() != b.factors.size())
            return false;
        for (std::size_t i = 0; i < a.factors.size(); ++i) {
            if (!equal(*a.factors[i], *b.factors[i], depth))
                return false;
        }
        return true;
    }

    static Expr make_term(Int coeff, const std::vector<const Expr*>& factors) {
        if (factors.empty() || coeff == 0)
            return Expr::lit(coeff);
        std::vector<Expr> v;
        v.reserve(factors.size() + 1);
        v.push_back(Expr::lit(coeff));
        for (const auto* f : factors)
            v.push_back(*f);
        return Expr::prod(std::move(v));
    }

    // Merges the first pair of like terms found.
    bool merge_like_terms(std::vector<Expr>& v, std::size_t depth) {
        std::vector<Term> terms;
        terms.reserve(v.size());
        for (const auto& t : v)
            terms.push_back(decompose(t, depth + 1));

        for (std::size_t i = 1; i < v.size(); ++i) {
            for (std::size_t j = 0; j < i; ++j) {
                if (!like_terms(terms[i], terms[j], depth + 1))
                    continue;
                Expr merged =
                    make_term(checked_add(terms[j].coeff, terms[i].coeff),
                              terms[j].factors);
                resimplify(merged, depth + 1);
                v[j] = std::move(merged);
                v.erase(v.begin() + static_cast<std::ptrdiff_t>(i));
                return true;
            }
        }
        return false;
    }

    // --- Prod ---

    bool simplify_prod(Prod& p, std::optional<Expr>& out, std::size_t depth) {
        auto& v = p.factors;
        if (splice_nested<Prod>(v))
            return true;
        if (std::any_of(v.begin(), v.end(),
                        [](const Expr& f) { return f.is_const(0); })) {
            out = Expr::lit(0);
            return true;
        }
        if (absorb_negations(v))
            return true;
        if (fold_constants(v))
            return true;
        if (cancel_reciprocals(v, depth))
            return true;
        if (consolidate_powers(v, depth))
            return true;
        if (extract_sign(v, out, depth))
            return true;
        return collapse(v, out);
    }

    // Neg factors are unwrapped; an odd count leaves a Const(-1) behind for
    // fold_constants.
    static bool absorb_negations(std::vector<Expr>& v) {
        bool changed = false;
        bool negative = false;
        for (auto& f : v) {
            if (auto* n = f.get_if<Neg>()) {
                f = std::move(*n->arg);
                negative = !negative;
                changed = true;
            }
        }
        if (negative)
            v.insert(v.begin(), Expr::lit(-1));
        return changed;
    }

    // A coefficient of -1 is written as Neg of the remaining factors.
    bool extract_sign(std::vector<Expr>& v, std::optional<Expr>& out,
                      std::size_t depth) {
        if (v.size() < 2)
            return false;
        auto it = std::find_if(v.begin(), v.end(),
                               [](const Expr& f) { return f.is_const(-1); });
        if (it == v.end())
            return false;
        v.erase(it);
        Expr rest = v.size() == 1 ? std::move(v.front())
                                  : Expr::prod(std::move(v));
        Expr negated = Neg{Box(std::move(rest))};
        resimplify(negated, depth);
        out = std::move(negated);
        return true;
    }

    // All Const factors become one leading Const; a unit coefficient is
    // dropped when other factors remain.
    static bool fold_constants(std::vector<Expr>& v) {
        std::size_t count = 0;
        Int product = 1;
        for (const auto& f : v) {
            if (const auto* c = f.get_if<Const>()) {
                ++count;
                product = checked_mul(product, c->value);
            }
        }
        const bool lone_unit = count == 1 && product == 1 && v.size() > 1;
        if (count < 2 && !lone_unit)
            return false;
        std::erase_if(v, [](const Expr& f) { return f.is<Const>(); });
        if (product != 1 || v.empty())
            v.insert(v.begin(), Expr::lit(product));
        return true;
    }

    bool negations(const Expr& a, const Expr& b, std::size_t depth) const {
        const auto* ca = a.get_if<Const>();
        const auto* cb = b.get_if<Const>();
        if (ca && cb)
            return ca->value != std::numeric_limits<Int>::min() &&
                   cb->value == -ca->value;
        if (const auto* n = b.get_if<Neg>())
            return equal(*n->arg, a, depth);
        if (const auto* n = a.get_if<Neg>())
            return equal(*n->arg, b, depth);
        return false;
    }

    // True when b == 1/a.
    bool reciprocal_of(const Expr& a, const Expr& b, std::size_t depth) const {
        const auto* pb = b.get_if<Pow>();
        if (!pb)
            return false;
        if (pb->exponent->is_const(-1) && equal(*pb->base, a, depth))
            return true;
        const auto* pa = a.get_if<Pow>();
        return pa && equal(*pa->base, *pb->base, depth + 1) &&
               negations(*pa->exponent, *pb->exponent, depth + 1);
    }

    bool cancel_reciprocals(std::vector<Expr>& v, std::size_t depth) const {
        for (std::size_t i = 0; i < v.size(); ++i) {
            for (std::size_t j = 0; j < v.size(); ++j) {
                if (i == j || !reciprocal_of(v[i], v[j], depth + 1))
                    continue;
                v[i] = Expr::lit(1);
                v.erase(v.begin() + static_cast<std::ptrdiff_t>(j));
                return true;
            }
        }
        return false;
    }

    static const Expr& base_of(const Expr& f) {
        if (const auto* p = f.get_if<Pow>())
            return *p->base;
        return f;
    }

    static Expr exponent_of(const Expr& f) {
        if (const auto* p = f.get_if<Pow>())
            return *p->exponent;
        return Expr::lit(1);
    }

    // Equal bases merge into base^(sum of exponents).
    bool consolidate_powers(std::vector<Expr>& v, std::size_t depth) {
        for (std::size_t i = 0; i < v.size(); ++i) {
            for (std::size_t j = i + 1; j < v.size(); ++j) {
                if (!equal(base_of(v[i]), base_of(v[j]), depth + 1))
                    continue;
                Expr merged =
                    pow(base_of(v[i]), exponent_of(v[i]) + exponent_of(v[j]));
                resimplify(merged, depth + 1);
                v[i] = std::move(merged);
                v.erase(v.begin() + static_cast<std::ptrdiff_t>(j));
                return true;
            }
        }
        return false;
    }

    // --- Neg ---

    bool simplify_neg(Neg& n, std::optional<Expr>& out, std::size_t depth) {
        Expr& arg = *n.arg;
        if (const auto* c = arg.get_if<Const>()) {
            out = Expr::lit(checked_neg(c->value));
            return true;
        }
        if (arg.is<Neg>()) {
            // Strip the whole run; an odd count keeps one Neg.
            Expr* inner = &arg;
            std::size_t count = 1;
            while (auto* m = inner->get_if<Neg>()) {
                inner = &*m->arg;
                ++count;
            }
            if (count % 2 == 0)
                out = std::move(*inner);
            else
                out = Expr(Neg{Box(std::move(*inner))});
            return true;
        }
        if (auto* s = arg.get_if<Sum>()) {
            std::vector<Expr> terms;
            terms.reserve(s->terms.size());
            for (auto& t : s->terms)
                terms.push_back(-std::move(t));
            Expr distributed = Expr::sum(std::move(terms));
            resimplify(distributed, depth);
            out = std::move(distributed);
            return true;
        }
        // -(c*t) -> (-c)*t
        if (auto* p = arg.get_if<Prod>(); p && !p->factors.empty()) {
            if (auto* c = p->factors.front().get_if<Const>()) {
                c->value = checked_neg(c->value);
                Expr scaled = std::move(arg);
                resimplify(scaled, depth);
                out = std::move(scaled);
                return true;
            }
        }
        return false;
    }

    // --- Pow ---

    static bool simplify_pow(Pow& p, std::optional<Expr>& out) {
        const Expr& exponent = *p.exponent;
        if (exponent.is_const(0)) {
            out = Expr::lit(1);
            return true;
        }
        if (exponent.is_const(1)) {
            out = std::move(*p.base);
            return true;
        }
        const auto* b = p.base->get_if<Const>();
        if (!b)
            return false;
        if (b->value == 1) {
            out = Expr::lit(1);
            return true;
        }
        const auto* n = exponent.get_if<Const>();
        if (!n)
            return false;
        if (b->value == -1) {
            out = Expr::lit(n->value % 2 == 0 ? 1 : -1);
            return true;
        }
        if (n->value < 0)
            return false;
        out = Expr::lit(checked_pow(b->value, n->value));
        return true;
    }
};

} // namespace detail

inline void simplify(Expr& e, const Options& opts = {}) {
    rewrite(e, detail::Simplifier(opts), opts);
}

inline Expr simplified(Expr e, const Options& opts = {}) {
    simplify(e, opts);
    return e;
}

// Every Sum/Prod in `e` has its children in non-decreasing canonical order.
inline bool is_canonical(const Expr& e, const Options& opts = {}) {
    return fold<bool>(
        e,
        [&](const Expr& node, const std::vector<bool>& children) {
            if (!std::all_of(children.begin(), children.end(),
                             [](bool ok) { return ok; }))
                return false;
            auto sorted = [&](const std::vector<Expr>& v) {
                return std::is_sorted(
                    v.begin(), v.end(), [&](const Expr& a, const Expr& b) {
                        return detail::compare(a, b, 0, opts.max_depth) < 0;
                    });
            };
            if (const auto* s = node.get_if<Sum>())
                return sorted(s->terms);
            if (const auto* p = node.get_if<Prod>())
                return sorted(p->factors);
            return true;
        },
        opts);
}

} // namespace symalg

#endif // SYMALG_SIMPLIFY_HPP

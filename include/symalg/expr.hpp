#ifndef SYMALG_EXPR_HPP
#define SYMALG_EXPR_HPP

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <symalg/ast.hpp>

namespace symalg {

// --- Expression: a value-semantic tree over the closed Node variant ---

class Expr {
  public:
    Expr() = default;

    template <node_type T> Expr(T n) : m_node(std::move(n)) {}

    Expr(const Expr&) = default;

    // A moved-from expression is left equal to Const(0).
    Expr(Expr&& other) noexcept : m_node(std::move(other.m_node)) {
        other.m_node.emplace<Const>();
    }

    ~Expr() = default;

    // `other` may be a descendant of *this, so both assignments detach the
    // source before the old tree is released.
    Expr& operator=(const Expr& other) {
        if (this != &other)
            *this = Expr(other);
        return *this;
    }

    Expr& operator=(Expr&& other) noexcept {
        if (this != &other) {
            Node tmp = std::move(other.m_node);
            other.m_node.emplace<Const>();
            m_node = std::move(tmp);
        }
        return *this;
    }

    static Expr lit(Int v) { return Const{v}; }

    static Expr var() { return Var{}; }

    static Expr sum(std::vector<Expr> terms) { return Sum{std::move(terms)}; }

    static Expr prod(std::vector<Expr> factors) {
        return Prod{std::move(factors)};
    }

    const Node& node() const { return m_node; }
    Node& node() { return m_node; }

    // Position of the active alternative; the first key of the canonical
    // order.
    std::size_t rank() const { return m_node.index(); }

    std::string_view tag() const {
        return std::visit([](const auto& n) { return n.tag; }, m_node);
    }

    template <node_type T> bool is() const {
        return std::holds_alternative<T>(m_node);
    }

    template <node_type T> T* get_if() { return std::get_if<T>(&m_node); }
    template <node_type T> const T* get_if() const {
        return std::get_if<T>(&m_node);
    }

    bool is_const(Int v) const {
        const auto* c = get_if<Const>();
        return c && c->value == v;
    }

  private:
    Node m_node{Const{}};
};

// --- Box (needs the complete Expr) ---

inline Box::Box(Expr e) : m_ptr(std::make_unique<Expr>(std::move(e))) {}

inline Box::Box(const Box& other)
    : m_ptr(std::make_unique<Expr>(*other.m_ptr)) {}

inline Box& Box::operator=(const Box& other) {
    if (this != &other)
        m_ptr = std::make_unique<Expr>(*other.m_ptr);
    return *this;
}

inline Box::~Box() = default;

} // namespace symalg

#endif // SYMALG_EXPR_HPP

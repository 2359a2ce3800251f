#ifndef SYMALG_AST_HPP
#define SYMALG_AST_HPP

#include <concepts>
#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace symalg {

using Int = std::int64_t;

class Expr;

// --- Box: owning, deep-copying handle to a single child ---
//
// Defined out of line in expr.hpp, once Expr is complete.

class Box {
  public:
    explicit Box(Expr e);
    Box(const Box& other);
    Box(Box&&) noexcept = default;
    Box& operator=(const Box& other);
    Box& operator=(Box&&) noexcept = default;
    ~Box();

    Expr& operator*() { return *m_ptr; }
    const Expr& operator*() const { return *m_ptr; }
    Expr* operator->() { return m_ptr.get(); }
    const Expr* operator->() const { return m_ptr.get(); }

  private:
    std::unique_ptr<Expr> m_ptr;
};

// --- Node payloads (declaration order is the canonical rank) ---

struct Const {
    static constexpr std::string_view tag = "Const";
    Int value{};
};

struct Var {
    static constexpr std::string_view tag = "Var";
};

struct Sum {
    static constexpr std::string_view tag = "Sum";
    std::vector<Expr> terms;
};

struct Prod {
    static constexpr std::string_view tag = "Prod";
    std::vector<Expr> factors;
};

struct Neg {
    static constexpr std::string_view tag = "Neg";
    Box arg;
};

struct Pow {
    static constexpr std::string_view tag = "Pow";
    Box base;
    Box exponent;
};

struct Ln {
    static constexpr std::string_view tag = "Ln";
    static constexpr std::string_view name = "ln";
    Box arg;
};

struct Sin {
    static constexpr std::string_view tag = "Sin";
    static constexpr std::string_view name = "sin";
    Box arg;
};

struct Cos {
    static constexpr std::string_view tag = "Cos";
    static constexpr std::string_view name = "cos";
    Box arg;
};

struct Arcsin {
    static constexpr std::string_view tag = "Arcsin";
    static constexpr std::string_view name = "arcsin";
    Box arg;
};

struct Arccos {
    static constexpr std::string_view tag = "Arccos";
    static constexpr std::string_view name = "arccos";
    Box arg;
};

struct Arctan {
    static constexpr std::string_view tag = "Arctan";
    static constexpr std::string_view name = "arctan";
    Box arg;
};

using Node = std::variant<Const, Var, Sum, Prod, Neg, Pow, Ln, Sin, Cos,
                          Arcsin, Arccos, Arctan>;

// --- Node classification ---

namespace detail {

template <typename T, typename V> struct is_alternative : std::false_type {};

template <typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>>
    : std::bool_constant<(std::same_as<T, Ts> || ...)> {};

template <typename> inline constexpr bool always_false = false;

template <typename... Fs> struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs> overloaded(Fs...) -> overloaded<Fs...>;

} // namespace detail

template <typename T>
concept node_type = detail::is_alternative<T, Node>::value;

// Neg and the transcendental functions: exactly one child, held in `arg`.
template <typename T>
concept unary_node = node_type<T> && requires(const T& n) {
    { n.arg } -> std::same_as<const Box&>;
};

template <typename T>
concept function_node = unary_node<T> && requires {
    { T::name } -> std::convertible_to<std::string_view>;
};

} // namespace symalg

#endif // SYMALG_AST_HPP

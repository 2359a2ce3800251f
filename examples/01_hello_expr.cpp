// 01_hello_expr.cpp: Building and printing your first expression
//
// Shows: Expr::var(), Expr::lit(), operator sugar, pretty_print(),
//        to_latex(), fmt formatting of expressions.

#include <fmt/format.h>
#include <symalg/symalg.hpp>

using namespace symalg;

int main() {
    // --- Build an expression: f(x) = x^2 + 2x + 1 ---
    const auto x = Expr::var();
    const auto f = pow(x, 2) + 2 * x + 1;

    // Structural form shows the tree exactly as built
    fmt::print("tree:  {}\n", pretty_print(f));

    // LaTeX form, directly or through fmt
    fmt::print("latex: {}\n", to_latex(f));
    fmt::print("fmt:   ${}$\n", f);

    // --- Constructors flatten locally, nothing more ---
    const auto g = x + 1 + 2 + x;
    fmt::print("\nx + 1 + 2 + x\n");
    fmt::print("  tree:  {}\n", pretty_print(g));
    fmt::print("  nodes: {}, depth: {}\n", node_count(g), depth(g));

    // --- Division is multiplication by a reciprocal ---
    const auto h = sin(x) / cos(x);
    fmt::print("\nsin(x) / cos(x)\n");
    fmt::print("  tree:  {}\n", pretty_print(h));
    fmt::print("  latex: {}\n", h);
}

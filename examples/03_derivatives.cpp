// 03_derivatives.cpp: Symbolic differentiation
//
// Shows: differentiate(), n-th derivatives, chain and product rules,
//        inverse trigonometric functions, error handling.

#include <limits>

#include <fmt/format.h>
#include <symalg/symalg.hpp>

using namespace symalg;

int main() {
    const auto x = Expr::var();

    // --- First derivatives, simplified ---
    const Expr fs[] = {
        pow(x, 3),        sin(x),    cos(x),      ln(x),
        x * sin(x),       sin(x * x), pow(x, x), arcsin(x),
        arccos(x),        arctan(x), x / (x + 1),
    };
    for (const auto& f : fs)
        fmt::print("d/dx {:<24} = {}\n", to_latex(f),
                   simplified(differentiate(f)));

    // --- Higher order ---
    const auto p = pow(x, 4) + 3 * pow(x, 2);
    for (int n = 0; n <= 5; ++n)
        fmt::print("\nd^{}/dx^{} ({}) = {}", n, n, p, differentiate(p, n));
    fmt::print("\n");

    // --- Raw result before simplification ---
    fmt::print("\nraw d/dx sin(x^2): {}\n", differentiate(sin(pow(x, 2))));

    // --- Errors surface as symalg::error ---
    try {
        differentiate(pow(x, Expr::lit(std::numeric_limits<Int>::min())));
    } catch (const error& e) {
        fmt::print("\nerror: {}\n", e.what());
    }
}

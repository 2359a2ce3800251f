// 04_transforms.cpp: Writing your own tree algorithms
//
// Shows: fold() for bottom-up summaries, transform() for structural
//        recursion, rewrite() with a custom rule, Options limits.

#include <cstddef>
#include <vector>

#include <fmt/format.h>
#include <symalg/symalg.hpp>

using namespace symalg;

int main() {
    const auto x = Expr::var();
    const auto e = sin(x * x) + ln(x + 1) * 3;

    // --- fold: count transcendental calls ---
    auto calls = fold<int>(e, [](const Expr& n, const std::vector<int>& kids) {
        int total = n.is<Ln>() || n.is<Sin>() || n.is<Cos>() ? 1 : 0;
        for (int k : kids)
            total += k;
        return total;
    });
    fmt::print("{} has {} function calls\n", e, calls);

    // --- transform: substitute x := x + 1 ---
    auto shifted = transform<Expr>(e, [&](const Expr& n, auto recurse) {
        if (n.is<Var>())
            return x + 1;
        Expr copy = n;
        detail::for_each_child(copy, [&](Expr& c) { c = recurse(c); });
        return copy;
    });
    fmt::print("shifted:    {}\n", simplified(shifted));

    // --- rewrite: replace ln(u) by its linearisation u - 1 ---
    Expr approx = e;
    rewrite(approx, [](Expr& n, std::size_t) {
        if (const auto* l = n.get_if<Ln>())
            n = *l->arg - 1;
    });
    fmt::print("linearised: {}\n", simplified(approx));

    // --- Options bound recursion depth ---
    Expr deep = x;
    for (int i = 0; i < 100; ++i)
        deep = cos(std::move(deep));
    try {
        to_latex(deep, Options{.max_depth = 32});
    } catch (const depth_error& err) {
        fmt::print("depth limit: {}\n", err.what());
    }
}

// 02_simplify.cpp: Canonical forms
//
// Shows: simplify(), simplified(), like-term merging, power consolidation,
//        reciprocal cancellation, canonical ordering.

#include <fmt/format.h>
#include <symalg/symalg.hpp>

using namespace symalg;

namespace {

void show(const char* label, const Expr& e) {
    fmt::print("{:<22} {:<28} => {}\n", label, to_latex(e), simplified(e));
}

} // namespace

int main() {
    const auto x = Expr::var();

    // --- Sums ---
    show("like terms", 2 * x + 3 * x);
    show("cancellation", x - x);
    show("constant folding", x + 3 + 2);
    show("negated sum", -(x + sin(x)));

    // --- Products and powers ---
    show("repeated factor", x * x * x);
    show("power merge", pow(x, 2) * x);
    show("reciprocal", x * x / x);
    show("shifted quotient", (x + 3 + 2) / (5 + x));
    show("integer power", pow(Expr::lit(2), 10));

    // --- In-place, from compound assignment ---
    Expr e = x;
    e += x * 5;
    e /= x;
    fmt::print("\nbuilt:      {}\n", e);
    simplify(e);
    fmt::print("simplified: {}\n", e);

    // --- Children come out in canonical order ---
    const auto mixed = simplified(cos(x) + ln(x) + 4 + x);
    fmt::print("\nordered:    {}\n", mixed);
    fmt::print("canonical:  {}\n", is_canonical(mixed));
}

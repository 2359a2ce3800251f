#include <limits>
#include <sstream>
#include <string>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <symalg/latex.hpp>
#include <symalg/math.hpp>
#include <symalg/pretty_print.hpp>
#include <symalg/simplify.hpp>

using namespace symalg;

namespace {
const Expr x = Expr::var();
Expr lit(Int v) { return Expr::lit(v); }
} // namespace

// --- Leaves ---

TEST(Latex, Leaves) {
    EXPECT_EQ(to_latex(lit(42)), "42");
    EXPECT_EQ(to_latex(lit(-3)), "-3");
    EXPECT_EQ(to_latex(x), "x");
}

// --- Sums ---

TEST(Latex, SumJoinsWithPlus) { EXPECT_EQ(to_latex(x + sin(x)), "x+\\sin(x)"); }

TEST(Latex, SumCollapsesNegChild) {
    EXPECT_EQ(to_latex(x - 1), "x-1");
    EXPECT_EQ(to_latex(x - sin(x)), "x-\\sin(x)");
    EXPECT_EQ(to_latex(x - (x + 1)), "x-(x+1)");
}

TEST(Latex, SumNegativeConstant) {
    EXPECT_EQ(to_latex(Expr::sum({x, lit(-2)})), "x-2");
}

TEST(Latex, SumNegativeCoefficient) {
    EXPECT_EQ(to_latex(Expr::sum({x, Expr::prod({lit(-2), x})})), "x-2x");
    EXPECT_EQ(to_latex(Expr::sum({x, Expr::prod({lit(-1), x})})), "x-x");
    EXPECT_EQ(to_latex(Expr::sum({x, -lit(-2)})), "x-(-2)");
}

TEST(Latex, SumMinimumCoefficient) {
    const Int min = std::numeric_limits<Int>::min();
    auto e = Expr::sum({x, Expr::prod({lit(min), x})});
    EXPECT_EQ(to_latex(e), "x+(-9223372036854775808)x");
}

TEST(Latex, EmptySum) { EXPECT_EQ(to_latex(Expr::sum({})), "0"); }

// --- Products ---

TEST(Latex, ProdJuxtaposes) { EXPECT_EQ(to_latex(x * sin(x)), "x\\sin(x)"); }

TEST(Latex, ProdLeadingCoefficient) {
    EXPECT_EQ(to_latex(Expr::prod({lit(3), x})), "3x");
    EXPECT_EQ(to_latex(Expr::prod({lit(-3), x})), "(-3)x");
}

TEST(Latex, ProdUnitHeadSuppressed) {
    EXPECT_EQ(to_latex(Expr::prod({lit(1), x})), "x");
    EXPECT_EQ(to_latex(Expr::prod({lit(1)})), "1");
}

TEST(Latex, ProdTrailingConstantWrapped) {
    EXPECT_EQ(to_latex(x * 5), "x(5)");
}

TEST(Latex, ProdWrapsSumAndNeg) {
    EXPECT_EQ(to_latex((x + 1) * x), "(x+1)x");
    EXPECT_EQ(to_latex(x * -sin(x)), "x(-\\sin(x))");
}

TEST(Latex, ProdNeverJoinsDigits) {
    EXPECT_EQ(to_latex(Expr::prod({lit(3), pow(lit(2), -1)})), "3(2^{-1})");
    EXPECT_EQ(to_latex(x * (3 * x)), "x(3x)");
    EXPECT_EQ(to_latex(Expr::prod({lit(1), pow(lit(2), -1)})), "2^{-1}");
}

TEST(Latex, ProdUnitNegativeHead) {
    EXPECT_EQ(to_latex(Expr::prod({lit(-1), x})), "-x");
    EXPECT_EQ(to_latex(Expr::prod({lit(-1), x + 1})), "-(x+1)");
    EXPECT_EQ(to_latex(x * Expr::prod({lit(-1), x})), "x(-x)");
}

TEST(Latex, EmptyProd) { EXPECT_EQ(to_latex(Expr::prod({})), "1"); }

TEST(Latex, UnsimplifiedQuotient) {
    Expr e = x;
    e += x * 5;
    e /= x;
    EXPECT_EQ(to_latex(e), "(x+x(5))x^{-1}");
}

// --- Neg ---

TEST(Latex, Neg) {
    EXPECT_EQ(to_latex(-x), "-x");
    EXPECT_EQ(to_latex(-(x + 1)), "-(x+1)");
    EXPECT_EQ(to_latex(-lit(-2)), "-(-2)");
    EXPECT_EQ(to_latex(-Expr::prod({lit(-1), x})), "-(-x)");
}

// --- Pow ---

TEST(Latex, Pow) {
    EXPECT_EQ(to_latex(pow(x, 2)), "x^{2}");
    EXPECT_EQ(to_latex(pow(x, -1)), "x^{-1}");
    EXPECT_EQ(to_latex(pow(x + 1, 2)), "(x+1)^{2}");
    EXPECT_EQ(to_latex(pow(2 * x, 2)), "(2x)^{2}");
    EXPECT_EQ(to_latex(pow(pow(x, 2), 3)), "(x^{2})^{3}");
    EXPECT_EQ(to_latex(pow(lit(-2), x)), "(-2)^{x}");
}

TEST(Latex, PowExponentWrapped) {
    EXPECT_EQ(to_latex(pow(x, -x)), "x^{(-x)}");
    EXPECT_EQ(to_latex(pow(x, x + 1)), "x^{(x+1)}");
    EXPECT_EQ(to_latex(pow(x, sin(x))), "x^{\\sin(x)}");
}

// --- Functions ---

TEST(Latex, Functions) {
    EXPECT_EQ(to_latex(ln(x + 1)), "\\ln(x+1)");
    EXPECT_EQ(to_latex(sin(x)), "\\sin(x)");
    EXPECT_EQ(to_latex(cos(x)), "\\cos(x)");
    EXPECT_EQ(to_latex(arcsin(x)), "\\arcsin(x)");
    EXPECT_EQ(to_latex(arccos(x)), "\\arccos(x)");
    EXPECT_EQ(to_latex(arctan(x)), "\\arctan(x)");
}

// --- After simplification ---

TEST(Latex, Simplified) {
    EXPECT_EQ(to_latex(simplified((x + 3 + 2) / (5 + x))), "1");
    EXPECT_EQ(to_latex(simplified(2 * x + 3 * x)), "5x");
    EXPECT_EQ(to_latex(simplified(x * x + 2 * x + 1)), "1+2x+x^{2}");
    EXPECT_EQ(to_latex(simplified(-(x + sin(x)))), "-x-\\sin(x)");
    EXPECT_EQ(to_latex(simplified(1 - 2 * x)), "1-2x");
    EXPECT_EQ(to_latex(simplified(x + 2 * (-x))), "-x");
}

TEST(Latex, SimplifiedIntegerQuotient) {
    EXPECT_EQ(to_latex(simplified(lit(3) / lit(2))), "3(2^{-1})");
    EXPECT_EQ(to_latex(simplified(pow(lit(2), -1) * pow(lit(2), -1) * 4)),
              "4(2^{-2})");
}

// --- Formatting hooks ---

TEST(Format, FmtUsesLatex) {
    EXPECT_EQ(fmt::format("{}", sin(x)), "\\sin(x)");
    EXPECT_EQ(fmt::format("[{:>4}]", x), "[   x]");
}

TEST(Format, PrettyPrint) {
    EXPECT_EQ(pretty_print(x + 5 * x), "Sum(x, Prod(5, x))");
    EXPECT_EQ(pretty_print(pow(x, -1)), "Pow(x, -1)");
    EXPECT_EQ(pretty_print(sin(-x)), "Sin(Neg(x))");
}

TEST(Format, Stream) {
    std::ostringstream os;
    os << (x + 1);
    EXPECT_EQ(os.str(), "Sum(x, 1)");
}

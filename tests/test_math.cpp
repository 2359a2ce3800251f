#include <gtest/gtest.h>
#include <symalg/math.hpp>
#include <symalg/order.hpp>
#include <symalg/pretty_print.hpp>

using namespace symalg;

namespace {
const Expr x = Expr::var();
}

// --- Sums ---

TEST(MathOps, AddCreatesPair) {
    auto e = x + 1;
    ASSERT_TRUE(e.is<Sum>());
    EXPECT_EQ(e.get_if<Sum>()->terms.size(), 2u);
}

TEST(MathOps, AddAppendsToLeftSum) {
    auto e = x + 1 + 2;
    ASSERT_TRUE(e.is<Sum>());
    EXPECT_EQ(e.get_if<Sum>()->terms.size(), 3u);
}

TEST(MathOps, AddKeepsRightSumNested) {
    auto e = Expr::lit(1) + (x + 2);
    ASSERT_TRUE(e.is<Sum>());
    const auto& terms = e.get_if<Sum>()->terms;
    ASSERT_EQ(terms.size(), 2u);
    EXPECT_TRUE(terms[1].is<Sum>());
}

TEST(MathOps, IntOnLeft) {
    auto e = 2 + x;
    EXPECT_EQ(e, Expr::sum({Expr::lit(2), x}));
}

// --- Products ---

TEST(MathOps, MulAppendsToLeftProd) {
    auto e = x * 2 * 3;
    ASSERT_TRUE(e.is<Prod>());
    EXPECT_EQ(e.get_if<Prod>()->factors.size(), 3u);
}

TEST(MathOps, IntTimesExpr) {
    EXPECT_EQ(5 * x, Expr::prod({Expr::lit(5), x}));
}

// --- Negation and subtraction ---

TEST(MathOps, NegWraps) {
    auto e = -x;
    ASSERT_TRUE(e.is<Neg>());
    EXPECT_TRUE(e.get_if<Neg>()->arg->is<Var>());
}

TEST(MathOps, DoubleNegUnwraps) { EXPECT_EQ(-(-x), x); }

TEST(MathOps, NegDoesNotFoldConstants) {
    auto e = -Expr::lit(4);
    ASSERT_TRUE(e.is<Neg>());
    EXPECT_TRUE(e.get_if<Neg>()->arg->is_const(4));
}

TEST(MathOps, SubIsAddOfNeg) {
    EXPECT_EQ(x - 1, Expr::sum({x, -Expr::lit(1)}));
}

// --- Division and reciprocals ---

TEST(MathOps, RecipOfPlainTerm) {
    EXPECT_EQ(recip(x), pow(x, Expr::lit(-1)));
}

TEST(MathOps, RecipOfPowNegatesExponent) {
    auto e = recip(pow(x, 3));
    ASSERT_TRUE(e.is<Pow>());
    const auto& p = *e.get_if<Pow>();
    EXPECT_TRUE(p.base->is<Var>());
    ASSERT_TRUE(p.exponent->is<Neg>());
    EXPECT_TRUE(p.exponent->get_if<Neg>()->arg->is_const(3));
}

TEST(MathOps, RecipOfNegativePowerUnwraps) {
    EXPECT_EQ(recip(recip(pow(x, sin(x)))), pow(x, sin(x)));
}

TEST(MathOps, DivIsMulByRecip) {
    EXPECT_EQ(x / 2, Expr::prod({x, pow(Expr::lit(2), -1)}));
    EXPECT_EQ(x / pow(x, 2), Expr::prod({x, pow(x, -Expr::lit(2))}));
}

// --- Functions ---

TEST(MathOps, FunctionsWrap) {
    EXPECT_EQ(ln(x).tag(), "Ln");
    EXPECT_EQ(sin(x).tag(), "Sin");
    EXPECT_EQ(cos(x).tag(), "Cos");
    EXPECT_EQ(arcsin(x).tag(), "Arcsin");
    EXPECT_EQ(arccos(x).tag(), "Arccos");
    EXPECT_EQ(arctan(x).tag(), "Arctan");
}

// --- Compound assignment ---

TEST(MathOps, CompoundAssign) {
    Expr e = x;
    e += x * 5;
    EXPECT_EQ(e, Expr::sum({x, Expr::prod({x, Expr::lit(5)})}));
    e /= x;
    EXPECT_EQ(e, Expr::prod({Expr::sum({x, Expr::prod({x, Expr::lit(5)})}),
                             pow(x, -1)}));
}

TEST(MathOps, CompoundAssignInt) {
    Expr e = x;
    e *= 3;
    e -= 2;
    EXPECT_EQ(e, Expr::sum({Expr::prod({x, Expr::lit(3)}), -Expr::lit(2)}));
}

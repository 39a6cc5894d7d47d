/**
 * @file test_curve.cpp
 * @brief Point, modular inverse, group law and scalar multiplication over Z/NZ
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "math/CurveGroup.hpp"
#include "math/ModInverse.hpp"
#include "math/Point.hpp"
#include "math/ScalarMultiplier.hpp"

using math::CurveGroup;
using math::Point;
using math::ScalarMultiplier;

// ============================================================================
// ModInverse
// ============================================================================

TEST(ModInverseTest, SmallValues) {
    EXPECT_EQ(math::modInverse(3, 7), 5);
    EXPECT_EQ(math::modInverse(12, 97), 89);
    EXPECT_EQ(math::modInverse(1, 2), 1);
}

TEST(ModInverseTest, NegativeInputIsNormalized) {
    // -3 = 4 (mod 7), 4 * 2 = 8 = 1
    EXPECT_EQ(math::modInverse(-3, 7), 2);
}

TEST(ModInverseTest, ResultIsAnInverse) {
    const mpz_class N("455839");
    for (int a = 2; a < 200; ++a) {
        auto inv = math::tryModInverse(a, N);
        ASSERT_TRUE(inv.has_value()) << a;
        EXPECT_GE(*inv, 0);
        EXPECT_LT(*inv, N);
        EXPECT_EQ(mpz_class(a * *inv % N), 1) << a;
    }
}

TEST(ModInverseTest, NotInvertible) {
    EXPECT_FALSE(math::tryModInverse(599, mpz_class("455839")).has_value());
    EXPECT_FALSE(math::tryModInverse(0, 7).has_value());
    EXPECT_THROW(math::modInverse(2, 6), std::domain_error);
}

// ============================================================================
// Point
// ============================================================================

TEST(PointTest, Equality) {
    EXPECT_EQ(Point(3, 6), Point(3, 6));
    EXPECT_NE(Point(3, 6), Point(3, 7));
    EXPECT_NE(Point(3, 6), Point(4, 6));
    EXPECT_EQ(Point::infinity(), Point::infinity());
    EXPECT_NE(Point::infinity(), Point(0, 0));
    EXPECT_NE(Point(0, 0), Point::infinity());
}

TEST(PointTest, CoordinatesOfInfinityThrow) {
    Point o = Point::infinity();
    EXPECT_TRUE(o.isInfinity());
    EXPECT_THROW(o.x(), std::logic_error);
    EXPECT_THROW(o.y(), std::logic_error);
}

TEST(PointTest, Printable) {
    EXPECT_EQ(Point(3, 6).toString(), "(x,y) = (3, 6)");
    EXPECT_EQ(Point::infinity().toString(), "O");
}

// ============================================================================
// CurveGroup
// ============================================================================

// y^2 = x^3 + 2x + 3 over F_97, through (3, 6)
class CurveGroupTest : public ::testing::Test {
protected:
    CurveGroup curve{2, 3, 97};
    Point P{3, 6};
};

TEST_F(CurveGroupTest, Contains) {
    EXPECT_TRUE(curve.contains(P));
    EXPECT_TRUE(curve.contains(Point::infinity()));
    EXPECT_FALSE(curve.contains(Point(3, 7)));
}

TEST_F(CurveGroupTest, IdentityLaw) {
    EXPECT_EQ(curve.add(P, Point::infinity()), P);
    EXPECT_EQ(curve.add(Point::infinity(), P), P);
    EXPECT_EQ(curve.add(Point::infinity(), Point::infinity()), Point::infinity());
    EXPECT_EQ(curve.factorHint(), 1);
}

TEST_F(CurveGroupTest, Doubling) {
    // slope = 29/12 = 59, x' = 59^2 - 6 = 80, y' = 59*(3 - 80) - 6 = 10
    Point twoP = curve.add(P, P);
    EXPECT_EQ(twoP, Point(80, 10));
    EXPECT_TRUE(curve.contains(twoP));
    EXPECT_FALSE(curve.isBroken());
}

TEST_F(CurveGroupTest, AdditionIsCommutativeAndStaysOnCurve) {
    Point Q = curve.add(P, P);
    Point R1 = curve.add(P, Q);
    Point R2 = curve.add(Q, P);
    EXPECT_EQ(R1, R2);
    EXPECT_TRUE(curve.contains(R1));
}

TEST_F(CurveGroupTest, Associativity) {
    Point Q = curve.add(P, P);
    Point R = curve.add(Q, P);
    Point lhs = curve.add(curve.add(P, Q), R);
    Point rhs = curve.add(P, curve.add(Q, R));
    ASSERT_FALSE(curve.isBroken());
    EXPECT_EQ(lhs, rhs);
}

TEST_F(CurveGroupTest, CoefficientsAreReduced) {
    CurveGroup c(-95, 100, 97);
    EXPECT_EQ(c.a(), 2);
    EXPECT_EQ(c.b(), 3);
    EXPECT_EQ(c.modulus(), 97);
}

TEST(CurveGroupConstruction, FromPointLiesOnCurve) {
    const mpz_class N("455839");
    CurveGroup c = CurveGroup::fromPoint(1234, 98765, 4242, N);
    EXPECT_TRUE(c.contains(Point(1234, 98765)));
    EXPECT_GE(c.b(), 0);
    EXPECT_LT(c.b(), N);
}

TEST(CurveGroupConstruction, RejectsSmallModulus) {
    EXPECT_THROW(CurveGroup(1, 1, 1), std::invalid_argument);
    EXPECT_THROW(CurveGroup(1, 1, 0), std::invalid_argument);
    EXPECT_THROW(CurveGroup::fromPoint(1, 1, 1, -5), std::invalid_argument);
}

TEST(CurveGroupFailure, DoublingWithZeroY) {
    const mpz_class N("455839");
    CurveGroup c(1, 1, N);
    Point P(5, 0);
    EXPECT_EQ(c.obstruction(P, P), N);
    EXPECT_EQ(c.add(P, P), Point::infinity());
    EXPECT_EQ(c.factorHint(), N);
    EXPECT_TRUE(c.isBroken());
}

TEST(CurveGroupFailure, DoublingExposesFactor) {
    const mpz_class N("455839");   // 599 * 761
    CurveGroup c(1, 1, N);
    Point P(5, 599);
    auto r = c.tryAdd(P, P);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.factor(), 599);
    EXPECT_EQ(r.pointOrInfinity(), Point::infinity());
    EXPECT_EQ(c.factorHint(), 599);
}

TEST(CurveGroupFailure, AdditionExposesFactor) {
    const mpz_class N("455839");
    CurveGroup c(1, 1, N);
    Point P(1, 2), Q(762, 5);
    EXPECT_EQ(c.obstruction(P, Q), 761);
    EXPECT_EQ(c.factorHint(), 1);
    EXPECT_EQ(c.add(P, Q), Point::infinity());
    EXPECT_EQ(c.factorHint(), 761);
    EXPECT_EQ(mpz_class(N % c.factorHint()), 0);
}

TEST(CurveGroupFailure, AddingInverseGivesModulus) {
    // P + (-P): the denominator is 0, so the hint is N itself
    CurveGroup c(2, 3, 97);
    Point P(3, 6), minusP(3, 91);
    EXPECT_EQ(c.add(P, minusP), Point::infinity());
    EXPECT_EQ(c.factorHint(), 97);
}

// ============================================================================
// ScalarMultiplier
// ============================================================================

class ScalarMultiplierTest : public ::testing::Test {
protected:
    const mpz_class N{"1000003"};
    CurveGroup curve = CurveGroup::fromPoint(17, 4711, 29, N);
    ScalarMultiplier mul{curve};
    Point P{17, 4711};
};

TEST_F(ScalarMultiplierTest, InfinityIsFixed) {
    for (int k = 1; k < 40; ++k) {
        EXPECT_EQ(mul.multiply(Point::infinity(), k), Point::infinity());
        EXPECT_EQ(mul.lastOperationCount(), 0u);
    }
    EXPECT_FALSE(curve.isBroken());
}

TEST_F(ScalarMultiplierTest, MultiplyByOne) {
    EXPECT_EQ(mul.multiply(P, 1), P);
}

TEST_F(ScalarMultiplierTest, DoublingConsistency) {
    Point viaAdd = curve.add(P, P);
    ASSERT_FALSE(curve.isBroken());
    EXPECT_EQ(mul.multiply(P, 2), viaAdd);
}

TEST_F(ScalarMultiplierTest, MatchesRepeatedAddition) {
    Point acc = Point::infinity();
    for (int k = 1; k <= 64; ++k) {
        acc = curve.add(acc, P);
        ASSERT_FALSE(curve.isBroken());
        EXPECT_EQ(mul.multiply(P, k), acc) << "k=" << k;
    }
}

TEST_F(ScalarMultiplierTest, Linearity) {
    const int ks[] = {1, 2, 3, 5, 8, 13, 100, 255, 1024};
    int checked = 0;
    for (int k1 : ks) {
        for (int k2 : ks) {
            // fresh curve per pair: a broken curve stays broken
            CurveGroup c = CurveGroup::fromPoint(17, 4711, 29, N);
            ScalarMultiplier m(c);
            Point a = m.multiply(P, k1);
            Point b = m.multiply(P, k2);
            Point sum = m.multiply(P, k1 + k2);
            Point rhs = c.add(a, b);
            if (c.isBroken()) continue;
            EXPECT_EQ(sum, rhs) << k1 << " + " << k2;
            ++checked;
        }
    }
    EXPECT_GT(checked, 0);
}

TEST_F(ScalarMultiplierTest, LargeScalarStaysOnCurve) {
    mpz_class k("123456789012345678901234567890");
    Point Q = mul.multiply(P, k);
    if (!curve.isBroken()) {
        EXPECT_TRUE(curve.contains(Q));
    }
}

TEST_F(ScalarMultiplierTest, NonPositiveScalarThrows) {
    EXPECT_THROW(mul.multiply(P, 0), std::invalid_argument);
    EXPECT_THROW(mul.multiply(P, -3), std::invalid_argument);
}

TEST(ScalarMultiplierFailure, StopsAtFirstObstruction) {
    // every doubling mod 6 has 2y sharing a factor with 6
    CurveGroup c = CurveGroup::fromPoint(1, 1, 1, 6);
    ScalarMultiplier mul(c);
    auto r = mul.tryMultiply(Point(1, 1), 1024);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(mul.lastOperationCount(), 1u);
    EXPECT_EQ(r.factor(), 2);
    EXPECT_EQ(c.factorHint(), 2);
}

TEST(ScalarMultiplierFailure, PropagatesInfinity) {
    const mpz_class N("455839");
    CurveGroup c(1, 1, N);
    ScalarMultiplier mul(c);
    EXPECT_EQ(mul.multiply(Point(5, 599), 2), Point::infinity());
    EXPECT_EQ(c.factorHint(), 599);
}

TEST(ScalarMultiplierReplay, Deterministic) {
    const mpz_class N("455839");
    auto runOnce = [&](Point& out) -> mpz_class {
        CurveGroup c = CurveGroup::fromPoint(31337, 27182, 1618, N);
        ScalarMultiplier mul(c);
        Point P(31337, 27182);
        for (int i = 1; i < 300 && !c.isBroken() && !P.isInfinity(); ++i)
            P = mul.multiply(P, i);
        out = P;
        return c.factorHint();
    };
    Point p1 = Point::infinity(), p2 = Point(0, 0);
    mpz_class h1 = runOnce(p1);
    mpz_class h2 = runOnce(p2);
    EXPECT_EQ(h1, h2);
    EXPECT_EQ(p1, p2);
    EXPECT_EQ(mpz_class(N % h1), 0);
}

#include "quaternion.h"
#include "gtest/gtest.h"
#include <math.h>

namespace rlisp {

namespace {

void ExpectNear(const Quaternion &expected, const Quaternion &actual) {
    EXPECT_NEAR(expected.a, actual.a, 1e-9);
    EXPECT_NEAR(expected.b, actual.b, 1e-9);
    EXPECT_NEAR(expected.c, actual.c, 1e-9);
    EXPECT_NEAR(expected.d, actual.d, 1e-9);
}

} // namespace

TEST(QuaternionTest, Identities) {
    Quaternion i{0, 1, 0, 0}, j{0, 0, 1, 0}, k{0, 0, 0, 1};
    auto neg_one = Quaternion::FromReal(-1);

    EXPECT_TRUE(neg_one.Equals(i.Mul(i)));
    EXPECT_TRUE(neg_one.Equals(j.Mul(j)));
    EXPECT_TRUE(neg_one.Equals(k.Mul(k)));
    EXPECT_TRUE(neg_one.Equals(i.Mul(j).Mul(k)));

    // Not commutative.
    EXPECT_TRUE(k.Equals(i.Mul(j)));
    EXPECT_TRUE(k.Scale(-1).Equals(j.Mul(i)));
}

TEST(QuaternionTest, Inverse) {
    Quaternion q{1, 2, -3, 0.5};
    ExpectNear(Quaternion::FromReal(1), q.Mul(q.Inverse()));
    ExpectNear(q, q.Mul(q).Div(q));
}

TEST(QuaternionTest, ExpAndLn) {
    // e^(i * pi) = -1
    Quaternion q{0, M_PI, 0, 0};
    ExpectNear(Quaternion::FromReal(-1), q.Exp());

    Quaternion p{0.5, 1, -1, 2};
    ExpectNear(p, p.Ln().Exp());
    ExpectNear(Quaternion::FromReal(exp(2.0)),
               Quaternion::FromReal(2).Exp());
    ExpectNear(Quaternion{0, M_PI, 0, 0}, Quaternion::FromReal(-1).Ln());
}

TEST(QuaternionTest, Pow) {
    Quaternion q{1, 2, 3, 4};
    ExpectNear(q.Mul(q), q.Pow(Quaternion::FromReal(2)));
    ExpectNear(Quaternion{0, 2, 0, 0},
               Quaternion::FromReal(-4).Pow(Quaternion::FromReal(0.5)));
}

TEST(QuaternionTest, ToString) {
    EXPECT_EQ("1+2i-3j+0.5k", (Quaternion{1, 2, -3, 0.5}).ToString());
    EXPECT_EQ("2i", (Quaternion{0, 2, 0, 0}).ToString());
    EXPECT_EQ("-1j+1k", (Quaternion{0, 0, -1, 1}).ToString());
    EXPECT_EQ("0", Quaternion::FromReal(0).ToString());
    EXPECT_EQ("nan", (Quaternion{0, NAN, 0, 0}).ToString());
}

} // namespace rlisp

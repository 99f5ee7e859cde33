// Copyright (c) 2015, Robot Control and Pattern Recognition Group,
// Institute of Control and Computation Engineering
// Warsaw University of Technology
//
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//     * Redistributions of source code must retain the above copyright
//       notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above copyright
//       notice, this list of conditions and the following disclaimer in the
//       documentation and/or other materials provided with the distribution.
//     * Neither the name of the Warsaw University of Technology nor the
//       names of its contributors may be used to endorse or promote products
//       derived from this software without specific prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
// ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL <COPYright HOLDER> BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
// Author: Dawid Seredynski
//


#include <gtest/gtest.h>

#include <cmath>
#include <stdlib.h>
#include <map>
#include <set>
#include <string>

#include "expression.h"
#include "vector2_expression.h"

namespace {

double evaluate(const Expression &e, double q1, double q2) {
    std::map<std::string, double > values;
    values["q1"] = q1;
    values["q2"] = q2;
    double value = 0.0;
    EXPECT_TRUE(e.evaluate(values, value));
    return value;
}

}   // namespace

TEST(ExpressionTest, EqualMonomialsAreMerged) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");

    Expression e = x * y + 2.0 * y * x;
    EXPECT_EQ(1, e.getTermsCount());
    EXPECT_EQ("3.0*x*y", e.toString());
}

TEST(ExpressionTest, CancellationIsExact) {
    Expression s = Expression::sin("q1");
    Expression c = Expression::cos("q1");
    Expression l = Expression::symbol("l1");

    Expression e = l * s * c - c * (s * l);
    EXPECT_TRUE(e.isZero());
    EXPECT_EQ("0.0", e.toString());

    Expression x = Expression::symbol("x");
    EXPECT_TRUE((x - x).isZero());
    EXPECT_TRUE(((x + 1.0) * (x - 1.0) - x * x + 1.0).isZero());
}

TEST(ExpressionTest, Constants) {
    Expression e(2.5);
    EXPECT_TRUE(e.isConstant());
    EXPECT_DOUBLE_EQ(2.5, e.getConstant());
    EXPECT_TRUE(Expression().isConstant());
    EXPECT_DOUBLE_EQ(0.0, Expression().getConstant());
    EXPECT_FALSE(Expression::symbol("x").isConstant());
}

TEST(ExpressionTest, TrigDerivatives) {
    Expression s = Expression::sin("q1");
    Expression c = Expression::cos("q1");

    EXPECT_TRUE((s.diff("q1") - c).isZero());
    EXPECT_TRUE((c.diff("q1") + s).isZero());
    EXPECT_TRUE(s.diff("q2").isZero());
}

TEST(ExpressionTest, ProductRule) {
    Expression q2 = Expression::symbol("q2");
    Expression e = Expression::sin("q1") * q2 * q2;

    Expression expected_q1 = Expression::cos("q1") * q2 * q2;
    Expression expected_q2 = 2.0 * Expression::sin("q1") * q2;
    EXPECT_TRUE((e.diff("q1") - expected_q1).isZero());
    EXPECT_TRUE((e.diff("q2") - expected_q2).isZero());
}

TEST(ExpressionTest, Inverse) {
    Expression m1 = Expression::symbol("m1");
    Expression m2 = Expression::symbol("m2");

    Expression inv;
    EXPECT_FALSE(Expression().inverse(inv));

    ASSERT_TRUE(Expression(4.0).inverse(inv));
    EXPECT_TRUE(inv.isConstant());
    EXPECT_DOUBLE_EQ(0.25, inv.getConstant());

    ASSERT_TRUE((m1 + m2).inverse(inv));
    std::map<std::string, double > values;
    values["m1"] = 1.5;
    values["m2"] = 2.5;
    double value = 0.0;
    ASSERT_TRUE(inv.evaluate(values, value));
    EXPECT_DOUBLE_EQ(0.25, value);

    // d/dm1 1/(m1 + m2) = -1/(m1 + m2)^2
    ASSERT_TRUE(inv.diff("m1").evaluate(values, value));
    EXPECT_DOUBLE_EQ(-1.0 / 16.0, value);
}

TEST(ExpressionTest, Evaluate) {
    Expression e = 2.0 * Expression::sin("q1") * Expression::cos("q2") - Expression::symbol("q2");
    EXPECT_NEAR(2.0 * std::sin(0.3) * std::cos(-1.2) + 1.2, evaluate(e, 0.3, -1.2), 1.0e-12);

    std::map<std::string, double > values;
    values["q1"] = 0.1;
    double value = 0.0;
    EXPECT_FALSE(e.evaluate(values, value));
}

TEST(ExpressionTest, Symbols) {
    Expression inv;
    ASSERT_TRUE((Expression::symbol("m1") + Expression::symbol("m2")).inverse(inv));
    Expression e = Expression::sin("q1") * inv + Expression::symbol("g");

    std::set<std::string > symbols;
    e.getSymbols(symbols);
    EXPECT_EQ(4, symbols.size());
    EXPECT_EQ(1, symbols.count("q1"));
    EXPECT_EQ(1, symbols.count("m1"));
    EXPECT_EQ(1, symbols.count("m2"));
    EXPECT_EQ(1, symbols.count("g"));
}

TEST(ExpressionTest, FormatCoefficient) {
    EXPECT_EQ("2.0", formatCoefficient(2.0));
    EXPECT_EQ("0.1", formatCoefficient(0.1));
    EXPECT_EQ("9.81", formatCoefficient(9.81));
    EXPECT_EQ(1.0 / 3.0, strtod(formatCoefficient(1.0 / 3.0).c_str(), NULL));
}

TEST(Vector2ExpressionTest, CrossAndDot) {
    Vector2Expression a(Expression::symbol("ax"), Expression::symbol("ay"));
    Vector2Expression b(Expression::symbol("bx"), Expression::symbol("by"));

    EXPECT_TRUE((cross2d(a, b) + cross2d(b, a)).isZero());
    EXPECT_TRUE(cross2d(a, a).isZero());

    Expression expected = Expression::symbol("ax") * Expression::symbol("bx") + Expression::symbol("ay") * Expression::symbol("by");
    EXPECT_TRUE((dot(a, b) - expected).isZero());

    Vector2Expression d = a - a;
    EXPECT_TRUE(d.x().isZero());
    EXPECT_TRUE(d.y().isZero());
}

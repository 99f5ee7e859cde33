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

#include <map>
#include <string>
#include <vector>

#include "expression.h"
#include "linear_system.h"

namespace {

std::vector<std::string > getUnknowns() {
    std::vector<std::string > unknowns;
    unknowns.push_back("x");
    unknowns.push_back("y");
    return unknowns;
}

}   // namespace

TEST(LinearSystemTest, ExtractsCoefficients) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");
    Expression a = Expression::symbol("a");
    Expression s = Expression::sin("a");

    // a x + sin(a) y - 3 = 0,  2 y + a = 0
    std::vector<Expression > equations;
    equations.push_back(a * x + s * y - 3.0);
    equations.push_back(2.0 * y + a);

    LinearSystem system;
    ASSERT_TRUE(extractLinearSystem(equations, getUnknowns(), system));
    ASSERT_EQ(2, system.rows());
    ASSERT_EQ(2, system.cols());

    EXPECT_TRUE((system.A(0, 0) - a).isZero());
    EXPECT_TRUE((system.A(0, 1) - s).isZero());
    EXPECT_TRUE(system.A(1, 0).isZero());
    EXPECT_TRUE((system.A(1, 1) - 2.0).isZero());
    EXPECT_TRUE((system.b(0) - 3.0).isZero());
    EXPECT_TRUE((system.b(1) + a).isZero());

    std::vector<int > idx;
    system.getSparsePattern(idx);
    ASSERT_EQ(3, idx.size());
    EXPECT_EQ(0, idx[0]);
    EXPECT_EQ(2, idx[1]);
    EXPECT_EQ(3, idx[2]);

    std::vector<Expression > values;
    system.getNonzeroEntries(values);
    ASSERT_EQ(3, values.size());
    EXPECT_TRUE((values[1] - s).isZero());
}

TEST(LinearSystemTest, RejectsNonlinearUnknowns) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");

    std::vector<Expression > products;
    products.push_back(x * y);
    products.push_back(y);
    LinearSystem system;
    EXPECT_FALSE(extractLinearSystem(products, getUnknowns(), system));

    std::vector<Expression > squares;
    squares.push_back(x);
    squares.push_back(y * y);
    EXPECT_FALSE(extractLinearSystem(squares, getUnknowns(), system));

    std::vector<Expression > trig;
    trig.push_back(x + Expression::sin("y"));
    trig.push_back(y);
    EXPECT_FALSE(extractLinearSystem(trig, getUnknowns(), system));
}

TEST(LinearSystemTest, TransformRows) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");
    std::vector<Expression > equations;
    equations.push_back(x + y - 1.0);
    equations.push_back(y - 2.0);

    LinearSystem system;
    ASSERT_TRUE(extractLinearSystem(equations, getUnknowns(), system));

    Eigen::MatrixXd R(2, 2);
    R << 1.0, -1.0,
         0.0, 1.0;
    LinearSystem result;
    system.transformRows(R, result);
    EXPECT_TRUE((result.A(0, 0) - 1.0).isZero());
    EXPECT_TRUE(result.A(0, 1).isZero());
    EXPECT_TRUE((result.b(0) + 1.0).isZero());
    EXPECT_TRUE((result.b(1) - 2.0).isZero());
    EXPECT_EQ(2, result.getUnknowns().size());
}

TEST(LinearSystemTest, Solve2x2) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");
    Expression m = Expression::symbol("m");

    // m x = 2, x + y = 5
    std::vector<Expression > equations;
    equations.push_back(m * x - 2.0);
    equations.push_back(x + y - 5.0);
    LinearSystem system;
    ASSERT_TRUE(extractLinearSystem(equations, getUnknowns(), system));

    std::vector<Expression > solution;
    ASSERT_TRUE(solveLinearSystem2x2(system, solution));
    ASSERT_EQ(2, solution.size());

    std::map<std::string, double > values;
    values["m"] = 4.0;
    double value;
    ASSERT_TRUE(solution[0].evaluate(values, value));
    EXPECT_NEAR(0.5, value, 1.0e-12);
    ASSERT_TRUE(solution[1].evaluate(values, value));
    EXPECT_NEAR(4.5, value, 1.0e-12);
}

TEST(LinearSystemTest, DegenerateSystemIsRejected) {
    Expression x = Expression::symbol("x");
    Expression y = Expression::symbol("y");

    std::vector<Expression > equations;
    equations.push_back(x + y - 1.0);
    equations.push_back(2.0 * x + 2.0 * y - 3.0);
    LinearSystem system;
    ASSERT_TRUE(extractLinearSystem(equations, getUnknowns(), system));

    std::vector<Expression > solution;
    EXPECT_FALSE(solveLinearSystem2x2(system, solution));
}

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
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>
#include "Eigen/Dense"

#include "code_generator.h"
#include "compiled_function.h"
#include "expression.h"

namespace {

std::vector<std::string > makeInputs(const std::string &a, const std::string &b) {
    std::vector<std::string > inputs;
    inputs.push_back(a);
    inputs.push_back(b);
    return inputs;
}

}   // namespace

TEST(CompiledFunctionTest, EvaluatesOutputs) {
    Expression q = Expression::symbol("q");
    Expression m = Expression::symbol("m");
    Expression inv;
    ASSERT_TRUE((m + 1.0).inverse(inv));

    boost::shared_ptr<CompiledFunction > f(new CompiledFunction("f", makeInputs("q", "m")));
    std::vector<Expression > v;
    v.push_back(Expression::sin("q") * m);
    v.push_back(Expression::cos("q") * Expression::cos("q") + inv);
    f->addOutput("v", 2, 1, v);
    f->addOutput("s", 1, 1, std::vector<Expression >(1, q * q * q));
    std::vector<int > idx;
    idx.push_back(0);
    idx.push_back(3);
    f->addIndexOutput("Idx", idx);
    ASSERT_TRUE(f->compile());

    std::vector<double > args;
    args.push_back(0.7);
    args.push_back(3.0);
    std::vector<Eigen::MatrixXd > outputs;
    ASSERT_TRUE(f->evaluate(args, outputs));
    ASSERT_EQ(3, outputs.size());
    EXPECT_NEAR(std::sin(0.7) * 3.0, outputs[0](0, 0), 1.0e-12);
    EXPECT_NEAR(std::cos(0.7) * std::cos(0.7) + 0.25, outputs[0](1, 0), 1.0e-12);
    EXPECT_NEAR(0.7 * 0.7 * 0.7, outputs[1](0, 0), 1.0e-12);
    EXPECT_EQ(0, static_cast<int >(outputs[2](0, 0)));
    EXPECT_EQ(3, static_cast<int >(outputs[2](1, 0)));

    EXPECT_EQ(1, f->getOutputIndex("s"));
    EXPECT_EQ(-1, f->getOutputIndex("w"));

    // wrong number of arguments
    args.push_back(1.0);
    EXPECT_FALSE(f->evaluate(args, outputs));
}

TEST(CompiledFunctionTest, UnresolvedSymbolIsRejected) {
    boost::shared_ptr<CompiledFunction > f(new CompiledFunction("f", makeInputs("q1", "q2")));
    f->addOutput("x", 1, 1, std::vector<Expression >(1, Expression::sin("q1") * Expression::symbol("l1")));
    EXPECT_FALSE(f->compile());
    EXPECT_FALSE(f->isCompiled());

    std::vector<double > args(2, 0.0);
    std::vector<Eigen::MatrixXd > outputs;
    EXPECT_FALSE(f->evaluate(args, outputs));

    CodeGenerator generator;
    EXPECT_FALSE(generator.addFunction(f));
    EXPECT_EQ(0, generator.getFunctionsCount());
}

TEST(CodeGeneratorTest, EmitsFunctions) {
    boost::shared_ptr<CompiledFunction > f(new CompiledFunction("pendulum", makeInputs("q", "l")));
    Expression l = Expression::symbol("l");
    std::vector<Expression > P;
    P.push_back(-(l * Expression::sin("q")));
    P.push_back(l * Expression::cos("q"));
    f->addOutput("P", 2, 1, P);
    f->addOutput("h", 1, 1, std::vector<Expression >(1, l * Expression::cos("q") + 2.0));
    std::vector<Expression > M;
    M.push_back(l * l);
    M.push_back(Expression());
    M.push_back(Expression());
    M.push_back(Expression(1.5));
    f->addOutput("M", 2, 2, M);

    CodeGenerator generator;
    ASSERT_TRUE(generator.addFunction(f));
    EXPECT_EQ(1, generator.getFunctionsCount());
    ASSERT_TRUE(generator.getFunction("pendulum"));
    EXPECT_FALSE(generator.getFunction("other"));

    // names are unique
    boost::shared_ptr<CompiledFunction > f2(new CompiledFunction("pendulum", makeInputs("q", "l")));
    EXPECT_FALSE(generator.addFunction(f2));

    std::string header, source;
    generator.writeHeader("PENDULUM_GEN_H__", header);
    generator.writeSource("pendulum_gen.h", source);

    const std::string signature("void pendulum(double q, double l, Eigen::VectorXd &P, double &h, Eigen::MatrixXd &M)");
    EXPECT_NE(std::string::npos, header.find("#ifndef PENDULUM_GEN_H__"));
    EXPECT_NE(std::string::npos, header.find(signature + ";"));
    EXPECT_NE(std::string::npos, source.find("#include \"pendulum_gen.h\""));
    EXPECT_NE(std::string::npos, source.find(signature + " {"));

    // trigonometric terms are computed once
    EXPECT_NE(std::string::npos, source.find("= sin(q);"));
    EXPECT_NE(std::string::npos, source.find("= cos(q);"));
    EXPECT_EQ(source.find("cos(q)"), source.rfind("cos(q)"));

    EXPECT_NE(std::string::npos, source.find("P.resize(2);"));
    EXPECT_NE(std::string::npos, source.find("M.resize(2,2);"));
    EXPECT_NE(std::string::npos, source.find("M(0,0) = l*l;"));
    EXPECT_NE(std::string::npos, source.find("M(1,0) = 0.0;"));
    EXPECT_NE(std::string::npos, source.find("M(1,1) = 1.5;"));
}

TEST(CodeGeneratorTest, IncludeGuard) {
    EXPECT_EQ("FIVE_LINK_BIPED_GEN_H__", CodeGenerator::getIncludeGuard("five_link_biped_gen"));
    EXPECT_EQ("BIPED_2_GEN_H__", CodeGenerator::getIncludeGuard("biped-2.gen"));

    // bytes outside ASCII are replaced, not passed to toupper
    std::string prefix("gen");
    prefix += static_cast<char >(0xc3);
    prefix += static_cast<char >(0xa9);
    EXPECT_EQ("GEN___H__", CodeGenerator::getIncludeGuard(prefix));
}

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


#ifndef COMPILED_FUNCTION_H__
#define COMPILED_FUNCTION_H__

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "Eigen/Dense"

#include "expression.h"

// Numeric evaluator of a set of symbolic outputs with a fixed, ordered list
// of scalar inputs. compile() flattens the expressions into a table of atoms
// (inputs, sin/cos of inputs, reciprocals) and lists of monomials over it;
// an atom that cannot be bound to a declared input fails the compilation.
class CompiledFunction {
public:
    class Output {
    public:
        std::string name_;
        int rows_;
        int cols_;
        bool is_index_;
        std::vector<Expression > values_;   // column-major
        std::vector<int > indices_;
    };

    class Term {
    public:
        double coefficient_;
        std::vector<std::pair<int, int > > factors_;   // slot, power
    };
    typedef std::vector<Term > Polynomial;

    class Slot {
    public:
        ExpressionAtom::Type type_;
        int input_;     // SYMBOL, SIN, COS
        int inner_;     // INVERSE: index of the inner polynomial
    };

    CompiledFunction(const std::string &name, const std::vector<std::string > &inputs);
    ~CompiledFunction();

    void addOutput(const std::string &name, int rows, int cols, const std::vector<Expression > &values);
    void addIndexOutput(const std::string &name, const std::vector<int > &indices);

    bool compile();
    bool isCompiled() const;

    // one matrix per output, index outputs as a column of indices
    bool evaluate(const std::vector<double > &args, std::vector<Eigen::MatrixXd > &outputs) const;

    const std::string& getName() const;
    const std::vector<std::string >& getInputs() const;
    int getOutputsCount() const;
    const Output& getOutput(int output_idx) const;
    int getOutputIndex(const std::string &name) const;

    // slots are ordered so that every slot depends only on earlier ones
    const std::vector<Slot >& getSlots() const;
    const Polynomial& getInnerPolynomial(int inner_idx) const;
    const Polynomial& getOutputPolynomial(int output_idx, int entry_idx) const;

protected:
    bool compilePolynomial(const Expression &expr, const std::string &context, Polynomial &poly);
    int registerAtom(const ExpressionAtom &atom, const std::string &context);
    double evaluatePolynomial(const Polynomial &poly, const std::vector<double > &values) const;

    std::string name_;
    std::vector<std::string > inputs_;
    std::map<std::string, int > input_idx_map_;
    std::vector<Output > outputs_;

    bool compiled_;
    std::vector<Slot > slots_;
    std::map<std::string, int > slot_idx_map_;
    std::vector<Polynomial > inner_polys_;
    std::vector<std::vector<Polynomial > > output_polys_;
};

#endif  // COMPILED_FUNCTION_H__

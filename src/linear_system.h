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


#ifndef LINEAR_SYSTEM_H__
#define LINEAR_SYSTEM_H__

#include <string>
#include <vector>

#include "Eigen/Dense"

#include "expression.h"

// Symbolic system A x = b. A is stored column-major.
class LinearSystem {
public:
    LinearSystem();
    LinearSystem(int rows, int cols);
    ~LinearSystem();

    void resize(int rows, int cols);
    int rows() const;
    int cols() const;

    Expression& A(int row, int col);
    const Expression& A(int row, int col) const;
    Expression& b(int row);
    const Expression& b(int row) const;

    const std::vector<Expression >& getMatrix() const;
    const std::vector<Expression >& getVector() const;

    void setUnknowns(const std::vector<std::string > &unknowns);
    const std::vector<std::string >& getUnknowns() const;

    // column-major linear indices (row + col * rows) of the entries of A
    // that are not identically zero
    void getSparsePattern(std::vector<int > &idx) const;
    void getNonzeroEntries(std::vector<Expression > &values) const;

    // (R A) x = R b
    void transformRows(const Eigen::MatrixXd &R, LinearSystem &result) const;

protected:
    int rows_;
    int cols_;
    std::vector<Expression > A_;
    std::vector<Expression > b_;
    std::vector<std::string > unknowns_;
};

// Splits equations = A x - b into A and b. Fails when any term is not linear
// in the unknowns.
bool extractLinearSystem(const std::vector<Expression > &equations, const std::vector<std::string > &unknowns, LinearSystem &system);

// Closed-form solution of a 2x2 system by Cramer's rule. Fails when the
// determinant is identically zero.
bool solveLinearSystem2x2(const LinearSystem &system, std::vector<Expression > &x);

#endif  // LINEAR_SYSTEM_H__

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


#include "linear_system.h"

#include <map>

#include <ros/console.h>

    LinearSystem::LinearSystem() :
        rows_(0),
        cols_(0)
    {
    }

    LinearSystem::LinearSystem(int rows, int cols) {
        resize(rows, cols);
    }

    LinearSystem::~LinearSystem() {
    }

    void LinearSystem::resize(int rows, int cols) {
        rows_ = rows;
        cols_ = cols;
        A_.assign(rows * cols, Expression());
        b_.assign(rows, Expression());
    }

    int LinearSystem::rows() const {
        return rows_;
    }

    int LinearSystem::cols() const {
        return cols_;
    }

    Expression& LinearSystem::A(int row, int col) {
        return A_[row + col * rows_];
    }

    const Expression& LinearSystem::A(int row, int col) const {
        return A_[row + col * rows_];
    }

    Expression& LinearSystem::b(int row) {
        return b_[row];
    }

    const Expression& LinearSystem::b(int row) const {
        return b_[row];
    }

    const std::vector<Expression >& LinearSystem::getMatrix() const {
        return A_;
    }

    const std::vector<Expression >& LinearSystem::getVector() const {
        return b_;
    }

    void LinearSystem::setUnknowns(const std::vector<std::string > &unknowns) {
        unknowns_ = unknowns;
    }

    const std::vector<std::string >& LinearSystem::getUnknowns() const {
        return unknowns_;
    }

    void LinearSystem::getSparsePattern(std::vector<int > &idx) const {
        idx.clear();
        for (int i = 0; i < A_.size(); i++) {
            if (!A_[i].isZero()) {
                idx.push_back(i);
            }
        }
    }

    void LinearSystem::getNonzeroEntries(std::vector<Expression > &values) const {
        values.clear();
        for (int i = 0; i < A_.size(); i++) {
            if (!A_[i].isZero()) {
                values.push_back(A_[i]);
            }
        }
    }

    void LinearSystem::transformRows(const Eigen::MatrixXd &R, LinearSystem &result) const {
        result.resize(R.rows(), cols_);
        result.setUnknowns(unknowns_);
        for (int row = 0; row < R.rows(); row++) {
            for (int k = 0; k < rows_; k++) {
                if (R(row, k) == 0.0) {
                    continue;
                }
                Expression r(R(row, k));
                for (int col = 0; col < cols_; col++) {
                    result.A(row, col) += r * A(k, col);
                }
                result.b(row) += r * b(k);
            }
        }
    }

    bool extractLinearSystem(const std::vector<Expression > &equations, const std::vector<std::string > &unknowns, LinearSystem &system) {
        std::map<std::string, int > unknown_idx_map;
        for (int u_idx = 0; u_idx < unknowns.size(); u_idx++) {
            unknown_idx_map.insert( std::make_pair(unknowns[u_idx], u_idx) );
        }

        system.resize(equations.size(), unknowns.size());
        system.setUnknowns(unknowns);

        for (int row = 0; row < equations.size(); row++) {
            const Expression::TermMap &terms = equations[row].getTerms();
            for (Expression::TermMap::const_iterator t_it = terms.begin(); t_it != terms.end(); t_it++) {
                const ExpressionTerm &term = t_it->second;
                int degree = 0;
                int col = -1;
                for (ExpressionTerm::FactorMap::const_iterator f_it = term.factors_.begin(); f_it != term.factors_.end(); f_it++) {
                    const ExpressionAtom &atom = f_it->second.first;
                    if (atom.getType() == ExpressionAtom::SYMBOL) {
                        std::map<std::string, int >::const_iterator u_it = unknown_idx_map.find(atom.getName());
                        if (u_it != unknown_idx_map.end()) {
                            degree += f_it->second.second;
                            col = u_it->second;
                        }
                        continue;
                    }
                    for (int u_idx = 0; u_idx < unknowns.size(); u_idx++) {
                        if (atom.dependsOn(unknowns[u_idx])) {
                            ROS_ERROR("ERROR: extractLinearSystem: equation %d is not linear in %s: the unknown appears in %s",
                                row, unknowns[u_idx].c_str(), atom.getKey().c_str());
                            return false;
                        }
                    }
                }

                if (degree > 1) {
                    ROS_ERROR("ERROR: extractLinearSystem: equation %d is not linear in %s: term %s",
                        row, unknowns[col].c_str(), t_it->first.c_str());
                    return false;
                }

                if (degree == 0) {
                    system.b(row) -= Expression::term(term);
                    continue;
                }

                ExpressionTerm coefficient(term);
                coefficient.factors_.erase(unknowns[col]);
                system.A(row, col) += Expression::term(coefficient);
            }
        }
        return true;
    }

    bool solveLinearSystem2x2(const LinearSystem &system, std::vector<Expression > &x) {
        if (system.rows() != 2 || system.cols() != 2) {
            ROS_ERROR("ERROR: solveLinearSystem2x2: wrong system size: %d x %d", system.rows(), system.cols());
            return false;
        }

        Expression det = system.A(0, 0) * system.A(1, 1) - system.A(0, 1) * system.A(1, 0);
        Expression det_inv;
        if (!det.inverse(det_inv)) {
            ROS_ERROR("ERROR: solveLinearSystem2x2: the system matrix is singular");
            return false;
        }

        x.resize(2);
        x[0] = (system.A(1, 1) * system.b(0) - system.A(0, 1) * system.b(1)) * det_inv;
        x[1] = (system.A(0, 0) * system.b(1) - system.A(1, 0) * system.b(0)) * det_inv;
        return true;
    }

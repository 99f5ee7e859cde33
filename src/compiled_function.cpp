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


#include "compiled_function.h"

#include <cmath>

#include <ros/console.h>

    CompiledFunction::CompiledFunction(const std::string &name, const std::vector<std::string > &inputs) :
        name_(name),
        inputs_(inputs),
        compiled_(false)
    {
        for (int in_idx = 0; in_idx < inputs_.size(); in_idx++) {
            input_idx_map_.insert( std::make_pair(inputs_[in_idx], in_idx) );
        }
    }

    CompiledFunction::~CompiledFunction() {
    }

    void CompiledFunction::addOutput(const std::string &name, int rows, int cols, const std::vector<Expression > &values) {
        Output out;
        out.name_ = name;
        out.rows_ = rows;
        out.cols_ = cols;
        out.is_index_ = false;
        out.values_ = values;
        outputs_.push_back(out);
        compiled_ = false;
    }

    void CompiledFunction::addIndexOutput(const std::string &name, const std::vector<int > &indices) {
        Output out;
        out.name_ = name;
        out.rows_ = indices.size();
        out.cols_ = 1;
        out.is_index_ = true;
        out.indices_ = indices;
        outputs_.push_back(out);
        compiled_ = false;
    }

    bool CompiledFunction::compile() {
        compiled_ = false;
        slots_.clear();
        slot_idx_map_.clear();
        inner_polys_.clear();
        output_polys_.clear();

        for (int out_idx = 0; out_idx < outputs_.size(); out_idx++) {
            const Output &out = outputs_[out_idx];
            output_polys_.push_back( std::vector<Polynomial >() );
            if (out.is_index_) {
                continue;
            }
            if (out.values_.size() != out.rows_ * out.cols_) {
                ROS_ERROR("ERROR: CompiledFunction::compile: %s: output %s has %d values, expected %d x %d",
                    name_.c_str(), out.name_.c_str(), static_cast<int >(out.values_.size()), out.rows_, out.cols_);
                return false;
            }
            output_polys_[out_idx].resize(out.values_.size());
            for (int entry_idx = 0; entry_idx < out.values_.size(); entry_idx++) {
                if (!compilePolynomial(out.values_[entry_idx], out.name_, output_polys_[out_idx][entry_idx])) {
                    return false;
                }
            }
        }
        compiled_ = true;
        return true;
    }

    bool CompiledFunction::isCompiled() const {
        return compiled_;
    }

    bool CompiledFunction::evaluate(const std::vector<double > &args, std::vector<Eigen::MatrixXd > &outputs) const {
        if (!compiled_) {
            ROS_ERROR("ERROR: CompiledFunction::evaluate: %s is not compiled", name_.c_str());
            return false;
        }
        if (args.size() != inputs_.size()) {
            ROS_ERROR("ERROR: CompiledFunction::evaluate: %s expects %d arguments, got %d",
                name_.c_str(), static_cast<int >(inputs_.size()), static_cast<int >(args.size()));
            return false;
        }

        std::vector<double > values(slots_.size());
        for (int slot_idx = 0; slot_idx < slots_.size(); slot_idx++) {
            const Slot &slot = slots_[slot_idx];
            switch (slot.type_) {
            case ExpressionAtom::SYMBOL:
                values[slot_idx] = args[slot.input_];
                break;
            case ExpressionAtom::SIN:
                values[slot_idx] = std::sin(args[slot.input_]);
                break;
            case ExpressionAtom::COS:
                values[slot_idx] = std::cos(args[slot.input_]);
                break;
            case ExpressionAtom::INVERSE:
                values[slot_idx] = 1.0 / evaluatePolynomial(inner_polys_[slot.inner_], values);
                break;
            }
        }

        outputs.resize(outputs_.size());
        for (int out_idx = 0; out_idx < outputs_.size(); out_idx++) {
            const Output &out = outputs_[out_idx];
            outputs[out_idx].resize(out.rows_, out.cols_);
            if (out.is_index_) {
                for (int i = 0; i < out.indices_.size(); i++) {
                    outputs[out_idx](i, 0) = out.indices_[i];
                }
                continue;
            }
            for (int col = 0; col < out.cols_; col++) {
                for (int row = 0; row < out.rows_; row++) {
                    outputs[out_idx](row, col) = evaluatePolynomial(output_polys_[out_idx][row + col * out.rows_], values);
                }
            }
        }
        return true;
    }

    const std::string& CompiledFunction::getName() const {
        return name_;
    }

    const std::vector<std::string >& CompiledFunction::getInputs() const {
        return inputs_;
    }

    int CompiledFunction::getOutputsCount() const {
        return outputs_.size();
    }

    const CompiledFunction::Output& CompiledFunction::getOutput(int output_idx) const {
        return outputs_[output_idx];
    }

    int CompiledFunction::getOutputIndex(const std::string &name) const {
        for (int out_idx = 0; out_idx < outputs_.size(); out_idx++) {
            if (outputs_[out_idx].name_ == name) {
                return out_idx;
            }
        }
        return -1;
    }

    const std::vector<CompiledFunction::Slot >& CompiledFunction::getSlots() const {
        return slots_;
    }

    const CompiledFunction::Polynomial& CompiledFunction::getInnerPolynomial(int inner_idx) const {
        return inner_polys_[inner_idx];
    }

    const CompiledFunction::Polynomial& CompiledFunction::getOutputPolynomial(int output_idx, int entry_idx) const {
        return output_polys_[output_idx][entry_idx];
    }

    bool CompiledFunction::compilePolynomial(const Expression &expr, const std::string &context, Polynomial &poly) {
        poly.clear();
        const Expression::TermMap &terms = expr.getTerms();
        for (Expression::TermMap::const_iterator t_it = terms.begin(); t_it != terms.end(); t_it++) {
            Term term;
            term.coefficient_ = t_it->second.coefficient_;
            const ExpressionTerm::FactorMap &factors = t_it->second.factors_;
            for (ExpressionTerm::FactorMap::const_iterator f_it = factors.begin(); f_it != factors.end(); f_it++) {
                int slot_idx = registerAtom(f_it->second.first, context);
                if (slot_idx < 0) {
                    return false;
                }
                term.factors_.push_back( std::make_pair(slot_idx, f_it->second.second) );
            }
            poly.push_back(term);
        }
        return true;
    }

    int CompiledFunction::registerAtom(const ExpressionAtom &atom, const std::string &context) {
        std::map<std::string, int >::const_iterator it = slot_idx_map_.find(atom.getKey());
        if (it != slot_idx_map_.end()) {
            return it->second;
        }

        Slot slot;
        slot.type_ = atom.getType();
        slot.input_ = -1;
        slot.inner_ = -1;

        if (atom.getType() == ExpressionAtom::INVERSE) {
            Polynomial inner;
            if (!compilePolynomial(atom.getInner(), context, inner)) {
                return -1;
            }
            slot.inner_ = inner_polys_.size();
            inner_polys_.push_back(inner);
        }
        else {
            std::map<std::string, int >::const_iterator in_it = input_idx_map_.find(atom.getName());
            if (in_it == input_idx_map_.end()) {
                ROS_ERROR("ERROR: CompiledFunction::registerAtom: %s: output %s references %s which is not a declared input",
                    name_.c_str(), context.c_str(), atom.getName().c_str());
                return -1;
            }
            slot.input_ = in_it->second;
        }

        int slot_idx = slots_.size();
        slots_.push_back(slot);
        slot_idx_map_.insert( std::make_pair(atom.getKey(), slot_idx) );
        return slot_idx;
    }

    double CompiledFunction::evaluatePolynomial(const Polynomial &poly, const std::vector<double > &values) const {
        double result = 0.0;
        for (Polynomial::const_iterator t_it = poly.begin(); t_it != poly.end(); t_it++) {
            double term = t_it->coefficient_;
            for (std::vector<std::pair<int, int > >::const_iterator f_it = t_it->factors_.begin(); f_it != t_it->factors_.end(); f_it++) {
                double value = values[f_it->first];
                for (int p = 0; p < f_it->second; p++) {
                    term *= value;
                }
            }
            result += term;
        }
        return result;
    }

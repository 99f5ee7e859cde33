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


#include "code_generator.h"

#include <cmath>
#include <ctype.h>
#include <sstream>

#include <ros/console.h>

    CodeGenerator::CodeGenerator() {
    }

    CodeGenerator::~CodeGenerator() {
    }

    bool CodeGenerator::addFunction(const boost::shared_ptr<CompiledFunction > &function) {
        if (getFunction(function->getName())) {
            ROS_ERROR("ERROR: CodeGenerator::addFunction: function %s is already defined", function->getName().c_str());
            return false;
        }
        if (!function->compile()) {
            ROS_ERROR("ERROR: CodeGenerator::addFunction: could not compile function %s", function->getName().c_str());
            return false;
        }
        functions_.push_back(function);
        return true;
    }

    int CodeGenerator::getFunctionsCount() const {
        return functions_.size();
    }

    boost::shared_ptr<const CompiledFunction > CodeGenerator::getFunction(const std::string &name) const {
        for (int f_idx = 0; f_idx < functions_.size(); f_idx++) {
            if (functions_[f_idx]->getName() == name) {
                return functions_[f_idx];
            }
        }
        return boost::shared_ptr<const CompiledFunction >();
    }

    std::string CodeGenerator::getIncludeGuard(const std::string &file_prefix) {
        std::string guard;
        for (std::string::const_iterator it = file_prefix.begin(); it != file_prefix.end(); it++) {
            unsigned char c = static_cast<unsigned char >(*it);
            if (c < 128 && isalnum(c)) {
                guard += static_cast<char >(toupper(c));
            }
            else {
                guard += '_';
            }
        }
        return guard + "_H__";
    }

    void CodeGenerator::writeHeader(const std::string &include_guard, std::string &header) const {
        std::ostringstream os;
        os << "// generated by derive_biped, do not edit" << std::endl;
        os << std::endl;
        os << "#ifndef " << include_guard << std::endl;
        os << "#define " << include_guard << std::endl;
        os << std::endl;
        os << "#include \"Eigen/Dense\"" << std::endl;
        os << std::endl;
        for (int f_idx = 0; f_idx < functions_.size(); f_idx++) {
            writeSignature(*functions_[f_idx], os);
            os << ";" << std::endl;
            os << std::endl;
        }
        os << "#endif  // " << include_guard << std::endl;
        header = os.str();
    }

    void CodeGenerator::writeSource(const std::string &header_name, std::string &source) const {
        std::ostringstream os;
        os << "// generated by derive_biped, do not edit" << std::endl;
        os << std::endl;
        os << "#include \"" << header_name << "\"" << std::endl;
        os << std::endl;
        os << "#include <math.h>" << std::endl;
        for (int f_idx = 0; f_idx < functions_.size(); f_idx++) {
            os << std::endl;
            writeSignature(*functions_[f_idx], os);
            os << " {" << std::endl;
            writeBody(*functions_[f_idx], os);
            os << "}" << std::endl;
        }
        source = os.str();
    }

    void CodeGenerator::writeSignature(const CompiledFunction &function, std::ostream &os) const {
        os << "void " << function.getName() << "(";
        const std::vector<std::string > &inputs = function.getInputs();
        bool first = true;
        for (int in_idx = 0; in_idx < inputs.size(); in_idx++) {
            os << (first ? "" : ", ") << "double " << inputs[in_idx];
            first = false;
        }
        for (int out_idx = 0; out_idx < function.getOutputsCount(); out_idx++) {
            const CompiledFunction::Output &out = function.getOutput(out_idx);
            os << (first ? "" : ", ");
            first = false;
            if (out.is_index_) {
                os << "Eigen::VectorXi &";
            }
            else if (out.rows_ == 1 && out.cols_ == 1) {
                os << "double &";
            }
            else if (out.cols_ == 1) {
                os << "Eigen::VectorXd &";
            }
            else {
                os << "Eigen::MatrixXd &";
            }
            os << out.name_;
        }
        os << ")";
    }

    void CodeGenerator::writeBody(const CompiledFunction &function, std::ostream &os) const {
        const std::vector<CompiledFunction::Slot > &slots = function.getSlots();
        for (int slot_idx = 0; slot_idx < slots.size(); slot_idx++) {
            const CompiledFunction::Slot &slot = slots[slot_idx];
            if (slot.type_ == ExpressionAtom::SYMBOL) {
                continue;
            }
            os << "  const double " << getSlotName(function, slot_idx) << " = ";
            if (slot.type_ == ExpressionAtom::SIN) {
                os << "sin(" << function.getInputs()[slot.input_] << ")";
            }
            else if (slot.type_ == ExpressionAtom::COS) {
                os << "cos(" << function.getInputs()[slot.input_] << ")";
            }
            else {
                os << "1.0/(" << printPolynomial(function, function.getInnerPolynomial(slot.inner_)) << ")";
            }
            os << ";" << std::endl;
        }

        for (int out_idx = 0; out_idx < function.getOutputsCount(); out_idx++) {
            const CompiledFunction::Output &out = function.getOutput(out_idx);
            os << std::endl;
            if (out.is_index_) {
                os << "  " << out.name_ << ".resize(" << out.rows_ << ");" << std::endl;
                for (int i = 0; i < out.indices_.size(); i++) {
                    os << "  " << out.name_ << "(" << i << ") = " << out.indices_[i] << ";" << std::endl;
                }
            }
            else if (out.rows_ == 1 && out.cols_ == 1) {
                os << "  " << out.name_ << " = " << printPolynomial(function, function.getOutputPolynomial(out_idx, 0)) << ";" << std::endl;
            }
            else if (out.cols_ == 1) {
                os << "  " << out.name_ << ".resize(" << out.rows_ << ");" << std::endl;
                for (int row = 0; row < out.rows_; row++) {
                    os << "  " << out.name_ << "(" << row << ") = "
                        << printPolynomial(function, function.getOutputPolynomial(out_idx, row)) << ";" << std::endl;
                }
            }
            else {
                os << "  " << out.name_ << ".resize(" << out.rows_ << "," << out.cols_ << ");" << std::endl;
                for (int col = 0; col < out.cols_; col++) {
                    for (int row = 0; row < out.rows_; row++) {
                        os << "  " << out.name_ << "(" << row << "," << col << ") = "
                            << printPolynomial(function, function.getOutputPolynomial(out_idx, row + col * out.rows_)) << ";" << std::endl;
                    }
                }
            }
        }
    }

    std::string CodeGenerator::getSlotName(const CompiledFunction &function, int slot_idx) const {
        const CompiledFunction::Slot &slot = function.getSlots()[slot_idx];
        if (slot.type_ == ExpressionAtom::SYMBOL) {
            return function.getInputs()[slot.input_];
        }
        std::ostringstream os;
        os << "t" << slot_idx;
        return os.str();
    }

    std::string CodeGenerator::printPolynomial(const CompiledFunction &function, const CompiledFunction::Polynomial &poly) const {
        if (poly.empty()) {
            return "0.0";
        }
        std::string str;
        for (CompiledFunction::Polynomial::const_iterator t_it = poly.begin(); t_it != poly.end(); t_it++) {
            double coefficient = t_it->coefficient_;
            if (str.empty()) {
                if (coefficient < 0.0) {
                    str += "-";
                }
            }
            else {
                str += (coefficient < 0.0) ? "-" : "+";
            }

            std::string product;
            for (std::vector<std::pair<int, int > >::const_iterator f_it = t_it->factors_.begin(); f_it != t_it->factors_.end(); f_it++) {
                std::string name = getSlotName(function, f_it->first);
                for (int p = 0; p < f_it->second; p++) {
                    product += (product.empty() ? "" : "*") + name;
                }
            }

            double abs_coefficient = std::fabs(coefficient);
            if (product.empty()) {
                str += formatCoefficient(abs_coefficient);
            }
            else if (abs_coefficient == 1.0) {
                str += product;
            }
            else {
                str += product + "*" + formatCoefficient(abs_coefficient);
            }
        }
        return str;
    }

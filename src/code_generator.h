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


#ifndef CODE_GENERATOR_H__
#define CODE_GENERATOR_H__

#include <string>
#include <vector>
#include <ostream>

#include <boost/shared_ptr.hpp>

#include "compiled_function.h"

// Collection of compiled functions emitted together as a C++ header and
// source. Every function takes its inputs as scalar doubles in the declared
// order and writes its outputs to Eigen arguments:
//   index output        -> Eigen::VectorXi&
//   1 x 1 output        -> double&
//   n x 1 output        -> Eigen::VectorXd&
//   n x m output        -> Eigen::MatrixXd&
class CodeGenerator {
public:
    CodeGenerator();
    ~CodeGenerator();

    // compiles the function; fails on compilation errors and name clashes
    bool addFunction(const boost::shared_ptr<CompiledFunction > &function);

    int getFunctionsCount() const;
    boost::shared_ptr<const CompiledFunction > getFunction(const std::string &name) const;

    // upper case file name with "_H__", characters other than letters and
    // digits become '_'
    static std::string getIncludeGuard(const std::string &file_prefix);

    void writeHeader(const std::string &include_guard, std::string &header) const;
    void writeSource(const std::string &header_name, std::string &source) const;

protected:
    void writeSignature(const CompiledFunction &function, std::ostream &os) const;
    void writeBody(const CompiledFunction &function, std::ostream &os) const;
    std::string getSlotName(const CompiledFunction &function, int slot_idx) const;
    std::string printPolynomial(const CompiledFunction &function, const CompiledFunction::Polynomial &poly) const;

    std::vector<boost::shared_ptr<CompiledFunction > > functions_;
};

#endif  // CODE_GENERATOR_H__

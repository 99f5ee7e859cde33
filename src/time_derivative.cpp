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


#include "time_derivative.h"

    TimeDerivative::TimeDerivative(const std::vector<std::string > &q, const std::vector<std::string > &dq, const std::vector<std::string > &ddq) :
        q_(q),
        dq_(dq),
        ddq_(ddq)
    {
    }

    TimeDerivative::~TimeDerivative() {
    }

    Expression TimeDerivative::first(const Expression &f) const {
        Expression result;
        for (int q_idx = 0; q_idx < q_.size(); q_idx++) {
            result += f.diff(q_[q_idx]) * Expression::symbol(dq_[q_idx]);
            result += f.diff(dq_[q_idx]) * Expression::symbol(ddq_[q_idx]);
        }
        return result;
    }

    Expression TimeDerivative::second(const Expression &f) const {
        return first(first(f));
    }

    Vector2Expression TimeDerivative::first(const Vector2Expression &f) const {
        return Vector2Expression(first(f.x()), first(f.y()));
    }

    Vector2Expression TimeDerivative::second(const Vector2Expression &f) const {
        return Vector2Expression(second(f.x()), second(f.y()));
    }

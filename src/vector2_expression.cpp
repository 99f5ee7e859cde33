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


#include "vector2_expression.h"

    Vector2Expression::Vector2Expression() {
    }

    Vector2Expression::Vector2Expression(const Expression &x, const Expression &y) :
        x_(x),
        y_(y)
    {
    }

    const Expression& Vector2Expression::x() const {
        return x_;
    }

    const Expression& Vector2Expression::y() const {
        return y_;
    }

    Vector2Expression& Vector2Expression::operator+=(const Vector2Expression &v) {
        x_ += v.x_;
        y_ += v.y_;
        return *this;
    }

    Vector2Expression& Vector2Expression::operator-=(const Vector2Expression &v) {
        x_ -= v.x_;
        y_ -= v.y_;
        return *this;
    }

    Vector2Expression operator-(const Vector2Expression &v) {
        return Vector2Expression(-v.x(), -v.y());
    }

    Vector2Expression operator+(const Vector2Expression &a, const Vector2Expression &b) {
        Vector2Expression result(a);
        result += b;
        return result;
    }

    Vector2Expression operator-(const Vector2Expression &a, const Vector2Expression &b) {
        Vector2Expression result(a);
        result -= b;
        return result;
    }

    Vector2Expression operator*(const Expression &s, const Vector2Expression &v) {
        return Vector2Expression(s * v.x(), s * v.y());
    }

    Expression cross2d(const Vector2Expression &a, const Vector2Expression &b) {
        return a.x() * b.y() - a.y() * b.x();
    }

    Expression dot(const Vector2Expression &a, const Vector2Expression &b) {
        return a.x() * b.x() + a.y() * b.y();
    }

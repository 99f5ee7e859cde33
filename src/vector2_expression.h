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


#ifndef VECTOR2_EXPRESSION_H__
#define VECTOR2_EXPRESSION_H__

#include "expression.h"

// planar vector in the horizontal (x) / vertical (y) basis
class Vector2Expression {
public:
    Vector2Expression();
    Vector2Expression(const Expression &x, const Expression &y);

    const Expression& x() const;
    const Expression& y() const;

    Vector2Expression& operator+=(const Vector2Expression &v);
    Vector2Expression& operator-=(const Vector2Expression &v);

protected:
    Expression x_;
    Expression y_;
};

Vector2Expression operator-(const Vector2Expression &v);
Vector2Expression operator+(const Vector2Expression &a, const Vector2Expression &b);
Vector2Expression operator-(const Vector2Expression &a, const Vector2Expression &b);
Vector2Expression operator*(const Expression &s, const Vector2Expression &v);

// z component of the 3-D cross product: a.x * b.y - a.y * b.x
Expression cross2d(const Vector2Expression &a, const Vector2Expression &b);
Expression dot(const Vector2Expression &a, const Vector2Expression &b);

#endif  // VECTOR2_EXPRESSION_H__

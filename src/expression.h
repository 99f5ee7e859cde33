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


#ifndef EXPRESSION_H__
#define EXPRESSION_H__

#include <map>
#include <set>
#include <string>
#include <utility>

#include <boost/shared_ptr.hpp>

class Expression;

// Factor of a monomial: a symbol, sin or cos of a symbol, or the reciprocal
// of an expression. Atoms are ordered and compared by their key.
class ExpressionAtom {
public:
    enum Type {SYMBOL, SIN, COS, INVERSE};

    ExpressionAtom();
    ExpressionAtom(Type type, const std::string &name);
    explicit ExpressionAtom(const boost::shared_ptr<const Expression> &inner);

    Type getType() const;
    const std::string& getName() const;
    const Expression& getInner() const;
    const std::string& getKey() const;

    bool dependsOn(const std::string &symbol_name) const;
    Expression derivative(const std::string &symbol_name) const;
    bool evaluate(const std::map<std::string, double > &values, double &value) const;
    void getSymbols(std::set<std::string > &symbols) const;

protected:
    Type type_;
    std::string name_;
    boost::shared_ptr<const Expression> inner_;
    std::string key_;
};

// coefficient * product of atoms raised to positive powers
class ExpressionTerm {
public:
    typedef std::map<std::string, std::pair<ExpressionAtom, int > > FactorMap;

    ExpressionTerm();
    explicit ExpressionTerm(double coefficient);

    std::string getKey() const;

    double coefficient_;
    FactorMap factors_;
};

// Exact multivariate expression kept as a canonical sum of monomials.
// Terms with equal monomials are merged, terms that sum up to zero vanish.
class Expression {
public:
    typedef std::map<std::string, ExpressionTerm > TermMap;

    Expression();
    Expression(double value);

    static Expression symbol(const std::string &name);
    static Expression sin(const std::string &symbol_name);
    static Expression cos(const std::string &symbol_name);
    static Expression atom(const ExpressionAtom &atom, int power);
    static Expression term(const ExpressionTerm &term);

    // 1/(this); fails for the zero expression
    bool inverse(Expression &result) const;

    Expression diff(const std::string &symbol_name) const;

    bool isZero() const;
    bool isConstant() const;
    double getConstant() const;
    int getTermsCount() const;
    const TermMap& getTerms() const;

    void getSymbols(std::set<std::string > &symbols) const;
    bool evaluate(const std::map<std::string, double > &values, double &value) const;
    std::string toString() const;

    Expression& operator+=(const Expression &e);
    Expression& operator-=(const Expression &e);
    Expression& operator*=(const Expression &e);

protected:
    void addTerm(const ExpressionTerm &term);

    TermMap terms_;
};

Expression operator-(const Expression &e);
Expression operator+(const Expression &a, const Expression &b);
Expression operator-(const Expression &a, const Expression &b);
Expression operator*(const Expression &a, const Expression &b);

// shortest decimal form that reads back to the same double, always with a
// decimal point or exponent
std::string formatCoefficient(double value);

#endif  // EXPRESSION_H__

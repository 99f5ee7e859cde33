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


#include "expression.h"

#include <cmath>
#include <stdlib.h>
#include <sstream>
#include <iomanip>

    std::string formatCoefficient(double value) {
        std::string str;
        for (int precision = 1; precision <= 17; precision++) {
            std::ostringstream os;
            os << std::setprecision(precision) << value;
            str = os.str();
            if (strtod(str.c_str(), NULL) == value) {
                break;
            }
        }
        if (str.find_first_of(".eEn") == std::string::npos) {
            str += ".0";
        }
        return str;
    }

    ExpressionAtom::ExpressionAtom() :
        type_(SYMBOL)
    {
    }

    ExpressionAtom::ExpressionAtom(Type type, const std::string &name) :
        type_(type),
        name_(name)
    {
        if (type_ == SIN) {
            key_ = "sin(" + name_ + ")";
        }
        else if (type_ == COS) {
            key_ = "cos(" + name_ + ")";
        }
        else {
            key_ = name_;
        }
    }

    ExpressionAtom::ExpressionAtom(const boost::shared_ptr<const Expression> &inner) :
        type_(INVERSE),
        inner_(inner)
    {
        key_ = "1/(" + inner_->toString() + ")";
    }

    ExpressionAtom::Type ExpressionAtom::getType() const {
        return type_;
    }

    const std::string& ExpressionAtom::getName() const {
        return name_;
    }

    const Expression& ExpressionAtom::getInner() const {
        return *inner_;
    }

    const std::string& ExpressionAtom::getKey() const {
        return key_;
    }

    bool ExpressionAtom::dependsOn(const std::string &symbol_name) const {
        if (type_ == INVERSE) {
            std::set<std::string > symbols;
            inner_->getSymbols(symbols);
            return symbols.count(symbol_name) > 0;
        }
        return name_ == symbol_name;
    }

    Expression ExpressionAtom::derivative(const std::string &symbol_name) const {
        if (!dependsOn(symbol_name)) {
            return Expression();
        }
        switch (type_) {
        case SYMBOL:
            return Expression(1.0);
        case SIN:
            return Expression::cos(name_);
        case COS:
            return -Expression::sin(name_);
        case INVERSE:
            // d(1/P) = -(1/P)^2 dP
            return -(Expression::atom(*this, 2) * inner_->diff(symbol_name));
        }
        return Expression();
    }

    bool ExpressionAtom::evaluate(const std::map<std::string, double > &values, double &value) const {
        if (type_ == INVERSE) {
            double inner_value;
            if (!inner_->evaluate(values, inner_value)) {
                return false;
            }
            value = 1.0 / inner_value;
            return true;
        }

        std::map<std::string, double >::const_iterator it = values.find(name_);
        if (it == values.end()) {
            return false;
        }
        if (type_ == SIN) {
            value = std::sin(it->second);
        }
        else if (type_ == COS) {
            value = std::cos(it->second);
        }
        else {
            value = it->second;
        }
        return true;
    }

    void ExpressionAtom::getSymbols(std::set<std::string > &symbols) const {
        if (type_ == INVERSE) {
            inner_->getSymbols(symbols);
        }
        else {
            symbols.insert(name_);
        }
    }

    ExpressionTerm::ExpressionTerm() :
        coefficient_(0.0)
    {
    }

    ExpressionTerm::ExpressionTerm(double coefficient) :
        coefficient_(coefficient)
    {
    }

    std::string ExpressionTerm::getKey() const {
        std::string key;
        for (FactorMap::const_iterator it = factors_.begin(); it != factors_.end(); it++) {
            if (!key.empty()) {
                key += "*";
            }
            key += it->first;
            if (it->second.second > 1) {
                std::ostringstream os;
                os << "^" << it->second.second;
                key += os.str();
            }
        }
        return key;
    }

    Expression::Expression() {
    }

    Expression::Expression(double value) {
        addTerm(ExpressionTerm(value));
    }

    Expression Expression::symbol(const std::string &name) {
        return atom(ExpressionAtom(ExpressionAtom::SYMBOL, name), 1);
    }

    Expression Expression::sin(const std::string &symbol_name) {
        return atom(ExpressionAtom(ExpressionAtom::SIN, symbol_name), 1);
    }

    Expression Expression::cos(const std::string &symbol_name) {
        return atom(ExpressionAtom(ExpressionAtom::COS, symbol_name), 1);
    }

    Expression Expression::atom(const ExpressionAtom &atom, int power) {
        ExpressionTerm term(1.0);
        term.factors_.insert( std::make_pair(atom.getKey(), std::make_pair(atom, power)) );
        Expression result;
        result.addTerm(term);
        return result;
    }

    Expression Expression::term(const ExpressionTerm &term) {
        Expression result;
        result.addTerm(term);
        return result;
    }

    bool Expression::inverse(Expression &result) const {
        if (isZero()) {
            return false;
        }
        if (isConstant()) {
            result = Expression(1.0 / getConstant());
            return true;
        }
        boost::shared_ptr<const Expression > inner(new Expression(*this));
        result = atom(ExpressionAtom(inner), 1);
        return true;
    }

    Expression Expression::diff(const std::string &symbol_name) const {
        Expression result;
        for (TermMap::const_iterator t_it = terms_.begin(); t_it != terms_.end(); t_it++) {
            const ExpressionTerm &monomial = t_it->second;
            // product rule over the atoms of the monomial
            for (ExpressionTerm::FactorMap::const_iterator f_it = monomial.factors_.begin(); f_it != monomial.factors_.end(); f_it++) {
                const ExpressionAtom &a = f_it->second.first;
                if (!a.dependsOn(symbol_name)) {
                    continue;
                }
                int power = f_it->second.second;
                ExpressionTerm rest(monomial);
                rest.coefficient_ *= static_cast<double >(power);
                if (power == 1) {
                    rest.factors_.erase(f_it->first);
                }
                else {
                    rest.factors_[f_it->first].second = power - 1;
                }
                result += term(rest) * a.derivative(symbol_name);
            }
        }
        return result;
    }

    bool Expression::isZero() const {
        return terms_.empty();
    }

    bool Expression::isConstant() const {
        if (terms_.empty()) {
            return true;
        }
        return terms_.size() == 1 && terms_.begin()->second.factors_.empty();
    }

    double Expression::getConstant() const {
        TermMap::const_iterator it = terms_.find(std::string());
        if (it == terms_.end()) {
            return 0.0;
        }
        return it->second.coefficient_;
    }

    int Expression::getTermsCount() const {
        return terms_.size();
    }

    const Expression::TermMap& Expression::getTerms() const {
        return terms_;
    }

    void Expression::getSymbols(std::set<std::string > &symbols) const {
        for (TermMap::const_iterator t_it = terms_.begin(); t_it != terms_.end(); t_it++) {
            const ExpressionTerm::FactorMap &factors = t_it->second.factors_;
            for (ExpressionTerm::FactorMap::const_iterator f_it = factors.begin(); f_it != factors.end(); f_it++) {
                f_it->second.first.getSymbols(symbols);
            }
        }
    }

    bool Expression::evaluate(const std::map<std::string, double > &values, double &value) const {
        value = 0.0;
        for (TermMap::const_iterator t_it = terms_.begin(); t_it != terms_.end(); t_it++) {
            double term_value = t_it->second.coefficient_;
            const ExpressionTerm::FactorMap &factors = t_it->second.factors_;
            for (ExpressionTerm::FactorMap::const_iterator f_it = factors.begin(); f_it != factors.end(); f_it++) {
                double atom_value;
                if (!f_it->second.first.evaluate(values, atom_value)) {
                    return false;
                }
                for (int p = 0; p < f_it->second.second; p++) {
                    term_value *= atom_value;
                }
            }
            value += term_value;
        }
        return true;
    }

    std::string Expression::toString() const {
        if (terms_.empty()) {
            return "0.0";
        }
        std::string str;
        for (TermMap::const_iterator t_it = terms_.begin(); t_it != terms_.end(); t_it++) {
            double coefficient = t_it->second.coefficient_;
            if (str.empty()) {
                if (coefficient < 0.0) {
                    str += "-";
                }
            }
            else {
                str += (coefficient < 0.0) ? " - " : " + ";
            }
            double abs_coefficient = std::fabs(coefficient);
            if (t_it->first.empty()) {
                str += formatCoefficient(abs_coefficient);
            }
            else if (abs_coefficient == 1.0) {
                str += t_it->first;
            }
            else {
                str += formatCoefficient(abs_coefficient) + "*" + t_it->first;
            }
        }
        return str;
    }

    void Expression::addTerm(const ExpressionTerm &term) {
        if (term.coefficient_ == 0.0) {
            return;
        }
        std::string key = term.getKey();
        TermMap::iterator it = terms_.find(key);
        if (it == terms_.end()) {
            terms_.insert( std::make_pair(key, term) );
            return;
        }
        it->second.coefficient_ += term.coefficient_;
        if (it->second.coefficient_ == 0.0) {
            terms_.erase(it);
        }
    }

    Expression& Expression::operator+=(const Expression &e) {
        for (TermMap::const_iterator it = e.terms_.begin(); it != e.terms_.end(); it++) {
            addTerm(it->second);
        }
        return *this;
    }

    Expression& Expression::operator-=(const Expression &e) {
        for (TermMap::const_iterator it = e.terms_.begin(); it != e.terms_.end(); it++) {
            ExpressionTerm term(it->second);
            term.coefficient_ = -term.coefficient_;
            addTerm(term);
        }
        return *this;
    }

    Expression& Expression::operator*=(const Expression &e) {
        Expression result;
        for (TermMap::const_iterator it1 = terms_.begin(); it1 != terms_.end(); it1++) {
            for (TermMap::const_iterator it2 = e.terms_.begin(); it2 != e.terms_.end(); it2++) {
                ExpressionTerm term(it1->second);
                term.coefficient_ *= it2->second.coefficient_;
                const ExpressionTerm::FactorMap &factors = it2->second.factors_;
                for (ExpressionTerm::FactorMap::const_iterator f_it = factors.begin(); f_it != factors.end(); f_it++) {
                    ExpressionTerm::FactorMap::iterator found = term.factors_.find(f_it->first);
                    if (found == term.factors_.end()) {
                        term.factors_.insert(*f_it);
                    }
                    else {
                        found->second.second += f_it->second.second;
                    }
                }
                result.addTerm(term);
            }
        }
        terms_.swap(result.terms_);
        return *this;
    }

    Expression operator-(const Expression &e) {
        Expression result;
        result -= e;
        return result;
    }

    Expression operator+(const Expression &a, const Expression &b) {
        Expression result(a);
        result += b;
        return result;
    }

    Expression operator-(const Expression &a, const Expression &b) {
        Expression result(a);
        result -= b;
        return result;
    }

    Expression operator*(const Expression &a, const Expression &b) {
        Expression result(a);
        result *= b;
        return result;
    }

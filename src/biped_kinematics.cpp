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


#include "biped_kinematics.h"

#include <ros/console.h>

#include "biped_symbols.h"

    BipedKinematics::BipedKinematics(const BipedTree &tree) :
        tree_(tree),
        g_(Expression::symbol("g"))
    {
        int n = tree_.getLinksCount();
        appendLinkSymbols("q", n, q_);
        appendLinkSymbols("dq", n, dq_);
        appendLinkSymbols("ddq", n, ddq_);

        const Vector2Expression i(1.0, 0.0);
        const Vector2Expression j(0.0, 1.0);

        P_.push_back( Vector2Expression() );
        for (int link_idx = 0; link_idx < n; link_idx++) {
            const BipedTree::Link &link = tree_.getLink(link_idx);
            const std::string &q = q_[link_idx];

            m_.push_back( Expression::symbol(linkSymbol("m", link_idx)) );
            I_.push_back( Expression::symbol(linkSymbol("I", link_idx)) );
            m_total_ += m_[link_idx];

            // q = 0 is the vertical; the swing leg points down from the hip
            Vector2Expression e = Expression::cos(q) * j + Expression::sin(q) * (-i);
            if (link.side_ < 0) {
                e = -e;
            }
            e_.push_back(e);

            // parents always precede their children
            const Vector2Expression proximal = P_[tree_.getProximalPoint(link_idx)];
            P_.push_back( proximal + Expression::symbol(linkSymbol("l", link_idx)) * e );

            const Expression c = Expression::symbol(linkSymbol("c", link_idx));
            if (link.side_ > 0) {
                G_.push_back( P_[link_idx + 1] - c * e );
            }
            else {
                G_.push_back( proximal + c * e );
            }
        }

        Expression m_total_inv;
        if (!m_total_.inverse(m_total_inv)) {
            ROS_ERROR("ERROR: BipedKinematics::BipedKinematics: total mass is zero");
        }
        Vector2Expression first_moment;
        for (int link_idx = 0; link_idx < n; link_idx++) {
            first_moment += m_[link_idx] * G_[link_idx];
        }
        G_total_ = m_total_inv * first_moment;
    }

    BipedKinematics::~BipedKinematics() {
    }

    const BipedTree& BipedKinematics::getTree() const {
        return tree_;
    }

    const std::vector<std::string >& BipedKinematics::getCoordinates() const {
        return q_;
    }

    const std::vector<std::string >& BipedKinematics::getRates() const {
        return dq_;
    }

    const std::vector<std::string >& BipedKinematics::getAccelerations() const {
        return ddq_;
    }

    const Expression& BipedKinematics::getMass(int link_idx) const {
        return m_[link_idx];
    }

    const Expression& BipedKinematics::getInertia(int link_idx) const {
        return I_[link_idx];
    }

    const Expression& BipedKinematics::getTotalMass() const {
        return m_total_;
    }

    const Expression& BipedKinematics::getGravity() const {
        return g_;
    }

    const Vector2Expression& BipedKinematics::getUnitVector(int link_idx) const {
        return e_[link_idx];
    }

    const Vector2Expression& BipedKinematics::getPoint(int point_idx) const {
        return P_[point_idx];
    }

    int BipedKinematics::getPointsCount() const {
        return P_.size();
    }

    const Vector2Expression& BipedKinematics::getCom(int link_idx) const {
        return G_[link_idx];
    }

    const Vector2Expression& BipedKinematics::getTotalCom() const {
        return G_total_;
    }

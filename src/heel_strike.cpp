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


#include "heel_strike.h"

#include <ros/console.h>

#include "biped_symbols.h"

    HeelStrikeMap::HeelStrikeMap(const BipedKinematics &kin, const ComMotion &motion) :
        kin_(kin)
    {
        const BipedTree &tree = kin_.getTree();

        std::vector<Vector2Expression > dGm;
        for (int link_idx = 0; link_idx < tree.getLinksCount(); link_idx++) {
            dGm.push_back( Vector2Expression(Expression::symbol(linkSymbol("dG", link_idx, "mx")),
                                             Expression::symbol(linkSymbol("dG", link_idx, "my"))) );
        }

        for (int joint_idx = 0; joint_idx < tree.getJointsCount(); joint_idx++) {
            const Vector2Expression &P = kin_.getPoint( tree.getProximalPoint(joint_idx) );

            Expression pre, post;
            const std::vector<int > &outboard = tree.getOutboardLinks(joint_idx);
            for (std::vector<int >::const_iterator it = outboard.begin(); it != outboard.end(); it++) {
                int link_idx = (*it);
                const Expression &m = kin_.getMass(link_idx);
                const Expression &I = kin_.getInertia(link_idx);
                const Vector2Expression r = kin_.getCom(link_idx) - P;

                pre += cross2d(r, m * dGm[link_idx]) + Expression::symbol(linkSymbol("dq", link_idx, "m")) * I;
                post += cross2d(r, m * motion.getComVelocity(link_idx)) + Expression::symbol(kin_.getRates()[link_idx]) * I;
            }
            equations_.push_back(pre - post);
        }
    }

    HeelStrikeMap::~HeelStrikeMap() {
    }

    const std::vector<Expression >& HeelStrikeMap::getEquations() const {
        return equations_;
    }

    bool HeelStrikeMap::getCollisionSystem(LinearSystem &system) const {
        if (!extractLinearSystem(equations_, kin_.getRates(), system)) {
            ROS_ERROR("ERROR: HeelStrikeMap::getCollisionSystem: the collision equations are malformed");
            return false;
        }
        return true;
    }

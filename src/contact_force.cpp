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


#include "contact_force.h"

#include <ros/console.h>

    ContactForceSolver::ContactForceSolver(const BipedKinematics &kin, const ComMotion &motion) {
        unknowns_.push_back("Fx");
        unknowns_.push_back("Fy");

        const Vector2Expression i(1.0, 0.0);
        const Vector2Expression j(0.0, 1.0);

        Vector2Expression force = Expression::symbol(unknowns_[0]) * i + Expression::symbol(unknowns_[1]) * j;
        for (int link_idx = 0; link_idx < kin.getTree().getLinksCount(); link_idx++) {
            force -= (kin.getMass(link_idx) * kin.getGravity()) * j;
        }
        Vector2Expression inertia = kin.getTotalMass() * motion.getTotalComAcceleration();

        Vector2Expression eqn = force - inertia;
        equations_.push_back(eqn.x());
        equations_.push_back(eqn.y());
    }

    ContactForceSolver::~ContactForceSolver() {
    }

    const std::vector<Expression >& ContactForceSolver::getEquations() const {
        return equations_;
    }

    const std::vector<std::string >& ContactForceSolver::getUnknowns() const {
        return unknowns_;
    }

    bool ContactForceSolver::solve(Expression &Fx, Expression &Fy) const {
        LinearSystem system;
        if (!extractLinearSystem(equations_, unknowns_, system)) {
            ROS_ERROR("ERROR: ContactForceSolver::solve: the contact equations are malformed");
            return false;
        }
        std::vector<Expression > x;
        if (!solveLinearSystem2x2(system, x)) {
            ROS_ERROR("ERROR: ContactForceSolver::solve: degenerate contact system");
            return false;
        }
        Fx = x[0];
        Fy = x[1];
        return true;
    }

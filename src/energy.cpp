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


#include "energy.h"

    EnergyModel::EnergyModel(const BipedKinematics &kin, const ComMotion &motion) {
        for (int link_idx = 0; link_idx < kin.getTree().getLinksCount(); link_idx++) {
            const Expression &m = kin.getMass(link_idx);
            const Vector2Expression &dG = motion.getComVelocity(link_idx);
            Expression dq = Expression::symbol(kin.getRates()[link_idx]);

            kinetic_ += Expression(0.5) * m * dot(dG, dG);
            kinetic_ += Expression(0.5) * kin.getInertia(link_idx) * dq * dq;
            potential_ += m * kin.getGravity() * kin.getCom(link_idx).y();
        }
    }

    EnergyModel::~EnergyModel() {
    }

    const Expression& EnergyModel::getKineticEnergy() const {
        return kinetic_;
    }

    const Expression& EnergyModel::getPotentialEnergy() const {
        return potential_;
    }

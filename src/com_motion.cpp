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


#include "com_motion.h"

    ComMotion::ComMotion(const BipedKinematics &kin, const TimeDerivative &derivative) :
        kin_(kin)
    {
        for (int link_idx = 0; link_idx < kin_.getTree().getLinksCount(); link_idx++) {
            dG_.push_back( derivative.first(kin_.getCom(link_idx)) );
            ddG_.push_back( derivative.first(dG_[link_idx]) );
        }
        dG_total_ = derivative.first(kin_.getTotalCom());
        ddG_total_ = derivative.first(dG_total_);
    }

    ComMotion::~ComMotion() {
    }

    const BipedKinematics& ComMotion::getKinematics() const {
        return kin_;
    }

    const Vector2Expression& ComMotion::getComVelocity(int link_idx) const {
        return dG_[link_idx];
    }

    const Vector2Expression& ComMotion::getComAcceleration(int link_idx) const {
        return ddG_[link_idx];
    }

    const Vector2Expression& ComMotion::getTotalComVelocity() const {
        return dG_total_;
    }

    const Vector2Expression& ComMotion::getTotalComAcceleration() const {
        return ddG_total_;
    }

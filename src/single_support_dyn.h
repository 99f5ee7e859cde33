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


#ifndef SINGLE_SUPPORT_DYN_H__
#define SINGLE_SUPPORT_DYN_H__

#include <vector>

#include "com_motion.h"
#include "expression.h"
#include "linear_system.h"

// Single-support equations of motion: one angular momentum balance per
// joint, taken about the joint over the links outboard of it,
//   eq_k = torque_k - inertia_k = 0
// with the stance foot pinned at P0.
class SingleSupportDynamics {
public:
    SingleSupportDynamics(const BipedKinematics &kin, const ComMotion &motion);
    ~SingleSupportDynamics();

    const std::vector<Expression >& getEquations() const;

    // A ddq = b, reproduces getEquations() exactly
    bool getJointBalanceSystem(LinearSystem &system) const;

    // M ddq = F, symmetric positive definite M
    bool getMassMatrixSystem(LinearSystem &system) const;

protected:
    const BipedKinematics &kin_;
    const ComMotion &motion_;
    std::vector<Expression > equations_;
};

#endif  // SINGLE_SUPPORT_DYN_H__

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


#ifndef DYN_MODEL_BIPED_H__
#define DYN_MODEL_BIPED_H__

#include "Eigen/Dense"

#include "biped_functions.h"

// Numeric dynamics of the biped in single support, driven by the compiled
// functions: M(q) ddq = F(q, dq, u).
class DynModelBiped {
public:
    explicit DynModelBiped(const BipedFunctions &functions);
    ~DynModelBiped();

    bool computeM(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u);
    const Eigen::MatrixXd& getM() const;
    const Eigen::VectorXd& getF() const;

    bool accel(Eigen::VectorXd &QDD, const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u);

    // one RK4 step of the state (q, dq) with constant torques
    bool step(Eigen::VectorXd &q, Eigen::VectorXd &dq, const Eigen::VectorXd &u, double dt);

    // post-impact rates for the pre-impact state, the legs are not swapped
    bool heelStrike(Eigen::VectorXd &dq_post, const Eigen::VectorXd &q, const Eigen::VectorXd &dq_pre) const;

protected:
    const BipedFunctions &functions_;
    int ndof_;
    Eigen::MatrixXd M_;
    Eigen::VectorXd F_;
    Eigen::VectorXd MM_;
    Eigen::VectorXi Idx_;
};

#endif  // DYN_MODEL_BIPED_H__

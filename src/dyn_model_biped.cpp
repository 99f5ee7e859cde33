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


#include "dyn_model_biped.h"

#include <ros/console.h>
#include "Eigen/Cholesky"
#include "Eigen/LU"

DynModelBiped::DynModelBiped(const BipedFunctions &functions) :
    functions_(functions),
    ndof_(5)
{
    M_.resize(ndof_, ndof_);
    F_.resize(ndof_);
}

DynModelBiped::~DynModelBiped() {
}

bool DynModelBiped::computeM(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u) {
    if (!functions_.dynamicsSingleSupport(q, dq, u, MM_, Idx_, F_)) {
        return false;
    }
    BipedFunctions::reconstituteMassMatrix(MM_, Idx_, ndof_, M_);
    return true;
}

const Eigen::MatrixXd& DynModelBiped::getM() const {
    return M_;
}

const Eigen::VectorXd& DynModelBiped::getF() const {
    return F_;
}

bool DynModelBiped::accel(Eigen::VectorXd &QDD, const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u) {
    if (!computeM(q, dq, u)) {
        return false;
    }
    Eigen::LDLT<Eigen::MatrixXd > ldlt(M_);
    if (ldlt.info() != Eigen::Success) {
        ROS_ERROR("ERROR: DynModelBiped::accel: mass matrix decomposition failed");
        return false;
    }
    QDD = ldlt.solve(F_);
    return true;
}

bool DynModelBiped::step(Eigen::VectorXd &q, Eigen::VectorXd &dq, const Eigen::VectorXd &u, double dt) {
    Eigen::VectorXd k1_q, k2_q, k3_q, k4_q;
    Eigen::VectorXd k1_dq, k2_dq, k3_dq, k4_dq;

    k1_q = dq;
    if (!accel(k1_dq, q, dq, u)) {
        return false;
    }
    k2_q = dq + 0.5 * dt * k1_dq;
    if (!accel(k2_dq, q + 0.5 * dt * k1_q, k2_q, u)) {
        return false;
    }
    k3_q = dq + 0.5 * dt * k2_dq;
    if (!accel(k3_dq, q + 0.5 * dt * k2_q, k3_q, u)) {
        return false;
    }
    k4_q = dq + dt * k3_dq;
    if (!accel(k4_dq, q + dt * k3_q, k4_q, u)) {
        return false;
    }

    q += dt / 6.0 * (k1_q + 2.0 * k2_q + 2.0 * k3_q + k4_q);
    dq += dt / 6.0 * (k1_dq + 2.0 * k2_dq + 2.0 * k3_dq + k4_dq);
    return true;
}

bool DynModelBiped::heelStrike(Eigen::VectorXd &dq_post, const Eigen::VectorXd &q, const Eigen::VectorXd &dq_pre) const {
    Eigen::VectorXd dG_pre;
    if (!functions_.comVelocity(q, dq_pre, dG_pre)) {
        return false;
    }
    Eigen::MatrixXd MM;
    Eigen::VectorXd ff;
    if (!functions_.heelStrike(q, dq_pre, dG_pre, MM, ff)) {
        return false;
    }
    Eigen::FullPivLU<Eigen::MatrixXd > lu(MM);
    if (!lu.isInvertible()) {
        ROS_ERROR("ERROR: DynModelBiped::heelStrike: singular collision matrix");
        return false;
    }
    dq_post = lu.solve(ff);
    return true;
}

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


#include "single_support_dyn.h"

#include <cmath>

#include <ros/console.h>
#include "Eigen/LU"

#include "biped_symbols.h"

    SingleSupportDynamics::SingleSupportDynamics(const BipedKinematics &kin, const ComMotion &motion) :
        kin_(kin),
        motion_(motion)
    {
        const BipedTree &tree = kin_.getTree();
        const Vector2Expression j(0.0, 1.0);

        for (int joint_idx = 0; joint_idx < tree.getJointsCount(); joint_idx++) {
            const Vector2Expression &P = kin_.getPoint( tree.getProximalPoint(joint_idx) );

            Expression torque = Expression::symbol(linkSymbol("u", joint_idx));
            Expression inertia;

            const std::vector<int > &outboard = tree.getOutboardLinks(joint_idx);
            for (std::vector<int >::const_iterator it = outboard.begin(); it != outboard.end(); it++) {
                int link_idx = (*it);
                const Expression &m = kin_.getMass(link_idx);
                const Vector2Expression r = kin_.getCom(link_idx) - P;
                const Vector2Expression weight = -(m * kin_.getGravity()) * j;

                torque += cross2d(r, weight);
                inertia += cross2d(r, m * motion_.getComAcceleration(link_idx));
                inertia += Expression::symbol(kin_.getAccelerations()[link_idx]) * kin_.getInertia(link_idx);
            }
            equations_.push_back(torque - inertia);
        }
    }

    SingleSupportDynamics::~SingleSupportDynamics() {
    }

    const std::vector<Expression >& SingleSupportDynamics::getEquations() const {
        return equations_;
    }

    bool SingleSupportDynamics::getJointBalanceSystem(LinearSystem &system) const {
        if (!extractLinearSystem(equations_, kin_.getAccelerations(), system)) {
            ROS_ERROR("ERROR: SingleSupportDynamics::getJointBalanceSystem: the model is malformed");
            return false;
        }
        return true;
    }

    bool SingleSupportDynamics::getMassMatrixSystem(LinearSystem &system) const {
        LinearSystem joint_balance;
        if (!getJointBalanceSystem(joint_balance)) {
            return false;
        }

        // Each joint balance is the sum of the balances of the links outboard
        // of the joint: A = -T M. Undo the nesting and flip the sign.
        Eigen::MatrixXd T;
        kin_.getTree().getNestingMatrix(T);
        Eigen::FullPivLU<Eigen::MatrixXd > lu(T);
        if (!lu.isInvertible()) {
            ROS_ERROR("ERROR: SingleSupportDynamics::getMassMatrixSystem: the nesting matrix is singular");
            return false;
        }
        Eigen::MatrixXd R = -lu.inverse();
        for (int row = 0; row < R.rows(); row++) {
            for (int col = 0; col < R.cols(); col++) {
                double rounded = std::floor(R(row, col) + 0.5);
                if (std::fabs(R(row, col) - rounded) < 1.0e-9) {
                    R(row, col) = rounded;
                }
            }
        }

        joint_balance.transformRows(R, system);
        return true;
    }

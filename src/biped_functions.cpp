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


#include "biped_functions.h"

#include <ros/console.h>

#include "biped_symbols.h"

    BipedFunctions::BipedFunctions(const CodeGenerator &generator, const BipedParameters &params) :
        params_(params),
        dyn_ss_(generator.getFunction("dynSs")),
        dyn_hs_(generator.getFunction("dynHs")),
        contact_force_(generator.getFunction("contactForce")),
        energy_(generator.getFunction("energy")),
        points_(generator.getFunction("getPoints")),
        com_vel_(generator.getFunction("comVel"))
    {
    }

    BipedFunctions::~BipedFunctions() {
    }

    bool BipedFunctions::isValid() const {
        return dyn_ss_ && dyn_hs_ && contact_force_ && energy_ && points_ && com_vel_;
    }

    const BipedParameters& BipedFunctions::getParameters() const {
        return params_;
    }

    bool BipedFunctions::dynamicsSingleSupport(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u,
                                Eigen::VectorXd &MM, Eigen::VectorXi &Idx, Eigen::VectorXd &F) const {
        ValueMap state;
        addState("q", q, state);
        addState("dq", dq, state);
        addState("u", u, state);

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(dyn_ss_, state, outputs)) {
            return false;
        }
        MM = outputs[0].col(0);
        Idx.resize(outputs[1].rows());
        for (int i = 0; i < outputs[1].rows(); i++) {
            Idx(i) = static_cast<int >(outputs[1](i, 0));
        }
        F = outputs[2].col(0);
        return true;
    }

    bool BipedFunctions::heelStrike(const Eigen::VectorXd &q, const Eigen::VectorXd &dq_pre, const Eigen::VectorXd &dG_pre,
                                Eigen::MatrixXd &MM, Eigen::VectorXd &ff) const {
        if (dG_pre.innerSize() != 2 * dq_pre.innerSize()) {
            ROS_ERROR("ERROR: BipedFunctions::heelStrike: wrong size of pre-impact CoM velocities: %d", static_cast<int >(dG_pre.innerSize()));
            return false;
        }
        ValueMap state;
        addState("q", q, state);
        addState("dq", dq_pre, state, "m");
        for (int link_idx = 0; link_idx < dq_pre.innerSize(); link_idx++) {
            state[linkSymbol("dG", link_idx, "mx")] = dG_pre(2 * link_idx);
            state[linkSymbol("dG", link_idx, "my")] = dG_pre(2 * link_idx + 1);
        }

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(dyn_hs_, state, outputs)) {
            return false;
        }
        MM = outputs[0];
        ff = outputs[1].col(0);
        return true;
    }

    bool BipedFunctions::contactForce(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &ddq,
                                double &Fx, double &Fy) const {
        ValueMap state;
        addState("q", q, state);
        addState("dq", dq, state);
        addState("ddq", ddq, state);

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(contact_force_, state, outputs)) {
            return false;
        }
        Fx = outputs[0](0, 0);
        Fy = outputs[1](0, 0);
        return true;
    }

    bool BipedFunctions::energy(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, double &KE, double &PE) const {
        ValueMap state;
        addState("q", q, state);
        addState("dq", dq, state);

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(energy_, state, outputs)) {
            return false;
        }
        KE = outputs[0](0, 0);
        PE = outputs[1](0, 0);
        return true;
    }

    bool BipedFunctions::getPoints(const Eigen::VectorXd &q, Eigen::VectorXd &P, Eigen::VectorXd &G) const {
        ValueMap state;
        addState("q", q, state);

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(points_, state, outputs)) {
            return false;
        }
        P = outputs[0].col(0);
        G = outputs[1].col(0);
        return true;
    }

    bool BipedFunctions::comVelocity(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, Eigen::VectorXd &dG) const {
        ValueMap state;
        addState("q", q, state);
        addState("dq", dq, state);

        std::vector<Eigen::MatrixXd > outputs;
        if (!call(com_vel_, state, outputs)) {
            return false;
        }
        dG = outputs[0].col(0);
        return true;
    }

    void BipedFunctions::reconstituteMassMatrix(const Eigen::VectorXd &MM, const Eigen::VectorXi &Idx, int n, Eigen::MatrixXd &M) {
        M = Eigen::MatrixXd::Zero(n, n);
        for (int i = 0; i < Idx.innerSize(); i++) {
            M(Idx(i) % n, Idx(i) / n) = MM(i);
        }
    }

    void BipedFunctions::addState(const std::string &prefix, const Eigen::VectorXd &x, ValueMap &values, const std::string &suffix) {
        for (int link_idx = 0; link_idx < x.innerSize(); link_idx++) {
            values[linkSymbol(prefix, link_idx, suffix)] = x(link_idx);
        }
    }

    bool BipedFunctions::call(const boost::shared_ptr<const CompiledFunction > &function, const ValueMap &state,
                                std::vector<Eigen::MatrixXd > &outputs) const {
        if (!function) {
            ROS_ERROR("ERROR: BipedFunctions::call: function is not available");
            return false;
        }
        const std::vector<std::string > &inputs = function->getInputs();
        std::vector<double > args(inputs.size());
        for (int in_idx = 0; in_idx < inputs.size(); in_idx++) {
            ValueMap::const_iterator it = state.find(inputs[in_idx]);
            if (it != state.end()) {
                args[in_idx] = it->second;
            }
            else if (!params_.getValue(inputs[in_idx], args[in_idx])) {
                ROS_ERROR("ERROR: BipedFunctions::call: %s: no value for input %s",
                    function->getName().c_str(), inputs[in_idx].c_str());
                return false;
            }
        }
        return function->evaluate(args, outputs);
    }

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


#ifndef BIPED_FUNCTIONS_H__
#define BIPED_FUNCTIONS_H__

#include <map>
#include <string>

#include <boost/shared_ptr.hpp>
#include "Eigen/Dense"

#include "biped_parameters.h"
#include "code_generator.h"
#include "compiled_function.h"

// Typed access to the compiled biped functions with the physical parameters
// bound. State vectors have five entries, stacked planar quantities have ten
// (x1, y1, .., x5, y5).
class BipedFunctions {
public:
    BipedFunctions(const CodeGenerator &generator, const BipedParameters &params);
    ~BipedFunctions();

    // all six functions are present
    bool isValid() const;

    const BipedParameters& getParameters() const;

    // single support: M ddq = F, M given by its nonzero values MM at the
    // column-major indices Idx
    bool dynamicsSingleSupport(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &u,
                                Eigen::VectorXd &MM, Eigen::VectorXi &Idx, Eigen::VectorXd &F) const;

    // heel strike: MM dq_post = ff for the pre-impact link rates dq_pre and
    // CoM velocities dG_pre
    bool heelStrike(const Eigen::VectorXd &q, const Eigen::VectorXd &dq_pre, const Eigen::VectorXd &dG_pre,
                                Eigen::MatrixXd &MM, Eigen::VectorXd &ff) const;

    bool contactForce(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, const Eigen::VectorXd &ddq,
                                double &Fx, double &Fy) const;

    bool energy(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, double &KE, double &PE) const;

    // P1..P5 and G1..G5
    bool getPoints(const Eigen::VectorXd &q, Eigen::VectorXd &P, Eigen::VectorXd &G) const;

    // dG1..dG5
    bool comVelocity(const Eigen::VectorXd &q, const Eigen::VectorXd &dq, Eigen::VectorXd &dG) const;

    static void reconstituteMassMatrix(const Eigen::VectorXd &MM, const Eigen::VectorXi &Idx, int n, Eigen::MatrixXd &M);

protected:
    typedef std::map<std::string, double > ValueMap;

    static void addState(const std::string &prefix, const Eigen::VectorXd &x, ValueMap &values, const std::string &suffix = std::string());
    bool call(const boost::shared_ptr<const CompiledFunction > &function, const ValueMap &state,
                                std::vector<Eigen::MatrixXd > &outputs) const;

    BipedParameters params_;
    boost::shared_ptr<const CompiledFunction > dyn_ss_, dyn_hs_, contact_force_, energy_, points_, com_vel_;
};

#endif  // BIPED_FUNCTIONS_H__

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


#ifndef BIPED_DERIVATION_H__
#define BIPED_DERIVATION_H__

#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include "biped_tree.h"
#include "biped_kinematics.h"
#include "time_derivative.h"
#include "com_motion.h"
#include "single_support_dyn.h"
#include "contact_force.h"
#include "energy.h"
#include "heel_strike.h"
#include "linear_system.h"
#include "code_generator.h"

// Whole derivation of the five-link biped model. The symbolic stages are
// built on construction, derive() extracts the linear systems and the
// contact force, generate() turns the results into numeric functions:
//   dynSs         single-support dynamics, sparse mass matrix
//   dynHs         heel-strike collision map
//   contactForce  ground reaction at the stance foot
//   energy        kinetic and potential energy
//   getPoints     joint positions and link CoMs
//   comVel        link CoM velocities
class BipedDerivation : boost::noncopyable {
public:
    BipedDerivation();
    ~BipedDerivation();

    bool derive();
    bool isDerived() const;

    bool generate(CodeGenerator &generator) const;

    const BipedTree& getTree() const;
    const BipedKinematics& getKinematics() const;
    const TimeDerivative& getTimeDerivative() const;
    const ComMotion& getComMotion() const;
    const SingleSupportDynamics& getSingleSupportDynamics() const;
    const EnergyModel& getEnergyModel() const;
    const HeelStrikeMap& getHeelStrikeMap() const;

    const LinearSystem& getMassMatrixSystem() const;
    const LinearSystem& getCollisionSystem() const;
    const Expression& getContactForceX() const;
    const Expression& getContactForceY() const;

    // declared inputs of the generated functions
    static void getDynSsInputs(std::vector<std::string > &inputs);
    static void getDynHsInputs(std::vector<std::string > &inputs);
    static void getContactForceInputs(std::vector<std::string > &inputs);
    static void getEnergyInputs(std::vector<std::string > &inputs);
    static void getPointsInputs(std::vector<std::string > &inputs);
    static void getComVelInputs(std::vector<std::string > &inputs);

protected:
    BipedTree tree_;
    BipedKinematics kin_;
    TimeDerivative derivative_;
    ComMotion motion_;
    SingleSupportDynamics single_support_;
    ContactForceSolver contact_;
    EnergyModel energy_;
    HeelStrikeMap heel_strike_;

    bool derived_;
    LinearSystem mass_matrix_system_;
    LinearSystem collision_system_;
    Expression Fx_, Fy_;
};

#endif  // BIPED_DERIVATION_H__

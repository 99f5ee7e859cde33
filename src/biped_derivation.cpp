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


#include "biped_derivation.h"

#include <ros/console.h>

#include "biped_symbols.h"

namespace {

const int LINKS_COUNT = 5;

}   // namespace

    BipedDerivation::BipedDerivation() :
        tree_(),
        kin_(tree_),
        derivative_(kin_.getCoordinates(), kin_.getRates(), kin_.getAccelerations()),
        motion_(kin_, derivative_),
        single_support_(kin_, motion_),
        contact_(kin_, motion_),
        energy_(kin_, motion_),
        heel_strike_(kin_, motion_),
        derived_(false)
    {
    }

    BipedDerivation::~BipedDerivation() {
    }

    bool BipedDerivation::derive() {
        derived_ = false;

        if (!single_support_.getMassMatrixSystem(mass_matrix_system_)) {
            ROS_ERROR("ERROR: BipedDerivation::derive: could not derive the single support dynamics");
            return false;
        }
        std::vector<int > idx;
        mass_matrix_system_.getSparsePattern(idx);
        ROS_DEBUG("single support mass matrix: %d nonzero entries", static_cast<int >(idx.size()));

        if (!heel_strike_.getCollisionSystem(collision_system_)) {
            ROS_ERROR("ERROR: BipedDerivation::derive: could not derive the heel strike map");
            return false;
        }

        if (!contact_.solve(Fx_, Fy_)) {
            ROS_ERROR("ERROR: BipedDerivation::derive: could not solve for the contact force");
            return false;
        }

        derived_ = true;
        return true;
    }

    bool BipedDerivation::isDerived() const {
        return derived_;
    }

    bool BipedDerivation::generate(CodeGenerator &generator) const {
        if (!derived_) {
            ROS_ERROR("ERROR: BipedDerivation::generate: derive() has not succeeded");
            return false;
        }
        const int n = tree_.getLinksCount();
        std::vector<std::string > inputs;

        // single support: M ddq = F with M sent as its structural nonzeros
        getDynSsInputs(inputs);
        boost::shared_ptr<CompiledFunction > dyn_ss(new CompiledFunction("dynSs", inputs));
        std::vector<Expression > MM;
        std::vector<int > idx;
        mass_matrix_system_.getNonzeroEntries(MM);
        mass_matrix_system_.getSparsePattern(idx);
        dyn_ss->addOutput("MM", MM.size(), 1, MM);
        dyn_ss->addIndexOutput("Idx", idx);
        dyn_ss->addOutput("F", n, 1, mass_matrix_system_.getVector());
        if (!generator.addFunction(dyn_ss)) {
            return false;
        }

        inputs.clear();
        getDynHsInputs(inputs);
        boost::shared_ptr<CompiledFunction > dyn_hs(new CompiledFunction("dynHs", inputs));
        dyn_hs->addOutput("MM", n, n, collision_system_.getMatrix());
        dyn_hs->addOutput("ff", n, 1, collision_system_.getVector());
        if (!generator.addFunction(dyn_hs)) {
            return false;
        }

        inputs.clear();
        getContactForceInputs(inputs);
        boost::shared_ptr<CompiledFunction > contact_force(new CompiledFunction("contactForce", inputs));
        contact_force->addOutput("Fx", 1, 1, std::vector<Expression >(1, Fx_));
        contact_force->addOutput("Fy", 1, 1, std::vector<Expression >(1, Fy_));
        if (!generator.addFunction(contact_force)) {
            return false;
        }

        inputs.clear();
        getEnergyInputs(inputs);
        boost::shared_ptr<CompiledFunction > energy(new CompiledFunction("energy", inputs));
        energy->addOutput("KE", 1, 1, std::vector<Expression >(1, energy_.getKineticEnergy()));
        energy->addOutput("PE", 1, 1, std::vector<Expression >(1, energy_.getPotentialEnergy()));
        if (!generator.addFunction(energy)) {
            return false;
        }

        // P1..P5 and G1..G5 stacked as x, y pairs
        inputs.clear();
        getPointsInputs(inputs);
        boost::shared_ptr<CompiledFunction > points(new CompiledFunction("getPoints", inputs));
        std::vector<Expression > P, G;
        for (int link_idx = 0; link_idx < n; link_idx++) {
            P.push_back( kin_.getPoint(link_idx + 1).x() );
            P.push_back( kin_.getPoint(link_idx + 1).y() );
            G.push_back( kin_.getCom(link_idx).x() );
            G.push_back( kin_.getCom(link_idx).y() );
        }
        points->addOutput("P", P.size(), 1, P);
        points->addOutput("G", G.size(), 1, G);
        if (!generator.addFunction(points)) {
            return false;
        }

        inputs.clear();
        getComVelInputs(inputs);
        boost::shared_ptr<CompiledFunction > com_vel(new CompiledFunction("comVel", inputs));
        std::vector<Expression > dG;
        for (int link_idx = 0; link_idx < n; link_idx++) {
            dG.push_back( motion_.getComVelocity(link_idx).x() );
            dG.push_back( motion_.getComVelocity(link_idx).y() );
        }
        com_vel->addOutput("dG", dG.size(), 1, dG);
        if (!generator.addFunction(com_vel)) {
            return false;
        }

        ROS_INFO("generated %d functions", generator.getFunctionsCount());
        return true;
    }

    const BipedTree& BipedDerivation::getTree() const {
        return tree_;
    }

    const BipedKinematics& BipedDerivation::getKinematics() const {
        return kin_;
    }

    const TimeDerivative& BipedDerivation::getTimeDerivative() const {
        return derivative_;
    }

    const ComMotion& BipedDerivation::getComMotion() const {
        return motion_;
    }

    const SingleSupportDynamics& BipedDerivation::getSingleSupportDynamics() const {
        return single_support_;
    }

    const EnergyModel& BipedDerivation::getEnergyModel() const {
        return energy_;
    }

    const HeelStrikeMap& BipedDerivation::getHeelStrikeMap() const {
        return heel_strike_;
    }

    const LinearSystem& BipedDerivation::getMassMatrixSystem() const {
        return mass_matrix_system_;
    }

    const LinearSystem& BipedDerivation::getCollisionSystem() const {
        return collision_system_;
    }

    const Expression& BipedDerivation::getContactForceX() const {
        return Fx_;
    }

    const Expression& BipedDerivation::getContactForceY() const {
        return Fy_;
    }

    void BipedDerivation::getDynSsInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("dq", LINKS_COUNT, inputs);
        appendLinkSymbols("u", LINKS_COUNT, inputs);
        appendLinkSymbols("m", LINKS_COUNT, inputs);
        appendLinkSymbols("I", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT - 1, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
        inputs.push_back("g");
    }

    void BipedDerivation::getDynHsInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("dq", LINKS_COUNT, inputs, "m");
        appendLinkSymbols("dG", LINKS_COUNT, inputs, "mx");
        appendLinkSymbols("dG", LINKS_COUNT, inputs, "my");
        appendLinkSymbols("m", LINKS_COUNT, inputs);
        appendLinkSymbols("I", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT - 1, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
    }

    void BipedDerivation::getContactForceInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("dq", LINKS_COUNT, inputs);
        appendLinkSymbols("ddq", LINKS_COUNT, inputs);
        appendLinkSymbols("m", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT - 1, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
        inputs.push_back("g");
    }

    void BipedDerivation::getEnergyInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("dq", LINKS_COUNT, inputs);
        appendLinkSymbols("m", LINKS_COUNT, inputs);
        appendLinkSymbols("I", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT - 1, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
        inputs.push_back("g");
    }

    void BipedDerivation::getPointsInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
    }

    void BipedDerivation::getComVelInputs(std::vector<std::string > &inputs) {
        appendLinkSymbols("q", LINKS_COUNT, inputs);
        appendLinkSymbols("dq", LINKS_COUNT, inputs);
        appendLinkSymbols("l", LINKS_COUNT - 1, inputs);
        appendLinkSymbols("c", LINKS_COUNT, inputs);
    }

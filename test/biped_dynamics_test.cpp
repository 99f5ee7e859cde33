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


#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>
#include "Eigen/Dense"
#include "Eigen/Eigenvalues"

#include "biped_derivation.h"
#include "biped_functions.h"
#include "biped_parameters.h"
#include "code_generator.h"
#include "dyn_model_biped.h"
#include "biped_test_utils.h"

namespace {

void appendNames(const std::string &prefix, int count, const std::string &suffix, std::vector<std::string > &names) {
    for (int i = 1; i <= count; i++) {
        std::ostringstream os;
        os << prefix << i << suffix;
        names.push_back(os.str());
    }
}

std::string makeSignature(const std::string &name, const std::vector<std::string > &inputs, const std::string &outputs) {
    std::string signature = "void " + name + "(";
    for (int i = 0; i < inputs.size(); i++) {
        signature += "double " + inputs[i] + ", ";
    }
    return signature + outputs + ")";
}

}   // namespace

// The derivation is shared by all tests of the suite.
class BipedDynamicsTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        derivation_.reset(new BipedDerivation());
        derivation_ok_ = derivation_->derive();
        generator_.reset(new CodeGenerator());
        generate_ok_ = derivation_ok_ && derivation_->generate(*generator_);
    }

    static void TearDownTestCase() {
        generator_.reset();
        derivation_.reset();
    }

    virtual void SetUp() {
        ASSERT_TRUE(derivation_ok_);
        ASSERT_TRUE(generate_ok_);
    }

    static boost::shared_ptr<BipedDerivation > derivation_;
    static boost::shared_ptr<CodeGenerator > generator_;
    static bool derivation_ok_;
    static bool generate_ok_;
};

boost::shared_ptr<BipedDerivation > BipedDynamicsTest::derivation_;
boost::shared_ptr<CodeGenerator > BipedDynamicsTest::generator_;
bool BipedDynamicsTest::derivation_ok_ = false;
bool BipedDynamicsTest::generate_ok_ = false;

TEST_F(BipedDynamicsTest, MassMatrixIsSymmetricPositiveDefinite) {
    std::vector<BipedParameters > params_list;
    params_list.push_back(BipedParameters());
    params_list.push_back(getOtherParameters());

    std::vector<Eigen::VectorXd > q_list;
    q_list.push_back(Eigen::VectorXd::Zero(5));
    q_list.push_back(makeVector(0.3, -0.4, 0.2, 1.1, -0.7));
    q_list.push_back(makeVector(-1.2, 2.0, -2.5, 0.4, 3.0));

    Eigen::VectorXd dq = makeVector(0.5, -1.0, 0.2, 1.5, -0.3);
    Eigen::VectorXd u = makeVector(1.0, 2.0, -3.0, 0.5, -0.5);

    for (int p_idx = 0; p_idx < params_list.size(); p_idx++) {
        BipedFunctions functions(*generator_, params_list[p_idx]);
        ASSERT_TRUE(functions.isValid());
        DynModelBiped dyn_model(functions);
        for (int q_idx = 0; q_idx < q_list.size(); q_idx++) {
            ASSERT_TRUE(dyn_model.computeM(q_list[q_idx], dq, u));
            const Eigen::MatrixXd &M = dyn_model.getM();
            EXPECT_NEAR(0.0, (M - M.transpose()).norm(), 1.0e-9 * M.norm());

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd > es(M);
            EXPECT_GT(es.eigenvalues().minCoeff(), 0.0);
        }
    }
}

TEST_F(BipedDynamicsTest, MassMatrixSparsityIsStructural) {
    const LinearSystem &system = derivation_->getMassMatrixSystem();
    std::vector<int > idx;
    system.getSparsePattern(idx);

    // the torso and the swing leg are not inertially coupled
    EXPECT_EQ(21, idx.size());
    for (int i = 0; i < idx.size(); i++) {
        int row = idx[i] % 5;
        int col = idx[i] / 5;
        EXPECT_FALSE((row == 2 && col >= 3) || (col == 2 && row >= 3)) << row << " " << col;
        if (i > 0) {
            EXPECT_LT(idx[i - 1], idx[i]);
        }
    }

    Eigen::VectorXd q = makeVector(0.1, 0.2, 0.3, 0.4, 0.5);
    Eigen::VectorXd zero = Eigen::VectorXd::Zero(5);
    Eigen::VectorXd MM1, MM2, F1, F2;
    Eigen::VectorXi Idx1, Idx2;
    BipedFunctions functions1(*generator_, BipedParameters());
    BipedFunctions functions2(*generator_, getOtherParameters());
    ASSERT_TRUE(functions1.dynamicsSingleSupport(q, zero, zero, MM1, Idx1, F1));
    ASSERT_TRUE(functions2.dynamicsSingleSupport(q, zero, zero, MM2, Idx2, F2));
    ASSERT_EQ(Idx1.size(), Idx2.size());
    EXPECT_EQ(MM1.size(), Idx1.size());
    for (int i = 0; i < Idx1.size(); i++) {
        EXPECT_EQ(idx[i], Idx1(i));
        EXPECT_EQ(Idx1(i), Idx2(i));
    }
}

TEST_F(BipedDynamicsTest, JointBalanceSystemReproducesEquations) {
    const SingleSupportDynamics &dyn = derivation_->getSingleSupportDynamics();
    LinearSystem raw;
    ASSERT_TRUE(dyn.getJointBalanceSystem(raw));
    ASSERT_EQ(5, raw.rows());
    ASSERT_EQ(5, raw.cols());

    Eigen::VectorXd ddq = makeVector(0.7, -0.2, 1.3, -0.9, 0.4);
    SymbolValues values;
    addParameterValues(BipedParameters(), values);
    addVectorValues("q", makeVector(0.2, -0.3, 0.15, 0.6, -0.25), values);
    addVectorValues("dq", makeVector(-0.4, 0.8, 0.1, -1.2, 0.9), values);
    addVectorValues("u", makeVector(3.0, -1.0, 0.5, 2.0, -0.7), values);
    addVectorValues("ddq", ddq, values);

    Eigen::MatrixXd A(5, 5);
    Eigen::VectorXd b(5);
    for (int row = 0; row < 5; row++) {
        for (int col = 0; col < 5; col++) {
            ASSERT_TRUE(raw.A(row, col).evaluate(values, A(row, col)));
        }
        ASSERT_TRUE(raw.b(row).evaluate(values, b(row)));
    }

    Eigen::VectorXd residual = A * ddq - b;
    for (int row = 0; row < 5; row++) {
        double eq;
        ASSERT_TRUE(dyn.getEquations()[row].evaluate(values, eq));
        EXPECT_NEAR(eq, residual(row), 1.0e-9);
    }

    // the reduced system is the raw one with the joint nesting undone
    Eigen::MatrixXd T;
    derivation_->getTree().getNestingMatrix(T);
    Eigen::MatrixXd expected = -T.inverse() * A;
    const LinearSystem &reduced = derivation_->getMassMatrixSystem();
    for (int row = 0; row < 5; row++) {
        for (int col = 0; col < 5; col++) {
            double M;
            ASSERT_TRUE(reduced.A(row, col).evaluate(values, M));
            EXPECT_NEAR(expected(row, col), M, 1.0e-9);
        }
    }
}

TEST_F(BipedDynamicsTest, StaticContactForceIsTheWeight) {
    BipedParameters params;
    BipedFunctions functions(*generator_, params);
    Eigen::VectorXd zero = Eigen::VectorXd::Zero(5);

    std::vector<Eigen::VectorXd > q_list;
    q_list.push_back(zero);
    q_list.push_back(makeVector(0.3, -0.4, 0.2, 1.1, -0.7));

    for (int q_idx = 0; q_idx < q_list.size(); q_idx++) {
        double Fx, Fy;
        ASSERT_TRUE(functions.contactForce(q_list[q_idx], zero, zero, Fx, Fy));
        EXPECT_NEAR(0.0, Fx, 1.0e-9);
        EXPECT_NEAR(params.m_.sum() * params.g_, Fy, 1.0e-9);
    }
}

TEST_F(BipedDynamicsTest, ContactForceBalancesCentroidalMotion) {
    BipedParameters params = getOtherParameters();
    BipedFunctions functions(*generator_, params);
    DynModelBiped dyn_model(functions);

    Eigen::VectorXd q = makeVector(0.1, -0.2, 0.05, 0.4, -0.3);
    Eigen::VectorXd dq = makeVector(0.6, -0.4, 0.2, -0.8, 1.1);
    Eigen::VectorXd u = makeVector(0.0, 5.0, -2.0, 1.0, 0.5);
    Eigen::VectorXd ddq;
    ASSERT_TRUE(dyn_model.accel(ddq, q, dq, u));

    double Fx, Fy;
    ASSERT_TRUE(functions.contactForce(q, dq, ddq, Fx, Fy));

    // F - sum(m) g j = sum(m_i ddG_i), ddG_i by finite differences of dG
    const double h = 1.0e-6;
    Eigen::VectorXd dG_plus, dG_minus;
    ASSERT_TRUE(functions.comVelocity(q + h * dq, dq + h * ddq, dG_plus));
    ASSERT_TRUE(functions.comVelocity(q - h * dq, dq - h * ddq, dG_minus));
    Eigen::VectorXd ddG = (dG_plus - dG_minus) / (2.0 * h);

    double px = 0.0, py = 0.0;
    for (int link_idx = 0; link_idx < 5; link_idx++) {
        px += params.m_(link_idx) * ddG(2 * link_idx);
        py += params.m_(link_idx) * ddG(2 * link_idx + 1);
    }
    EXPECT_NEAR(px, Fx, 1.0e-4);
    EXPECT_NEAR(py + params.m_.sum() * params.g_, Fy, 1.0e-4);
}

TEST_F(BipedDynamicsTest, PassiveMotionConservesEnergy) {
    BipedFunctions functions(*generator_, BipedParameters());
    DynModelBiped dyn_model(functions);

    Eigen::VectorXd q = makeVector(0.1, -0.05, 0.2, 0.3, -0.2);
    Eigen::VectorXd dq = makeVector(0.5, -0.3, 0.4, -1.0, 0.8);
    Eigen::VectorXd u = Eigen::VectorXd::Zero(5);

    double KE0, PE0;
    ASSERT_TRUE(functions.energy(q, dq, KE0, PE0));
    EXPECT_GT(KE0, 0.0);

    const double dt = 0.001;
    for (int i = 0; i < 500; i++) {
        ASSERT_TRUE(dyn_model.step(q, dq, u, dt));
    }

    double KE, PE;
    ASSERT_TRUE(functions.energy(q, dq, KE, PE));
    EXPECT_NEAR(KE0 + PE0, KE + PE, 1.0e-6 * (std::fabs(KE0) + std::fabs(PE0)));
    // the robot actually moved
    EXPECT_GT(std::fabs(KE - KE0) + std::fabs(PE - PE0), 1.0e-3);
}

TEST_F(BipedDynamicsTest, HeelStrikeWithConsistentVelocitiesIsIdentity) {
    BipedFunctions functions(*generator_, getOtherParameters());
    DynModelBiped dyn_model(functions);

    Eigen::VectorXd q = makeVector(-0.3, 0.2, 0.1, 0.5, -0.2);
    Eigen::VectorXd dq_star = makeVector(1.2, -0.7, 0.3, -0.4, 2.1);

    Eigen::VectorXd dq_post;
    ASSERT_TRUE(dyn_model.heelStrike(dq_post, q, dq_star));
    ASSERT_EQ(5, dq_post.size());
    for (int i = 0; i < 5; i++) {
        EXPECT_NEAR(dq_star(i), dq_post(i), 1.0e-9);
    }

    // dense collision matrix
    Eigen::VectorXd dG;
    ASSERT_TRUE(functions.comVelocity(q, dq_star, dG));
    Eigen::MatrixXd MM;
    Eigen::VectorXd ff;
    ASSERT_TRUE(functions.heelStrike(q, dq_star, dG, MM, ff));
    EXPECT_EQ(5, MM.rows());
    EXPECT_EQ(5, MM.cols());
    EXPECT_NEAR(0.0, (MM * dq_star - ff).norm(), 1.0e-9);
}

TEST_F(BipedDynamicsTest, GeneratedSignaturesKeepInputOrder) {
    std::vector<std::string > dyn_ss;
    appendNames("q", 5, "", dyn_ss);
    appendNames("dq", 5, "", dyn_ss);
    appendNames("u", 5, "", dyn_ss);
    appendNames("m", 5, "", dyn_ss);
    appendNames("I", 5, "", dyn_ss);
    appendNames("l", 4, "", dyn_ss);
    appendNames("c", 5, "", dyn_ss);
    dyn_ss.push_back("g");

    std::vector<std::string > dyn_hs;
    appendNames("q", 5, "", dyn_hs);
    appendNames("dq", 5, "m", dyn_hs);
    appendNames("dG", 5, "mx", dyn_hs);
    appendNames("dG", 5, "my", dyn_hs);
    appendNames("m", 5, "", dyn_hs);
    appendNames("I", 5, "", dyn_hs);
    appendNames("l", 4, "", dyn_hs);
    appendNames("c", 5, "", dyn_hs);

    std::vector<std::string > contact_force;
    appendNames("q", 5, "", contact_force);
    appendNames("dq", 5, "", contact_force);
    appendNames("ddq", 5, "", contact_force);
    appendNames("m", 5, "", contact_force);
    appendNames("l", 4, "", contact_force);
    appendNames("c", 5, "", contact_force);
    contact_force.push_back("g");

    std::vector<std::string > energy;
    appendNames("q", 5, "", energy);
    appendNames("dq", 5, "", energy);
    appendNames("m", 5, "", energy);
    appendNames("I", 5, "", energy);
    appendNames("l", 4, "", energy);
    appendNames("c", 5, "", energy);
    energy.push_back("g");

    std::vector<std::string > points;
    appendNames("q", 5, "", points);
    appendNames("l", 5, "", points);
    appendNames("c", 5, "", points);

    std::vector<std::string > com_vel;
    appendNames("q", 5, "", com_vel);
    appendNames("dq", 5, "", com_vel);
    appendNames("l", 4, "", com_vel);
    appendNames("c", 5, "", com_vel);

    ASSERT_EQ(6, generator_->getFunctionsCount());
    EXPECT_TRUE(generator_->getFunction("dynSs")->getInputs() == dyn_ss);
    EXPECT_TRUE(generator_->getFunction("dynHs")->getInputs() == dyn_hs);
    EXPECT_TRUE(generator_->getFunction("contactForce")->getInputs() == contact_force);
    EXPECT_TRUE(generator_->getFunction("energy")->getInputs() == energy);
    EXPECT_TRUE(generator_->getFunction("getPoints")->getInputs() == points);
    EXPECT_TRUE(generator_->getFunction("comVel")->getInputs() == com_vel);

    std::string header;
    generator_->writeHeader("FIVE_LINK_BIPED_GEN_H__", header);

    std::vector<std::string > signatures;
    signatures.push_back(makeSignature("dynSs", dyn_ss, "Eigen::VectorXd &MM, Eigen::VectorXi &Idx, Eigen::VectorXd &F"));
    signatures.push_back(makeSignature("dynHs", dyn_hs, "Eigen::MatrixXd &MM, Eigen::VectorXd &ff"));
    signatures.push_back(makeSignature("contactForce", contact_force, "double &Fx, double &Fy"));
    signatures.push_back(makeSignature("energy", energy, "double &KE, double &PE"));
    signatures.push_back(makeSignature("getPoints", points, "Eigen::VectorXd &P, Eigen::VectorXd &G"));
    signatures.push_back(makeSignature("comVel", com_vel, "Eigen::VectorXd &dG"));
    for (int i = 0; i < signatures.size(); i++) {
        EXPECT_NE(std::string::npos, header.find(signatures[i] + ";")) << signatures[i];
    }
}

TEST_F(BipedDynamicsTest, DerivedArtifactsAreConsistent) {
    EXPECT_TRUE(derivation_->isDerived());

    const BipedKinematics &kin = derivation_->getKinematics();
    const ComMotion &motion = derivation_->getComMotion();
    for (int link_idx = 0; link_idx < 5; link_idx++) {
        Vector2Expression ddG = derivation_->getTimeDerivative().second(kin.getCom(link_idx));
        EXPECT_TRUE((ddG.x() - motion.getComAcceleration(link_idx).x()).isZero());
        EXPECT_TRUE((ddG.y() - motion.getComAcceleration(link_idx).y()).isZero());
    }

    BipedParameters params = getOtherParameters();
    BipedFunctions functions(*generator_, params);
    EXPECT_DOUBLE_EQ(params.m_(2), functions.getParameters().m_(2));
    EXPECT_DOUBLE_EQ(params.g_, functions.getParameters().g_);

    Eigen::VectorXd q = makeVector(0.4, -0.3, 0.2, 0.1, -0.5);
    Eigen::VectorXd zero = Eigen::VectorXd::Zero(5);
    SymbolValues values;
    addParameterValues(params, values);
    addVectorValues("q", q, values);
    addVectorValues("dq", zero, values);
    addVectorValues("ddq", zero, values);

    // standing still: the foot carries the weight and there is no kinetic energy
    double Fx, Fy, KE;
    ASSERT_TRUE(derivation_->getContactForceX().evaluate(values, Fx));
    ASSERT_TRUE(derivation_->getContactForceY().evaluate(values, Fy));
    ASSERT_TRUE(derivation_->getEnergyModel().getKineticEnergy().evaluate(values, KE));
    EXPECT_NEAR(0.0, Fx, 1.0e-9);
    EXPECT_NEAR(params.m_.sum() * params.g_, Fy, 1.0e-9);
    EXPECT_NEAR(0.0, KE, 1.0e-12);

    // momentum is unchanged when the pre-impact velocities match the post-impact rates
    Eigen::VectorXd dq = makeVector(0.9, -1.1, 0.4, 1.6, -0.2);
    Eigen::VectorXd dG;
    ASSERT_TRUE(functions.comVelocity(q, dq, dG));
    addVectorValues("dq", dq, values);
    addVectorValues("dq", dq, values, "m");
    for (int link_idx = 0; link_idx < 5; link_idx++) {
        values[linkSymbol("dG", link_idx, "mx")] = dG(2 * link_idx);
        values[linkSymbol("dG", link_idx, "my")] = dG(2 * link_idx + 1);
    }
    const std::vector<Expression > &equations = derivation_->getHeelStrikeMap().getEquations();
    ASSERT_EQ(5, equations.size());
    for (int eq_idx = 0; eq_idx < equations.size(); eq_idx++) {
        double residual;
        ASSERT_TRUE(equations[eq_idx].evaluate(values, residual));
        EXPECT_NEAR(0.0, residual, 1.0e-9);
    }
}

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

#include <ros/ros.h>

#include <string>
#include <fstream>

#include "Eigen/Dense"

#include "biped_derivation.h"
#include "biped_functions.h"
#include "biped_parameters.h"
#include "code_generator.h"
#include "dyn_model_biped.h"

class DeriveBiped {
    ros::NodeHandle nh_;
    std::string output_dir_;
    std::string file_prefix_;
    BipedParameters params_;

public:
    DeriveBiped() :
        nh_("~"),
        output_dir_("."),
        file_prefix_("five_link_biped_gen")
    {
        nh_.getParam("output_dir", output_dir_);
        nh_.getParam("file_prefix", file_prefix_);
    }

    ~DeriveBiped() {
    }

    bool writeFile(const std::string &file_name, const std::string &content) {
        std::string path = output_dir_ + "/" + file_name;
        std::ofstream file(path.c_str());
        if (!file.is_open()) {
            ROS_ERROR("ERROR: DeriveBiped::writeFile: could not open %s", path.c_str());
            return false;
        }
        file << content;
        if (!file.good()) {
            ROS_ERROR("ERROR: DeriveBiped::writeFile: could not write %s", path.c_str());
            return false;
        }
        ROS_INFO("wrote %s", path.c_str());
        return true;
    }

    // static check of the generated functions: the upright robot at rest
    // carries its weight on the stance foot
    void checkStanding(const BipedFunctions &functions) {
        Eigen::VectorXd zero = Eigen::VectorXd::Zero(5);
        double Fx, Fy;
        if (!functions.contactForce(zero, zero, zero, Fx, Fy)) {
            return;
        }
        ROS_INFO("standing contact force: Fx: %lf  Fy: %lf  weight: %lf", Fx, Fy, params_.m_.sum() * params_.g_);

        DynModelBiped dyn_model(functions);
        if (dyn_model.computeM(zero, zero, zero)) {
            ROS_DEBUG_STREAM("mass matrix at q = 0:" << std::endl << dyn_model.getM());
        }
    }

    bool run() {
        if (!params_.loadFromParamServer(nh_)) {
            return false;
        }

        ROS_INFO("deriving the five-link biped model");
        BipedDerivation derivation;
        if (!derivation.derive()) {
            return false;
        }

        CodeGenerator generator;
        if (!derivation.generate(generator)) {
            return false;
        }

        std::string guard = CodeGenerator::getIncludeGuard(file_prefix_);

        std::string header, source;
        generator.writeHeader(guard, header);
        generator.writeSource(file_prefix_ + ".h", source);
        if (!writeFile(file_prefix_ + ".h", header) || !writeFile(file_prefix_ + ".cpp", source)) {
            return false;
        }

        BipedFunctions functions(generator, params_);
        if (!functions.isValid()) {
            ROS_ERROR("ERROR: DeriveBiped::run: generated functions are incomplete");
            return false;
        }
        checkStanding(functions);
        return true;
    }
};

int main(int argc, char** argv) {
    ros::init(argc, argv, "derive_biped");
    DeriveBiped derive;
    if (!derive.run()) {
        return 1;
    }
    return 0;
}

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


#ifndef BIPED_PARAMETERS_H__
#define BIPED_PARAMETERS_H__

#include <string>
#include <vector>

#include "Eigen/Dense"

namespace ros {
class NodeHandle;
}

// Physical parameters of the five-link biped, indexed by link
// (0 stance tibia .. 4 swing tibia).
class BipedParameters {
public:
    BipedParameters();
    ~BipedParameters();

    // defaults are kept for parameters that are not set
    bool loadFromParamServer(const ros::NodeHandle &nh);

    // finite values, positive masses, inertias and lengths
    bool isValid() const;

    // value of a parameter symbol (m1, I3, l2, c5, g), fails for any other name
    bool getValue(const std::string &symbol_name, double &value) const;

    Eigen::VectorXd m_;     // mass
    Eigen::VectorXd I_;     // moment of inertia about the CoM
    Eigen::VectorXd l_;     // length
    Eigen::VectorXd c_;     // distance of the CoM from the distal joint (stance leg, torso) or the proximal joint (swing leg)
    double g_;
};

#endif  // BIPED_PARAMETERS_H__

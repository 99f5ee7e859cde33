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

#ifndef KIN_MODEL_H
#define KIN_MODEL_H

#include <kdl/frames.hpp>
#include <kdl/tree.hpp>
#include <kdl/treefksolverpos_recursive.hpp>
#include <boost/shared_ptr.hpp>
#include "Eigen/Dense"
#include <map>
#include <string>
#include <vector>

#include "biped_tree.h"
#include "biped_parameters.h"

// Reference forward kinematics of the biped built as a KDL tree: one revolute
// (z axis) segment per link, the stance foot at the origin of the ground frame.
// Coordinates q are the absolute link angles used by the symbolic model.
class KinematicModel {
public:
    KinematicModel(const BipedTree &biped_tree, const BipedParameters &params);
    ~KinematicModel();

    void calculateFk(KDL::Frame &T, const std::string &link_name, const Eigen::VectorXd &q) const;

    // P1..P5, point_idx = 1..5 is the distal end of link point_idx-1
    void getJointPosition(Eigen::Vector2d &P, int point_idx, const Eigen::VectorXd &q) const;
    void getComPosition(Eigen::Vector2d &G, int link_idx, const Eigen::VectorXd &q) const;

    const std::string& getLinkName(int link_idx) const;

protected:
    void getJointValues(KDL::JntArray &q_in, const Eigen::VectorXd &q) const;

    KDL::Tree tree_;
    std::vector<std::string > link_names_;
    std::vector<int > parents_;
    std::vector<KDL::Vector > com_;
    std::map<int, int > q_idx_q_nr_map_;
    boost::shared_ptr<KDL::TreeFkSolverPos_recursive > pfk_solver_;
};

#endif

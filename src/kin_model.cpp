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

#include "kin_model.h"

#include <ros/console.h>

KinematicModel::KinematicModel(const BipedTree &biped_tree, const BipedParameters &params) :
    tree_("ground")
{
    for (int link_idx = 0; link_idx < biped_tree.getLinksCount(); link_idx++) {
        const BipedTree::Link &link = biped_tree.getLink(link_idx);
        link_names_.push_back(link.name_);
        parents_.push_back(link.parent_);

        double l = params.l_(link_idx);
        double c = params.c_(link_idx);
        double side = static_cast<double >(link.side_);

        // the segment frame sits at the distal end of the link
        KDL::Segment segment(link.name_, KDL::Joint(link.name_ + "_joint", KDL::Joint::RotZ), KDL::Frame(KDL::Vector(0, side * l, 0)));
        std::string hook_name = (link.parent_ < 0) ? std::string("ground") : biped_tree.getLink(link.parent_).name_;
        if (!tree_.addSegment(segment, hook_name)) {
            ROS_ERROR("ERROR: KinematicModel::KinematicModel: could not add segment %s to %s", link.name_.c_str(), hook_name.c_str());
        }

        if (link.side_ > 0) {
            com_.push_back( KDL::Vector(0, -c, 0) );
        }
        else {
            com_.push_back( KDL::Vector(0, l - c, 0) );
        }
    }

    pfk_solver_.reset(new KDL::TreeFkSolverPos_recursive(tree_));

    for (KDL::SegmentMap::const_iterator seg_it = tree_.getSegments().begin(); seg_it != tree_.getSegments().end(); seg_it++) {
        if (seg_it->second.segment.getJoint().getType() == KDL::Joint::None) {
            continue;
        }
        for (int q_idx = 0; q_idx < link_names_.size(); q_idx++) {
            if (link_names_[q_idx] == seg_it->second.segment.getName()) {
                q_idx_q_nr_map_.insert( std::make_pair(q_idx, seg_it->second.q_nr) );
                break;
            }
        }
    }
}

KinematicModel::~KinematicModel() {
}

const std::string& KinematicModel::getLinkName(int link_idx) const {
    return link_names_[link_idx];
}

void KinematicModel::getJointValues(KDL::JntArray &q_in, const Eigen::VectorXd &q) const {
    q_in.resize( tree_.getNrOfJoints() );
    for (int q_idx = 0; q_idx < q.innerSize(); q_idx++) {
        std::map<int, int >::const_iterator it = q_idx_q_nr_map_.find(q_idx);
        if (it == q_idx_q_nr_map_.end()) {
            ROS_ERROR("ERROR: KinematicModel::getJointValues: no joint for coordinate %d", q_idx);
            continue;
        }
        // joints are relative, q is absolute
        double q_parent = (parents_[q_idx] < 0) ? 0.0 : q[parents_[q_idx]];
        q_in(it->second) = q[q_idx] - q_parent;
    }
}

void KinematicModel::calculateFk(KDL::Frame &T, const std::string &link_name, const Eigen::VectorXd &q) const {
    KDL::JntArray q_in;
    getJointValues(q_in, q);
    if (pfk_solver_->JntToCart(q_in, T, link_name) < 0) {
        ROS_ERROR("ERROR: KinematicModel::calculateFk: could not calculate fk for %s", link_name.c_str());
    }
}

void KinematicModel::getJointPosition(Eigen::Vector2d &P, int point_idx, const Eigen::VectorXd &q) const {
    KDL::Frame T;
    calculateFk(T, link_names_[point_idx - 1], q);
    P(0) = T.p.x();
    P(1) = T.p.y();
}

void KinematicModel::getComPosition(Eigen::Vector2d &G, int link_idx, const Eigen::VectorXd &q) const {
    KDL::Frame T;
    calculateFk(T, link_names_[link_idx], q);
    KDL::Vector com = T * com_[link_idx];
    G(0) = com.x();
    G(1) = com.y();
}

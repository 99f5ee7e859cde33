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


#include "biped_tree.h"

    BipedTree::BipedTree() {
        addLink("stance_tibia", -1, 1);
        addLink("stance_femur", 0, 1);
        addLink("torso", 1, 1);
        addLink("swing_femur", 1, -1);
        addLink("swing_tibia", 3, -1);

        // hip actuator u4 acts on the swing femur from the torso
        addDriven(2, 3);

        for (int link_idx = 0; link_idx < links_.size(); link_idx++) {
            std::set<int > outboard;
            collectOutboard(link_idx, outboard);
            links_[link_idx].outboard_.assign(outboard.begin(), outboard.end());
        }
    }

    BipedTree::~BipedTree() {
    }

    int BipedTree::getLinksCount() const {
        return links_.size();
    }

    int BipedTree::getJointsCount() const {
        return links_.size();
    }

    const BipedTree::Link& BipedTree::getLink(int link_idx) const {
        return links_[link_idx];
    }

    int BipedTree::getLinkIndex(const std::string &name) const {
        for (int link_idx = 0; link_idx < links_.size(); link_idx++) {
            if (links_[link_idx].name_ == name) {
                return link_idx;
            }
        }
        return -1;
    }

    int BipedTree::getProximalPoint(int link_idx) const {
        return links_[link_idx].parent_ + 1;
    }

    const std::vector<int >& BipedTree::getOutboardLinks(int joint_idx) const {
        return links_[joint_idx].outboard_;
    }

    bool BipedTree::isOutboard(int joint_idx, int link_idx) const {
        const std::vector<int > &outboard = links_[joint_idx].outboard_;
        for (std::vector<int >::const_iterator it = outboard.begin(); it != outboard.end(); it++) {
            if ((*it) == link_idx) {
                return true;
            }
        }
        return false;
    }

    void BipedTree::getNestingMatrix(Eigen::MatrixXd &T) const {
        int n = links_.size();
        T.resize(n, n);
        for (int joint_idx = 0; joint_idx < n; joint_idx++) {
            for (int link_idx = 0; link_idx < n; link_idx++) {
                T(joint_idx, link_idx) = isOutboard(joint_idx, link_idx) ? 1.0 : 0.0;
            }
        }
    }

    void BipedTree::addLink(const std::string &name, int parent, int side) {
        Link link;
        link.name_ = name;
        link.parent_ = parent;
        link.side_ = side;
        links_.push_back(link);
        if (parent >= 0) {
            links_[parent].children_.push_back(links_.size() - 1);
        }
    }

    void BipedTree::addDriven(int driver_idx, int driven_idx) {
        links_[driver_idx].driven_.push_back(driven_idx);
    }

    void BipedTree::collectOutboard(int link_idx, std::set<int > &outboard) const {
        outboard.insert(link_idx);
        const Link &link = links_[link_idx];
        for (std::vector<int >::const_iterator it = link.children_.begin(); it != link.children_.end(); it++) {
            collectOutboard(*it, outboard);
        }
        for (std::vector<int >::const_iterator it = link.driven_.begin(); it != link.driven_.end(); it++) {
            collectOutboard(*it, outboard);
        }
    }

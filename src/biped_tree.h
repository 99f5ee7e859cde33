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


#ifndef BIPED_TREE_H__
#define BIPED_TREE_H__

#include <string>
#include <vector>
#include <set>

#include "Eigen/Dense"

// Topology of the planar five-link biped.
//
// Links (0-based index): 0 stance tibia, 1 stance femur, 2 torso,
// 3 swing femur, 4 swing tibia. Points: P0 is the stance foot (ground
// contact), P(i+1) is the distal end of link i, so the proximal end of a
// link is the point of its parent (P0 for the root link). The torso and the
// swing femur are siblings hanging from the hip P2; the swing femur is
// actuated against the torso.
//
// Joint k is the proximal joint of link k, its actuator u(k+1) acts on link k
// from the inboard neighbour. The outboard set of joint k holds the links
// carried by that actuator: the link itself, its children, and the siblings
// it drives, recursively.
class BipedTree {
public:
    class Link {
    public:
        std::string name_;
        int parent_;                    // -1 for the ground
        int side_;                      // +1 stance leg and torso, -1 swing leg
        std::vector<int > children_;
        std::vector<int > driven_;
        std::vector<int > outboard_;
    };

    BipedTree();
    ~BipedTree();

    int getLinksCount() const;
    int getJointsCount() const;
    const Link& getLink(int link_idx) const;
    int getLinkIndex(const std::string &name) const;

    // index of the point P at the proximal end of the link
    int getProximalPoint(int link_idx) const;

    const std::vector<int >& getOutboardLinks(int joint_idx) const;
    bool isOutboard(int joint_idx, int link_idx) const;

    // T(k, j) = 1 if link j is in the outboard set of joint k
    void getNestingMatrix(Eigen::MatrixXd &T) const;

protected:
    void addLink(const std::string &name, int parent, int side);
    void addDriven(int driver_idx, int driven_idx);
    void collectOutboard(int link_idx, std::set<int > &outboard) const;

    std::vector<Link > links_;
};

#endif  // BIPED_TREE_H__

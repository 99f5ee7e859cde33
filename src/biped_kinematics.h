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


#ifndef BIPED_KINEMATICS_H__
#define BIPED_KINEMATICS_H__

#include <string>
#include <vector>

#include "biped_tree.h"
#include "expression.h"
#include "vector2_expression.h"

// Closed-form positions of the biped as functions of the absolute link
// angles q1..q5 and the link parameters.
class BipedKinematics {
public:
    explicit BipedKinematics(const BipedTree &tree);
    ~BipedKinematics();

    const BipedTree& getTree() const;

    const std::vector<std::string >& getCoordinates() const;
    const std::vector<std::string >& getRates() const;
    const std::vector<std::string >& getAccelerations() const;

    const Expression& getMass(int link_idx) const;
    const Expression& getInertia(int link_idx) const;
    const Expression& getTotalMass() const;
    const Expression& getGravity() const;

    const Vector2Expression& getUnitVector(int link_idx) const;
    // P0 .. P5
    const Vector2Expression& getPoint(int point_idx) const;
    int getPointsCount() const;
    // G1 .. G5
    const Vector2Expression& getCom(int link_idx) const;
    // mass weighted average of the link CoMs
    const Vector2Expression& getTotalCom() const;

protected:
    const BipedTree &tree_;

    std::vector<std::string > q_, dq_, ddq_;
    std::vector<Expression > m_, I_;
    Expression m_total_;
    Expression g_;

    std::vector<Vector2Expression > e_;
    std::vector<Vector2Expression > P_;
    std::vector<Vector2Expression > G_;
    Vector2Expression G_total_;
};

#endif  // BIPED_KINEMATICS_H__

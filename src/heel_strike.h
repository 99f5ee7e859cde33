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


#ifndef HEEL_STRIKE_H__
#define HEEL_STRIKE_H__

#include <string>
#include <vector>

#include "com_motion.h"
#include "expression.h"
#include "linear_system.h"

// Collision map at heel strike. For every joint the angular momentum of the
// outboard links about the joint is conserved through the impact:
//   pre_k(dGim, dqim) = post_k(q, dq)
// The pre-impact state is given by free CoM velocities (dGimx, dGimy) and
// angular rates dqim. Relabelling the legs is left to the caller.
class HeelStrikeMap {
public:
    HeelStrikeMap(const BipedKinematics &kin, const ComMotion &motion);
    ~HeelStrikeMap();

    const std::vector<Expression >& getEquations() const;

    // MM dq = ff, dense
    bool getCollisionSystem(LinearSystem &system) const;

protected:
    const BipedKinematics &kin_;
    std::vector<Expression > equations_;
};

#endif  // HEEL_STRIKE_H__

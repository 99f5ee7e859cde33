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


#include "biped_parameters.h"

#include <cmath>

#include <ros/ros.h>

#include "biped_symbols.h"

    BipedParameters::BipedParameters() :
        m_(5),
        I_(5),
        l_(5),
        c_(5),
        g_(9.81)
    {
        m_ << 3.2, 6.8, 20.0, 6.8, 3.2;
        I_ << 0.93, 1.08, 2.22, 1.08, 0.93;
        l_ << 0.4, 0.4, 0.625, 0.4, 0.4;
        c_ << 0.128, 0.163, 0.2, 0.163, 0.128;
    }

    BipedParameters::~BipedParameters() {
    }

    bool BipedParameters::loadFromParamServer(const ros::NodeHandle &nh) {
        for (int link_idx = 0; link_idx < m_.innerSize(); link_idx++) {
            nh.getParam(linkSymbol("m", link_idx), m_(link_idx));
            nh.getParam(linkSymbol("I", link_idx), I_(link_idx));
            nh.getParam(linkSymbol("l", link_idx), l_(link_idx));
            nh.getParam(linkSymbol("c", link_idx), c_(link_idx));
        }
        nh.getParam("g", g_);

        if (!isValid()) {
            ROS_ERROR("ERROR: BipedParameters::loadFromParamServer: invalid biped parameters");
            return false;
        }
        return true;
    }

    bool BipedParameters::isValid() const {
        if (!std::isfinite(g_)) {
            ROS_ERROR("ERROR: BipedParameters::isValid: g is not finite");
            return false;
        }
        for (int link_idx = 0; link_idx < m_.innerSize(); link_idx++) {
            const double values[] = {m_(link_idx), I_(link_idx), l_(link_idx), c_(link_idx)};
            const char *names[] = {"m", "I", "l", "c"};
            for (int v_idx = 0; v_idx < 4; v_idx++) {
                if (!std::isfinite(values[v_idx])) {
                    ROS_ERROR("ERROR: BipedParameters::isValid: %s is not finite", linkSymbol(names[v_idx], link_idx).c_str());
                    return false;
                }
                // c may be any finite value
                if (v_idx < 3 && values[v_idx] <= 0.0) {
                    ROS_ERROR("ERROR: BipedParameters::isValid: %s must be positive, got %lf", linkSymbol(names[v_idx], link_idx).c_str(), values[v_idx]);
                    return false;
                }
            }
            if (c_(link_idx) < 0.0 || c_(link_idx) > l_(link_idx)) {
                ROS_WARN("BipedParameters::isValid: %s = %lf places the CoM outside the link", linkSymbol("c", link_idx).c_str(), c_(link_idx));
            }
        }
        return true;
    }

    bool BipedParameters::getValue(const std::string &symbol_name, double &value) const {
        if (symbol_name == "g") {
            value = g_;
            return true;
        }
        for (int link_idx = 0; link_idx < m_.innerSize(); link_idx++) {
            if (symbol_name == linkSymbol("m", link_idx)) {
                value = m_(link_idx);
                return true;
            }
            if (symbol_name == linkSymbol("I", link_idx)) {
                value = I_(link_idx);
                return true;
            }
            if (symbol_name == linkSymbol("l", link_idx)) {
                value = l_(link_idx);
                return true;
            }
            if (symbol_name == linkSymbol("c", link_idx)) {
                value = c_(link_idx);
                return true;
            }
        }
        return false;
    }

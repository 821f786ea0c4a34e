// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "util.hpp"

#include "ec/pid.hpp"

#include <iostream>

namespace roast_control
{

void initializePIDStruct(ec::pid_info_t* info, const ec::pidinfo& initial)
{
    info->initialized = false;
    info->integral = 0.0;
    info->lastError = 0.0;
    info->proportionalCoeff = initial.proportionalCoeff;
    info->integralCoeff = initial.integralCoeff;
    info->derivativeCoeff = initial.derivativeCoeff;
}

void dumpPIDStruct(const ec::pid_info_t* info)
{
    std::cerr << " proportionalCoeff: " << info->proportionalCoeff
              << " integralCoeff: " << info->integralCoeff
              << " derivativeCoeff: " << info->derivativeCoeff
              << " last_error: " << info->lastError
              << " integral: " << info->integral << std::endl;

    return;
}

} // namespace roast_control

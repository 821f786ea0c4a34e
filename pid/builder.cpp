// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "pid/builder.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"
#include "pid/pidcontroller.hpp"
#include "pid/tuning.hpp"
#include "pid/util.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>

namespace roast_control
{

std::unique_ptr<PIDController> buildController(const conf::ControllerInfo& info)
{
    if (info.name.empty())
    {
        throw ControllerBuildException("PID controller missing name");
    }

    const auto& p = info.pidInfo;
    if (!std::isfinite(p.proportionalCoeff) || !std::isfinite(p.integralCoeff) ||
        !std::isfinite(p.derivativeCoeff))
    {
        throw ControllerBuildException("PID controller " + info.name +
                                       " has a gain that is not finite");
    }

    auto pid = std::make_unique<PIDController>(info.name, p);

    std::cerr << "PID name: " << info.name << "\n";
    if (debugEnabled)
    {
        dumpPIDStruct(pid->getPIDInfo());
    }

    return pid;
}

} // namespace roast_control

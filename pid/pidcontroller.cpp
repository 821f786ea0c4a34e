// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "pidcontroller.hpp"

#include "ec/logging.hpp"
#include "ec/pid.hpp"
#include "util.hpp"

#include <string>

namespace roast_control
{

PIDController::PIDController(const std::string& id,
                             const ec::pidinfo& initial) :
    Controller(), _id(id)
{
    initializePIDStruct(&_pid_info, initial);
}

PIDController::~PIDController()
{
    ec::LogClose(&_pid_info);
}

double PIDController::update(double measurement, double target, double dt)
{
    return ec::pid(&_pid_info, measurement, target, dt, &_id);
}

} // namespace roast_control

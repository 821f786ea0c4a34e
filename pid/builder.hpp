#pragma once

#include "conf.hpp"
#include "pid/pidcontroller.hpp"

#include <memory>

namespace roast_control
{

/**
 * Build a PID controller from its configuration.
 *
 * @param[in] info - the controller configuration.
 * @return the controller, with zeroed accumulators.
 * @throw ControllerBuildException if the name is empty or a gain is not
 * finite.
 */
std::unique_ptr<PIDController> buildController(const conf::ControllerInfo& info);

} // namespace roast_control

#pragma once

#include "ec/pid.hpp"

namespace roast_control
{

/*
 * Given a configuration structure, fill out the information we use within the
 * PID loop.  The accumulators start from zero.
 */
void initializePIDStruct(ec::pid_info_t* info, const ec::pidinfo& initial);

void dumpPIDStruct(const ec::pid_info_t* info);

} // namespace roast_control

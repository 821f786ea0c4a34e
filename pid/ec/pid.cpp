// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "pid.hpp"

#include "logging.hpp"

#include <string>

namespace roast_control
{
namespace ec
{

/********************************
 *  pid code
 *  Note: dt may be zero, the derivative is skipped in that case
 */
double pid(pid_info_t* pidinfoptr, double input, double setpoint, double dt,
           const std::string* nameptr)
{
    // Only named loops are logged, the log opens on the first call
    PidCoreLog* logPtr = nullptr;
    if (nameptr)
    {
        logPtr = pidinfoptr->initialized ? LogPeek(pidinfoptr)
                                         : LogInit(*nameptr, pidinfoptr);
    }

    PidCoreContext coreContext;

    coreContext.input = input;
    coreContext.setpoint = setpoint;
    coreContext.dt = dt;

    double error;

    double proportionalTerm;
    double integralTerm;
    double derivative = 0.0;
    double derivativeTerm;

    double output;

    // Pid
    error = setpoint - input;
    proportionalTerm = pidinfoptr->proportionalCoeff * error;

    coreContext.error = error;
    coreContext.proportionalTerm = proportionalTerm;

    // pId, always accumulated so a pure P loop still tracks it
    pidinfoptr->integral += error * dt;
    integralTerm = pidinfoptr->integralCoeff * pidinfoptr->integral;

    coreContext.integral = pidinfoptr->integral;
    coreContext.integralTerm = integralTerm;

    // piD, against the error of the previous call
    if (dt > 0.0)
    {
        derivative = (error - pidinfoptr->lastError) / dt;
    }
    derivativeTerm = pidinfoptr->derivativeCoeff * derivative;

    coreContext.derivative = derivative;
    coreContext.derivativeTerm = derivativeTerm;

    output = proportionalTerm + integralTerm + derivativeTerm;

    coreContext.output = output;

    pidinfoptr->lastError = error;
    pidinfoptr->initialized = true;

    if (logPtr)
    {
        logPtr->writeContext(LogTimestamp(), coreContext);
    }

    return output;
}

} // namespace ec
} // namespace roast_control

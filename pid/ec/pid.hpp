#pragma once

#include <string>

namespace roast_control
{
namespace ec
{

/* Note: If you update these structs you need to update the copy code in
 * pid/util.cpp and the initialization code in pid/buildjson.cpp files.
 */
typedef struct
{
    bool initialized = false;       // has pid been logged once

    double integral = 0.0;          // integral of error
    double lastError = 0.0;         // value of last error

    double proportionalCoeff = 0.0; // coeff for P
    double integralCoeff = 0.0;     // coeff for I
    double derivativeCoeff = 0.0;   // coeff for D
} pid_info_t;

/*
 * One step of the PID loop.
 *
 * The integral accumulates error * dt without limits. The derivative is
 * taken against the error of the previous call and is zero when dt is not
 * positive. No input is validated: NaN and infinity propagate.
 */
double pid(pid_info_t* pidinfoptr, double input, double setpoint, double dt,
           const std::string* nameptr = nullptr);

/* Condensed version for use by the configuration. */
struct pidinfo
{
    double proportionalCoeff = 0.0; // coeff for P
    double integralCoeff = 0.0;     // coeff for I
    double derivativeCoeff = 0.0;   // coeff for D
};

} // namespace ec
} // namespace roast_control

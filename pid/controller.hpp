#pragma once

#include <string>

namespace roast_control
{

/*
 * Base class for controllers.  The simulator drives each controller once per
 * tick through update() and applies the returned value to the plant.
 */
struct Controller
{
    virtual ~Controller() = default;

    virtual double update(double measurement, double target, double dt) = 0;

    virtual std::string getID(void) = 0;
};

} // namespace roast_control

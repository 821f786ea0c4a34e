#pragma once

#include "controller.hpp"
#include "ec/pid.hpp"

#include <string>

namespace roast_control
{

/*
 * A PIDController owns the state of one PID loop.  The gains are fixed at
 * construction; the integral and the previous error change on every update.
 * There is no reset, build a new controller instead.
 */
class PIDController : public Controller
{
  public:
    PIDController(const std::string& id, const ec::pidinfo& initial);

    ~PIDController() override;

    double update(double measurement, double target, double dt) override;

    std::string getID(void) override
    {
        return _id;
    }

    const ec::pid_info_t* getPIDInfo(void) const
    {
        return &_pid_info;
    }

    double getIntegral(void) const
    {
        return _pid_info.integral;
    }

    double getPreviousError(void) const
    {
        return _pid_info.lastError;
    }

  private:
    std::string _id;
    ec::pid_info_t _pid_info;
};

} // namespace roast_control

#pragma once

#include "pid.hpp"

#include <chrono>
#include <fstream>
#include <optional>
#include <string>

namespace roast_control
{
namespace ec
{

/* Everything one call of pid() computed, one row of pidcore.<name>. */
struct PidCoreContext
{
    double input;
    double setpoint;
    double dt;
    double error;

    double proportionalTerm;

    double integral;
    double integralTerm;

    double derivative;
    double derivativeTerm;

    double output;

    bool operator==(const PidCoreContext& rhs) const = default;
};

/*
 * The CSV files of one PID loop: pidcore.<name> gets the computations,
 * pidcoeffs.<name> the gains.  Both are created in the given directory.
 */
class PidCoreLog
{
  public:
    PidCoreLog(const std::string& directory, const std::string& name);

    bool isOpen(void) const
    {
        return _context.is_open() && _coeffs.is_open();
    }

    void writeCoeffs(std::chrono::milliseconds msNow, const pid_info_t& info);

    /**
     * A row equal to the previous one is skipped unless the throttle
     * interval has passed since the last row written.
     */
    void writeContext(std::chrono::milliseconds msNow,
                      const PidCoreContext& context);

  private:
    std::ofstream _context;
    std::ofstream _coeffs;
    std::optional<std::chrono::milliseconds> _lastLog;
    PidCoreContext _lastContext{};
};

/*
 * Open the log of the loop whose state lives at pidinfoptr, replacing any
 * log already held for that state.  Returns nullptr when core logging is
 * off, the name has no usable characters or the files cannot be created.
 */
PidCoreLog* LogInit(const std::string& name, const pid_info_t* pidinfoptr);

PidCoreLog* LogPeek(const pid_info_t* pidinfoptr);

// Close the log of one loop, if it has one
void LogClose(const pid_info_t* pidinfoptr);

void LogClear(void);

std::chrono::milliseconds LogTimestamp(void);

// Keep ASCII letters and digits only
std::string StrClean(const std::string& str);

} // namespace ec
} // namespace roast_control

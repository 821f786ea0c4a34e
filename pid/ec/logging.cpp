// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "logging.hpp"

#include "../tuning.hpp"
#include "csv.hpp"
#include "pid.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace roast_control
{
namespace ec
{

static constexpr std::chrono::milliseconds logThrottle{60 * 1000};

static std::map<const pid_info_t*, std::unique_ptr<PidCoreLog>> openLogs;

std::string StrClean(const std::string& str)
{
    std::string res;
    std::copy_if(str.begin(), str.end(), std::back_inserter(res),
                 [](char ch) {
                     return (ch >= 'A' && ch <= 'Z') ||
                            (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
                 });
    return res;
}

PidCoreLog::PidCoreLog(const std::string& directory, const std::string& name)
{
    const std::filesystem::path dir{directory};

    _context.open(dir / ("pidcore." + name));
    _coeffs.open(dir / ("pidcoeffs." + name));
    if (!isOpen())
    {
        return;
    }

    writeCsvHeader(_context, {"epoch_ms", "input", "setpoint", "dt", "error",
                              "proportionalTerm", "integral", "integralTerm",
                              "derivative", "derivativeTerm", "output"});
    writeCsvHeader(_coeffs, {"epoch_ms", "integral", "lastError",
                             "proportionalCoeff", "integralCoeff",
                             "derivativeCoeff"});
    _context.flush();
    _coeffs.flush();
}

void PidCoreLog::writeCoeffs(std::chrono::milliseconds msNow,
                             const pid_info_t& info)
{
    writeCsvRow(_coeffs, msNow.count(), info.integral, info.lastError,
                info.proportionalCoeff, info.integralCoeff,
                info.derivativeCoeff);
    _coeffs.flush();
}

void PidCoreLog::writeContext(std::chrono::milliseconds msNow,
                              const PidCoreContext& c)
{
    if (_lastLog && c == _lastContext && (msNow - *_lastLog) < logThrottle)
    {
        return;
    }

    _lastLog = msNow;
    _lastContext = c;

    writeCsvRow(_context, msNow.count(), c.input, c.setpoint, c.dt, c.error,
                c.proportionalTerm, c.integral, c.integralTerm, c.derivative,
                c.derivativeTerm, c.output);
    _context.flush();
}

PidCoreLog* LogInit(const std::string& name, const pid_info_t* pidinfoptr)
{
    if (!coreLoggingEnabled)
    {
        return nullptr;
    }

    // A new loop may reuse the state address of a destroyed one
    LogClose(pidinfoptr);

    std::string cleanName = StrClean(name);
    if (cleanName.empty())
    {
        std::cerr << "PID logging disabled because PID name is unusable: "
                  << name << "\n";
        return nullptr;
    }

    auto log = std::make_unique<PidCoreLog>(loggingPath, cleanName);
    if (!log->isOpen())
    {
        std::cerr << "PID logging disabled because unable to open files for "
                  << cleanName << " in " << loggingPath << "\n";
        return nullptr;
    }

    log->writeCoeffs(LogTimestamp(), *pidinfoptr);
    std::cerr << "PID logging initialized: " << name << "\n";

    auto& slot = openLogs[pidinfoptr];
    slot = std::move(log);
    return slot.get();
}

PidCoreLog* LogPeek(const pid_info_t* pidinfoptr)
{
    auto found = openLogs.find(pidinfoptr);
    return (found != openLogs.end()) ? found->second.get() : nullptr;
}

void LogClose(const pid_info_t* pidinfoptr)
{
    openLogs.erase(pidinfoptr);
}

void LogClear(void)
{
    openLogs.clear();
}

std::chrono::milliseconds LogTimestamp(void)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

} // namespace ec
} // namespace roast_control

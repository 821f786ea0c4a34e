// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "util.hpp"

#include "conf.hpp"
#include "sim/profile.hpp"

#include <filesystem>
#include <ostream>
#include <vector>

namespace roast_control
{

void applyGainOverrides(ec::pidinfo& gains, const GainOverrides& overrides)
{
    if (overrides.proportionalCoeff)
    {
        gains.proportionalCoeff = *overrides.proportionalCoeff;
    }
    if (overrides.integralCoeff)
    {
        gains.integralCoeff = *overrides.integralCoeff;
    }
    if (overrides.derivativeCoeff)
    {
        gains.derivativeCoeff = *overrides.derivativeCoeff;
    }
}

std::filesystem::path
    searchConfigurationPath(const std::vector<std::filesystem::path>& dirs)
{
    static constexpr auto name = "roast.json";

    for (const auto& pathSeg : dirs)
    {
        auto file = pathSeg / name;
        if (std::filesystem::exists(file))
        {
            return file;
        }
    }

    return {};
}

std::filesystem::path searchConfigurationPath(void)
{
    return searchConfigurationPath(
        {std::filesystem::current_path(), std::filesystem::path{"/etc/roastsim"},
         std::filesystem::path{"/usr/share/roastsim"}});
}

void debugPrint(std::ostream& out,
                const conf::ControllerInfo& controllerConfig,
                const conf::RoastConfig& roastConfig,
                const TargetProfile& profile)
{
    out << "controller config:\n";
    out << "{\n";
    out << "\t" << controllerConfig.name << ",\n";
    out << "\t{" << controllerConfig.pidInfo.proportionalCoeff << ", ";
    out << controllerConfig.pidInfo.integralCoeff << ", ";
    out << controllerConfig.pidInfo.derivativeCoeff << "}\n";
    out << "}\n\n";
    out << "roast config:\n";
    out << "{\n";
    out << "\t" << roastConfig.batchGrams << ", ";
    out << roastConfig.moisture << ", ";
    out << roastConfig.burnerMJ << ",\n";
    out << "\t" << roastConfig.inletTemp << ", ";
    out << roastConfig.beanStartTemp << ", ";
    out << roastConfig.chargeTemp << ",\n";
    out << "\t" << roastConfig.yellowTemp << ", ";
    out << roastConfig.firstCrackTemp << ", ";
    out << roastConfig.postCrackFactor << ",\n";
    out << "\t" << roastConfig.dropMinutes << ", ";
    out << roastConfig.steps << ",\n";
    out << "\t{";
    for (const auto& row : roastConfig.powerSchedule)
    {
        out << "\n\t\t" << row << ",";
    }
    out << "\n\t}\n";
    out << "}\n\n";
    out << "profile:\n";
    out << "{\n";
    for (const auto& point : profile.getPoints())
    {
        out << "\t{" << point.seconds << ", " << point.temp << "},\n";
    }
    out << "}\n\n";
}

} // namespace roast_control

#pragma once

#include "conf.hpp"
#include "pid/ec/pid.hpp"
#include "sim/profile.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <vector>

namespace roast_control
{

/* Gains given on the command line; unset ones keep the configured value. */
struct GainOverrides
{
    std::optional<double> proportionalCoeff;
    std::optional<double> integralCoeff;
    std::optional<double> derivativeCoeff;
};

void applyGainOverrides(ec::pidinfo& gains, const GainOverrides& overrides);

/*
 * Return the first of the directories holding a roast.json, as the path to
 * that file, or an empty path if none does.
 */
std::filesystem::path
    searchConfigurationPath(const std::vector<std::filesystem::path>& dirs);

/*
 * Same, over the current directory, /etc/roastsim and /usr/share/roastsim in
 * that order.
 */
std::filesystem::path searchConfigurationPath(void);

/*
 * Dump active configuration.
 */
void debugPrint(std::ostream& out,
                const conf::ControllerInfo& controllerConfig,
                const conf::RoastConfig& roastConfig,
                const TargetProfile& profile);

} // namespace roast_control

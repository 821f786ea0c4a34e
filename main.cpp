// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "buildjson/buildjson.hpp"
#include "conf.hpp"
#include "pid/builder.hpp"
#include "pid/buildjson.hpp"
#include "pid/tuning.hpp"
#include "sim/buildjson.hpp"
#include "sim/profile.hpp"
#include "sim/roaster.hpp"
#include "sim/summary.hpp"
#include "sim/tracelog.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace roast_control
{

/* The configuration converted controller. */
conf::ControllerInfo controllerConfig = {};
/* The configuration converted roaster. */
conf::RoastConfig roastConfig = {};
/* The configuration converted target curve. */
std::optional<TargetProfile> profileConfig;

void loadConfiguration(const std::filesystem::path& configPath)
{
    const std::filesystem::path path =
        (!configPath.empty()) ? configPath : searchConfigurationPath();

    if (path.empty())
    {
        std::cerr << "No configuration found, using built-in defaults\n";
        profileConfig = TargetProfile::defaultProfile();
        return;
    }

    std::cerr << "Loading configuration: " << path.string() << "\n";

    auto jsonData = parseValidateJson(path.string());
    controllerConfig = buildControllerFromJson(jsonData);

    auto [roast, profile] = buildRoastFromJson(jsonData);
    roastConfig = roast;
    profileConfig = profile;
}

} // namespace roast_control

int main(int argc, char* argv[])
{
    loggingPath = "";
    loggingEnabled = false;
    debugEnabled = false;
    coreLoggingEnabled = false;

    std::filesystem::path configPath = "";
    std::string tracePath;
    double kp = 0.0;
    double ki = 0.0;
    double kd = 0.0;

    CLI::App app{"Coffee Roast PID Simulator"};

    app.add_option("-c,--conf", configPath,
                   "Optional parameter to specify configuration at run-time")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--log", loggingPath,
                   "Optional parameter to specify logging folder")
        ->check(CLI::ExistingDirectory);
    app.add_option("-o,--output", tracePath,
                   "Optional parameter to specify the roast trace CSV file");
    auto* kpOption =
        app.add_option("--kp", kp, "Override the proportional coefficient");
    auto* kiOption =
        app.add_option("--ki", ki, "Override the integral coefficient");
    auto* kdOption =
        app.add_option("--kd", kd, "Override the derivative coefficient");
    app.add_flag("-d,--debug", debugEnabled, "Enable or disable debug mode");
    app.add_flag("-g,--corelogging", coreLoggingEnabled,
                 "Enable or disable logging of core PID loop computations");

    CLI11_PARSE(app, argc, argv);

    if (!loggingPath.empty())
    {
        // Enable logging, if user explicitly gave path on command line
        loggingEnabled = true;
        std::cerr << "Logging enabled: " << loggingPath << "\n";
    }
    if (coreLoggingEnabled)
    {
        if (loggingPath.empty())
        {
            loggingPath = std::filesystem::temp_directory_path();
        }
        std::cerr << "Core logging enabled: " << loggingPath << "\n";
    }
    if (debugEnabled)
    {
        std::cerr << "Debug mode enabled\n";
    }

    using namespace roast_control;

    RoastResult result;
    try
    {
        loadConfiguration(configPath);

        GainOverrides overrides;
        if (*kpOption)
        {
            overrides.proportionalCoeff = kp;
        }
        if (*kiOption)
        {
            overrides.integralCoeff = ki;
        }
        if (*kdOption)
        {
            overrides.derivativeCoeff = kd;
        }
        applyGainOverrides(controllerConfig.pidInfo, overrides);

        if (debugEnabled)
        {
            debugPrint(std::cerr, controllerConfig, roastConfig,
                       *profileConfig);
        }

        auto pid = buildController(controllerConfig);
        RoastSimulator roaster(roastConfig, *profileConfig);

        result = roaster.run(*pid);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Failed during building: " << e.what() << "\n";
        return EXIT_FAILURE; /* fatal error. */
    }

    if (tracePath.empty() && loggingEnabled)
    {
        tracePath = loggingPath + "/roast.csv";
    }
    if (!tracePath.empty())
    {
        try
        {
            writeTrace(tracePath, result.samples);
            std::cerr << "Trace written: " << tracePath << "\n";
        }
        catch (const std::exception& e)
        {
            std::cerr << e.what() << "\n";
            return EXIT_FAILURE;
        }
    }

    const auto& gains = controllerConfig.pidInfo;
    const auto& summary = result.summary;

    std::cout << "Kp: " << gains.proportionalCoeff
              << " Ki: " << gains.integralCoeff
              << " Kd: " << gains.derivativeCoeff << "\n";
    std::cout << formatInfo(summary) << "\n";
    std::cout << "Beans: " << summary.beanCount
              << ", Surface: " << summary.surfaceArea
              << ", Bean energy: " << formatBeanEnergy(summary.beanEnergyKJ)
              << ", Burner energy: "
              << formatBurnerEnergy(summary.burnerEnergyMJ)
              << ", Radiative: " << formatRadiative(summary.radiativeJ)
              << ", Froude: " << summary.froude << "\n";

    return 0;
}

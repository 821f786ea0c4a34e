// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "roaster.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"
#include "pid/controller.hpp"
#include "pid/tuning.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <numbers>
#include <vector>

namespace roast_control
{

static constexpr double maxTemperature = 1000.0;
static constexpr double minTemperature = -50.0;
static constexpr double maxPower = 100.0;
static constexpr double minPower = 0.0;
static constexpr uint64_t maxSteps = 10'000'000;

static constexpr double rorCorrection = 0.5;
static constexpr double rorLimit = 50.0;
static constexpr double waterEvaporation = 750.0; // energy per kg of water
static constexpr double postCrackLossFactor = 600.0;
static constexpr double postCrackEnergyFactor = 50.0;
static constexpr double radiativeLimit = 1e12;
static constexpr double stefanBoltzmann = 5.6703e-8;

RoastSimulator::RoastSimulator(const conf::RoastConfig& config,
                               const TargetProfile& profile) :
    _config(config)
{
    if (_config.steps == 0)
    {
        throw ConfigurationException("Roast needs at least one step");
    }
    if (_config.steps > maxSteps)
    {
        throw ConfigurationException("Roast has too many steps");
    }
    if (!(_config.dropMinutes > 0))
    {
        throw ConfigurationException("Roast drop time must be positive");
    }
    if (_config.initialPower == 0)
    {
        throw ConfigurationException("Roast initial power must not be zero");
    }

    _targets = profile.sample(_config.dropMinutes * 60, _config.steps);
    _schedule = parsePowerSchedule(_config.powerSchedule);
}

void RoastSimulator::initialize(void)
{
    auto& s = _state;

    s.kg = _config.batchGrams / 1000;
    s.kgCoffee = s.kg * (1 - _config.moisture);
    s.water = _config.moisture * s.kgCoffee;
    s.speed = (_config.airflowFactor <= 3) ? _config.airflowFactor
                                           : 6 - _config.airflowFactor;
    s.wfact = 0.0012 * s.kg / 10;
    s.resp = 10 + (3 - _config.responseFactor) * 3;
    s.tstep = getStepMinutes();
    s.minutes = 0.0;
    s.drum = _config.chargeTemp;
    s.inletLagged = 0.0;
    s.mjNow = _config.burnerMJ;
    s.mjTotal = 0.0;
    s.beanTrue = _config.beanStartTemp;
    s.beanMeasured = s.drum;
    s.lastMeasured = 999.0;
    s.turnMinutes = 0.0;
    s.yellowMinutes = 0.0;
    s.firstCrackMinutes = 0.0;
    s.pastFirstCrack = false;
    s.radiative = 0.0;
}

RoastSample RoastSimulator::chargeSample(void) const
{
    const auto& s = _state;

    RoastSample sample;
    sample.minutes = 0.0;
    sample.target = _targets.front();
    sample.beanMeasured = s.beanMeasured;
    sample.beanTrue = s.beanTrue;
    sample.ror = 0.0;
    sample.power = _schedule.empty() ? _config.initialPower
                                     : _schedule.front().power;
    sample.drum = s.drum;
    sample.inletEq = _config.inletTemp;
    sample.weightPct = 100.0;
    sample.waterPct = (s.kgCoffee > 0) ? s.water * 100 / s.kgCoffee : 0.0;

    return sample;
}

RoastSample RoastSimulator::step(Controller& controller, uint64_t index)
{
    auto& s = _state;

    s.minutes += s.tstep;

    double target = _targets[index];

    // The controller sees the bean temperature, its output drives the burner
    double output = controller.update(s.beanTrue, target, s.tstep);
    double power = std::clamp(output, minPower, maxPower);

    // Inlet air settles higher or lower depending on the power
    double inletEq =
        _config.inletTemp * (1 - (1 - power / _config.initialPower) * 0.2);
    inletEq = std::clamp(inletEq, minTemperature, maxTemperature);

    if (s.inletLagged == 0)
    {
        s.inletLagged = inletEq;
    }

    s.drum += (s.beanTrue - (s.drum - 40 + (_config.inletTemp - inletEq))) /
              (s.resp * 5);
    s.drum = std::clamp(s.drum, minTemperature, maxTemperature);

    double mjEq = _config.burnerMJ * power / 100;
    s.mjNow += (mjEq - s.mjNow) / s.resp;
    s.mjTotal += s.mjNow;

    double waterLoss = std::max(0.0, (s.beanTrue - 100) * s.wfact * s.tstep);

    if (s.beanTrue >= _config.firstCrackTemp)
    {
        if (s.firstCrackMinutes == 0)
        {
            s.firstCrackMinutes = s.minutes;
        }
        s.pastFirstCrack = true;
    }

    if (s.beanTrue >= _config.yellowTemp)
    {
        if (s.yellowMinutes == 0)
        {
            s.yellowMinutes = s.minutes;
        }
    }

    // Evaporation takes energy away, much faster once the beans crack
    double waterMJ = 0.0;
    if (s.pastFirstCrack)
    {
        waterLoss = (s.water - 0.01 * s.kgCoffee) / 10;
        s.water = std::max(s.water - waterLoss, 0.0);
        waterMJ = waterEvaporation * waterLoss;
    }
    else if (s.water > 0 && waterLoss > 0)
    {
        waterLoss = std::min(waterLoss, s.water - 0.01 * s.kgCoffee);
        s.water -= waterLoss;
        waterMJ = waterEvaporation * waterLoss;
    }

    double waterPct = (s.kgCoffee > 0) ? s.water * 100 / s.kgCoffee : 0.0;

    // After first crack the roast turns exothermic while losing mass
    double postCrackMJ = 0.0;
    if (_config.postCrackFactor > 0 && s.pastFirstCrack)
    {
        double loss = s.kgCoffee * _config.postCrackFactor / postCrackLossFactor;
        s.kgCoffee = std::max(s.kgCoffee - loss, 0.0);
        postCrackMJ = std::pow(s.beanTrue + 1 - _config.firstCrackTemp, 2) *
                      loss * postCrackEnergyFactor;
    }

    double kgNow = s.kgCoffee + s.water;
    double weightPct = (s.kg > 0) ? 100 * kgNow / s.kg : 0.0;

    double deltaT = 0.0;
    if (kgNow != 0)
    {
        deltaT = (s.inletLagged - s.beanTrue) *
                 (s.mjNow - waterMJ + postCrackMJ) / kgNow *
                 (0.019 + (s.speed - 3) * 0.0005) * s.tstep;
        deltaT = std::clamp(deltaT, -maxTemperature, maxTemperature);
    }

    s.inletLagged += (inletEq - s.inletLagged) / 100;
    s.beanTrue = std::clamp(s.beanTrue + deltaT, minTemperature,
                            maxTemperature);

    // The probe follows the beans with a lag
    double deltaMeasured = (s.beanTrue - s.beanMeasured) / s.resp;
    s.beanMeasured += deltaMeasured;

    if (!std::isfinite(s.beanMeasured))
    {
        s.beanMeasured = s.beanTrue;
    }

    if (s.beanMeasured > s.lastMeasured && s.turnMinutes == 0)
    {
        s.turnMinutes = s.minutes;
    }
    s.lastMeasured = s.beanMeasured;

    double ror = std::clamp(deltaMeasured / s.tstep * rorCorrection,
                            -rorLimit, rorLimit);

    double radiativeLoss =
        stefanBoltzmann *
        (std::pow(inletEq + 273, 4) - std::pow(s.beanTrue + 273, 4));
    s.radiative = std::clamp(s.radiative + radiativeLoss, -radiativeLimit,
                             radiativeLimit);

    if (debugEnabled)
    {
        std::cerr << controller.getID() << " t: " << s.minutes
                  << " target: " << target << " bean: " << s.beanTrue
                  << " measured: " << s.beanMeasured << " output: " << output
                  << " power: " << power << "\n";
    }

    RoastSample sample;
    sample.minutes = s.minutes;
    sample.target = target;
    sample.beanMeasured = s.beanMeasured;
    sample.beanTrue = s.beanTrue;
    sample.ror = ror;
    sample.power = power;
    sample.drum = s.drum;
    sample.inletEq = inletEq;
    sample.weightPct = weightPct;
    sample.waterPct = waterPct;

    return sample;
}

RoastSummary RoastSimulator::finish(void) const
{
    const auto& s = _state;

    double drumDiameter = _config.drumDiameterMM / 1000;
    double drumLength = _config.drumLengthMM / 1000;
    double drumArea = std::numbers::pi * drumDiameter * drumLength;
    // Bean bed area, for a bulk density of about 0.5
    double beanArea =
        2 * std::numbers::pi *
        std::sqrt(2 * s.kg / 1000 / (std::numbers::pi * drumLength)) *
        drumLength;

    RoastSummary summary;

    summary.turnMinutes = s.turnMinutes;
    summary.yellowMinutes = s.yellowMinutes;
    summary.firstCrackMinutes = s.firstCrackMinutes;
    summary.dropMinutes = _config.dropMinutes;
    summary.dropTemp = s.beanMeasured;

    summary.radiativeJ =
        s.radiative * beanArea /
        (1 / _config.beanEmissivity +
         (beanArea / drumArea) * (1 / _config.drumEmissivity - 1)) *
        s.tstep * 60;
    summary.burnerEnergyMJ = s.mjTotal * _config.dropMinutes / 60 /
                             static_cast<double>(_config.steps);

    double beanRadius = _config.beanDiameterMM / 2;
    double beanMass = (4.0 / 3.0) * std::numbers::pi *
                      std::pow(beanRadius, 3) * _config.beanDensity;
    summary.beanCount =
        (beanMass > 0) ? static_cast<int64_t>(s.kg / beanMass) : 0;
    summary.surfaceArea = static_cast<double>(summary.beanCount) * 4 *
                          std::numbers::pi * std::pow(beanRadius, 2);
    summary.beanEnergyKJ = s.kg * _config.beanHeatCapacity *
                           (s.beanMeasured - _config.beanStartTemp);

    double omega = _config.drumRPM / 60 * 2 * std::numbers::pi;
    summary.froude = omega * omega * drumDiameter / (2 * 9.8);
    summary.burnerMJ = _config.burnerMJ;

    return summary;
}

RoastResult RoastSimulator::run(Controller& controller)
{
    initialize();

    RoastResult result;
    result.samples.reserve(_config.steps + 2);
    result.samples.emplace_back(chargeSample());

    for (uint64_t index = 0; index <= _config.steps; ++index)
    {
        result.samples.emplace_back(step(controller, index));
    }

    result.summary = finish();

    return result;
}

} // namespace roast_control

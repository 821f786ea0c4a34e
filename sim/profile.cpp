// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "profile.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace roast_control
{

TargetProfile::TargetProfile(const std::vector<conf::ProfilePoint>& points) :
    _points(points)
{
    if (_points.empty())
    {
        throw ConfigurationException("Target profile has no points");
    }

    for (size_t i = 0; i < _points.size(); ++i)
    {
        if (!std::isfinite(_points[i].seconds) ||
            !std::isfinite(_points[i].temp))
        {
            throw ConfigurationException(
                "Target profile point " + std::to_string(i) +
                " is not finite");
        }
        if (i > 0 && !(_points[i].seconds > _points[i - 1].seconds))
        {
            throw ConfigurationException(
                "Target profile times must be strictly increasing at point " +
                std::to_string(i));
        }
    }
}

TargetProfile TargetProfile::defaultProfile(void)
{
    return TargetProfile({
        {0.0, 20.0},    // charge
        {300.0, 149.0}, // drying
        {600.0, 204.0}, // maillard
        {900.0, 210.0}, // first crack
        {1200.0, 227.0} // development
    });
}

double TargetProfile::at(double seconds) const
{
    double value = _points.front().temp;

    // if time is past the last knot return the last temperature
    if (seconds >= _points.back().seconds)
    {
        value = _points.back().temp;
    }
    // before the first knot keep the first temperature
    else if (seconds > _points.front().seconds)
    {
        for (size_t i = 1; i < _points.size(); ++i)
        {
            if (_points[i].seconds > seconds)
            {
                double timeLow = _points[i - 1].seconds;
                double timeHigh = _points[i].seconds;
                double tempLow = _points[i - 1].temp;
                double tempHigh = _points[i].temp;
                value = tempLow + ((tempHigh - tempLow) / (timeHigh - timeLow)) *
                                      (seconds - timeLow);
                break;
            }
        }
    }

    return value;
}

std::vector<double> TargetProfile::sample(double totalSeconds,
                                          uint64_t steps) const
{
    std::vector<double> values;
    values.reserve(steps + 1);

    for (uint64_t i = 0; i <= steps; ++i)
    {
        double t = (steps == 0) ? 0.0
                                : totalSeconds * static_cast<double>(i) /
                                      static_cast<double>(steps);
        values.emplace_back(at(t));
    }

    return values;
}

} // namespace roast_control

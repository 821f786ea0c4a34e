// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "sim/buildjson.hpp"

#include "conf.hpp"
#include "errors/exception.hpp"
#include "sim/profile.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace roast_control
{

using json = nlohmann::json;

namespace conf
{

template <typename T>
static void getOptional(const json& j, const std::string& key, T& value)
{
    auto found = j.find(key);
    if (found != j.end())
    {
        found->get_to(value);
    }
}

void from_json(const json& j, conf::RoastConfig& c)
{
    getOptional(j, "batchGrams", c.batchGrams);
    getOptional(j, "moisture", c.moisture);
    getOptional(j, "burnerMJ", c.burnerMJ);
    getOptional(j, "inletTemp", c.inletTemp);
    getOptional(j, "beanStartTemp", c.beanStartTemp);
    getOptional(j, "firstCrackTemp", c.firstCrackTemp);
    getOptional(j, "chargeTemp", c.chargeTemp);
    getOptional(j, "yellowTemp", c.yellowTemp);
    getOptional(j, "postCrackFactor", c.postCrackFactor);
    getOptional(j, "dropMinutes", c.dropMinutes);
    getOptional(j, "airflowFactor", c.airflowFactor);
    getOptional(j, "responseFactor", c.responseFactor);
    getOptional(j, "initialPower", c.initialPower);
    getOptional(j, "powerSchedule", c.powerSchedule);
    getOptional(j, "beanDiameterMM", c.beanDiameterMM);
    getOptional(j, "beanDensity", c.beanDensity);
    getOptional(j, "beanHeatCapacity", c.beanHeatCapacity);
    getOptional(j, "drumRPM", c.drumRPM);
    getOptional(j, "drumDiameterMM", c.drumDiameterMM);
    getOptional(j, "drumLengthMM", c.drumLengthMM);
    getOptional(j, "drumEmissivity", c.drumEmissivity);
    getOptional(j, "beanEmissivity", c.beanEmissivity);

    auto steps = j.find("steps");
    if (steps != j.end())
    {
        if (!steps->is_number_unsigned())
        {
            throw ConfigurationException(
                "Roast steps must be a non-negative integer");
        }
        steps->get_to(c.steps);
    }
}

void from_json(const json& j, conf::ProfilePoint& p)
{
    j.at("seconds").get_to(p.seconds);
    j.at("temp").get_to(p.temp);
}

} // namespace conf

std::pair<conf::RoastConfig, TargetProfile> buildRoastFromJson(const json& data)
{
    conf::RoastConfig roast;

    auto findRoast = data.find("roast");
    if (findRoast != data.end())
    {
        roast = findRoast->get<conf::RoastConfig>();
    }

    auto findProfile = data.find("profile");
    if (findProfile == data.end())
    {
        return std::make_pair(roast, TargetProfile::defaultProfile());
    }

    std::vector<conf::ProfilePoint> points;
    findProfile->get_to(points);

    return std::make_pair(roast, TargetProfile(points));
}

} // namespace roast_control

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "pid/buildjson.hpp"

#include "conf.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace roast_control
{

using json = nlohmann::json;

namespace conf
{

void from_json(const json& j, conf::ControllerInfo& c)
{
    auto name = j.find("name");
    if (name != j.end())
    {
        name->get_to(c.name);
    }

    j.at("proportionalCoeff").get_to(c.pidInfo.proportionalCoeff);
    j.at("integralCoeff").get_to(c.pidInfo.integralCoeff);

    // A PI loop is the common case, so the derivative may be left out.
    auto derivativeCoeff = j.find("derivativeCoeff");
    auto derivativeCoeffValue = 0.0;
    if (derivativeCoeff != j.end())
    {
        derivativeCoeff->get_to(derivativeCoeffValue);
    }
    c.pidInfo.derivativeCoeff = derivativeCoeffValue;
}

} // namespace conf

conf::ControllerInfo buildControllerFromJson(const json& data)
{
    return data.at("pid").get<conf::ControllerInfo>();
}

} // namespace roast_control

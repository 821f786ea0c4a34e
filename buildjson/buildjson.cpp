// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "buildjson/buildjson.hpp"

#include "errors/exception.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

void validateJson(const json& data)
{
    auto pid = data.find("pid");
    if (pid == data.end())
    {
        throw ConfigurationException("KeyError: 'pid' not found");
    }
    if (!pid->is_object())
    {
        throw ConfigurationException("TypeError: 'pid' must be an object");
    }

    auto roast = data.find("roast");
    if (roast != data.end() && !roast->is_object())
    {
        throw ConfigurationException("TypeError: 'roast' must be an object");
    }

    auto profile = data.find("profile");
    if (profile != data.end() && !profile->is_array())
    {
        throw ConfigurationException("TypeError: 'profile' must be an array");
    }
}

json parseValidateJson(const std::string& path)
{
    std::ifstream jsonFile(path);
    if (!jsonFile.is_open())
    {
        throw ConfigurationException("Unable to open json file");
    }

    auto data = json::parse(jsonFile, nullptr, false);
    if (data.is_discarded())
    {
        throw ConfigurationException("Invalid json - parse failed");
    }

    /* Check the data. */
    validateJson(data);

    return data;
}

#pragma once

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

/**
 * Validate the json configuration data.
 *
 * The data must contain a "pid" object.  The "roast" and "profile" keys are
 * optional, but when present must be an object and an array respectively.
 *
 * @param[in] data - the parsed json data.
 * @throw ConfigurationException when the data is invalid.
 */
void validateJson(const json& data);

/**
 * Given a json configuration file, parse and validate it.
 *
 * @param[in] path - the file to read.
 * @return the parsed json data.
 * @throw ConfigurationException when the file cannot be read or is invalid.
 */
json parseValidateJson(const std::string& path);

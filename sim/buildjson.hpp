#pragma once

#include "conf.hpp"
#include "sim/profile.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace roast_control
{

using json = nlohmann::json;

/**
 * Given the json configuration data, read the optional "roast" object and
 * the optional "profile" array.  Missing keys keep their defaults.
 *
 * @param[in] data - the json data
 * @return the roaster configuration, and the target profile
 * @throw ConfigurationException if the profile is invalid.
 */
std::pair<conf::RoastConfig, TargetProfile> buildRoastFromJson(const json& data);

} // namespace roast_control

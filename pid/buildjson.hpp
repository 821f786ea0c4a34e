#pragma once

#include "conf.hpp"

#include <nlohmann/json.hpp>

namespace roast_control
{

using json = nlohmann::json;

/**
 * Given the json configuration data, read the "pid" object.
 *
 * @param[in] data - the json data
 * @return the controller configuration
 */
conf::ControllerInfo buildControllerFromJson(const json& data);

} // namespace roast_control

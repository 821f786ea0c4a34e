#pragma once

#include "sim/roaster.hpp"

#include <string>
#include <vector>

namespace roast_control
{

/**
 * Write the roast trace as CSV, one row per sample, with a header row.
 *
 * @param[in] path - the file to create or truncate.
 * @param[in] samples - the trace.
 * @throw std::runtime_error if the file cannot be written.
 */
void writeTrace(const std::string& path,
                const std::vector<RoastSample>& samples);

} // namespace roast_control

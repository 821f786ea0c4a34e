#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace roast_control
{

/*
 * One row of an operator's power plan: at bean temperature temp, reached
 * around the given minute, set the burner to power percent.
 */
struct PowerStep
{
    double temp;
    double minutes;
    double power;
};

/**
 * Parse a number, the whole string must be consumed.
 *
 * @param[in] text - the text to parse.
 * @param[out] value - the parsed value, untouched on failure.
 * @return true on success.
 */
bool parseNumber(std::string_view text, double& value);

/**
 * Parse "temp,m:ss,power" rows.  Blanks are ignored and ';' is accepted as a
 * separator.  Rows with fewer than three fields, with numbers that do not
 * parse, or with neither a positive temperature nor a positive time are
 * skipped.
 *
 * @param[in] rows - the rows from the configuration.
 * @return the steps, sorted by temperature.
 */
std::vector<PowerStep> parsePowerSchedule(const std::vector<std::string>& rows);

} // namespace roast_control

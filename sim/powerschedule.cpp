// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "powerschedule.hpp"

#include "pid/tuning.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace roast_control
{

bool parseNumber(std::string_view text, double& value)
{
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
    }
    if (text.empty())
    {
        return false;
    }

    double parsed = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if (ec != std::errc() || ptr != end)
    {
        return false;
    }

    value = parsed;
    return true;
}

static std::vector<std::string_view> splitFields(std::string_view text,
                                                 char separator)
{
    std::vector<std::string_view> fields;

    size_t start = 0;
    while (true)
    {
        size_t pos = text.find(separator, start);
        if (pos == std::string_view::npos)
        {
            fields.emplace_back(text.substr(start));
            break;
        }
        fields.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    return fields;
}

static bool parseMinutes(std::string_view text, double& minutes)
{
    auto parts = splitFields(text, ':');

    double value = 0.0;
    if (!parseNumber(parts[0], value))
    {
        return false;
    }
    if (parts.size() > 1)
    {
        double seconds = 0.0;
        if (!parseNumber(parts[1], seconds))
        {
            return false;
        }
        value += seconds / 60.0;
    }

    minutes = value;
    return true;
}

std::vector<PowerStep> parsePowerSchedule(const std::vector<std::string>& rows)
{
    std::vector<PowerStep> steps;

    for (const auto& row : rows)
    {
        std::string clean;
        for (const auto& c : row)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                continue;
            }
            clean += (c == ';') ? ',' : c;
        }

        auto fields = splitFields(clean, ',');
        if (fields.size() < 3)
        {
            if (debugEnabled)
            {
                std::cerr << "Skipping short power schedule row: " << row
                          << "\n";
            }
            continue;
        }

        PowerStep step;
        if (!parseNumber(fields[0], step.temp) ||
            !parseMinutes(fields[1], step.minutes) ||
            !parseNumber(fields[2], step.power))
        {
            std::cerr << "Skipping malformed power schedule row: " << row
                      << "\n";
            continue;
        }

        if (step.temp > 0.0 || step.minutes > 0.0)
        {
            steps.emplace_back(step);
        }
    }

    std::stable_sort(steps.begin(), steps.end(),
                     [](const PowerStep& a, const PowerStep& b) {
                         return a.temp < b.temp;
                     });

    return steps;
}

} // namespace roast_control

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "sim/tracelog.hpp"

#include "csv.hpp"
#include "sim/roaster.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace roast_control
{

void writeTrace(const std::string& path,
                const std::vector<RoastSample>& samples)
{
    std::ofstream file(path);
    if (!file.good())
    {
        throw std::runtime_error("Unable to open trace file: " + path);
    }

    writeCsvHeader(file, {"time_min", "target", "bean_measured", "bean_true",
                          "ror", "power", "drum", "inlet_eq", "weight_pct",
                          "water_pct"});
    for (const auto& s : samples)
    {
        writeCsvRow(file, s.minutes, s.target, s.beanMeasured, s.beanTrue,
                    s.ror, s.power, s.drum, s.inletEq, s.weightPct,
                    s.waterPct);
    }

    file.flush();
    if (!file.good())
    {
        throw std::runtime_error("Unable to write trace file: " + path);
    }
}

} // namespace roast_control

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2026 The roast-pid-control Authors

#include "summary.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace roast_control
{

/* Whole part of any finite value, without a cast to an integer type. */
static std::string wholePart(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(0) << std::trunc(value);
    return out.str();
}

/* "Mm:Ss", seconds truncated. */
static std::string minutesSeconds(double minutes)
{
    double whole = (minutes > 0) ? std::floor(minutes) : 0.0;

    return wholePart(whole) + "m:" + wholePart((minutes - whole) * 60) + "s";
}

std::string formatInfo(const RoastSummary& summary)
{
    std::ostringstream info;
    info << std::fixed << std::setprecision(1);

    double dropWhole = std::floor(summary.dropMinutes);

    info << "t_Turn: " << minutesSeconds(summary.turnMinutes) << ", ";

    if (summary.yellowMinutes > 0)
    {
        info << " t_Yellow: " << minutesSeconds(summary.yellowMinutes);
    }
    else
    {
        info << " t_Yellow: -";
    }
    if (summary.firstCrackMinutes > 0)
    {
        info << ", t_FC: " << minutesSeconds(summary.firstCrackMinutes);
    }
    info << " , t_Drop: " << minutesSeconds(summary.dropMinutes);

    if (std::isfinite(summary.dropTemp))
    {
        info << ", T_Drop: " << wholePart(summary.dropTemp) << "°C";
    }
    else
    {
        info << ", T_Drop: NaN°C";
    }

    info << ", ";
    if (summary.firstCrackMinutes > 0 && summary.yellowMinutes > 0 &&
        dropWhole > 0)
    {
        double brown = summary.firstCrackMinutes - summary.yellowMinutes;
        double dev = dropWhole - summary.firstCrackMinutes;
        info << "Yellow: " << summary.yellowMinutes * 100 / dropWhole
             << "%, Brown: " << brown * 100 / dropWhole
             << "%, Dev: " << dev * 100 / dropWhole << "%";
    }
    else
    {
        info << "-";
    }

    info << ", Power: " << summary.burnerMJ * 948 / 1000 << " kBTU, "
         << summary.burnerMJ * 1e3 / 3600 << " kW";

    return info.str();
}

std::string formatBeanEnergy(double kJ)
{
    if (kJ <= 1000)
    {
        return wholePart(kJ) + " kJ";
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << kJ / 1000 << " MJ";
    return out.str();
}

std::string formatBurnerEnergy(double MJ)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    if (MJ >= 1)
    {
        out << MJ << " MJ";
    }
    else
    {
        out << MJ * 1000 << " kJ";
    }
    return out.str();
}

std::string formatRadiative(double J)
{
    if (!std::isfinite(J))
    {
        return "Radiative: NaN kJ";
    }

    return wholePart(J / 1000) + " kJ";
}

} // namespace roast_control

#pragma once

#include <cstdint>
#include <string>

namespace roast_control
{

/*
 * End-of-roast figures.  Event times are in minutes since charge and are 0
 * when the event did not happen.
 */
struct RoastSummary
{
    double turnMinutes = 0.0;       // measured temperature starts rising
    double yellowMinutes = 0.0;     // end of drying
    double firstCrackMinutes = 0.0; // first crack
    double dropMinutes = 0.0;       // end of roast
    double dropTemp = 0.0;          // measured bean temperature at drop
    int64_t beanCount = 0;
    double surfaceArea = 0.0;
    double beanEnergyKJ = 0.0;      // heat taken up by the beans
    double burnerEnergyMJ = 0.0;    // heat delivered by the burner
    double radiativeJ = 0.0;        // radiative exchange drum to beans
    double froude = 0.0;            // drum Froude number
    double burnerMJ = 0.0;          // burner rating, MJ per hour
};

/**
 * Render the one-line roast report: turning point, yellow, first crack and
 * drop times, drop temperature, phase ratios and burner power.
 */
std::string formatInfo(const RoastSummary& summary);

/** "N kJ" up to 1000 kJ, "X.XXX MJ" above. */
std::string formatBeanEnergy(double kJ);

/** "X.XXX MJ" from 1 MJ up, "X.XXX kJ" below. */
std::string formatBurnerEnergy(double MJ);

/** "N kJ", or "Radiative: NaN kJ" when the value is not finite. */
std::string formatRadiative(double J);

} // namespace roast_control

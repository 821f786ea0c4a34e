#pragma once

#include "pid/ec/pid.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace roast_control
{
namespace conf
{

/*
 * Structure for holding the configuration of a PID.
 */
struct ControllerInfo
{
    std::string name = "beantemp"; // used to name the core log files
    ec::pidinfo pidInfo;           // pid details
};

/*
 * One knot of the target roast curve.
 */
struct ProfilePoint
{
    double seconds; // time since charge
    double temp;    // target bean temperature, degrees C
};

/*
 * Roaster and batch description driving the simulation.  The defaults
 * describe a 300 g batch in a small electric drum roaster.
 */
struct RoastConfig
{
    double batchGrams = 300.0;      // green bean mass
    double moisture = 0.10;         // water fraction, 0..1
    double burnerMJ = 4.0;          // MJ per hour at 100% power
    double inletTemp = 240.0;       // inlet air temperature at start
    double beanStartTemp = 20.0;    // bean temperature at charge
    double firstCrackTemp = 193.0;  // first crack temperature
    double chargeTemp = 215.0;      // drum temperature at charge
    double yellowTemp = 160.0;      // end of drying
    double postCrackFactor = 2.0;   // exothermic mass loss after crack
    double dropMinutes = 12.0;      // roast length
    double airflowFactor = 3.0;     // relative drum/air factor, 0..6
    double responseFactor = 3.0;    // relative probe response
    double initialPower = 90.0;     // reference power, percent
    std::vector<std::string> powerSchedule = {
        "140,4:50,80", "160,6:00,70", "170,6:45,60", "180,7:45,40",
        "190,9:30,20"};
    double beanDiameterMM = 6.0;
    double beanDensity = 1000.0;    // kg/m^3
    double beanHeatCapacity = 1.2;  // kJ/(kg K)
    double drumRPM = 50.0;
    double drumDiameterMM = 150.0;
    double drumLengthMM = 150.0;
    double drumEmissivity = 0.25;
    double beanEmissivity = 0.95;
    uint64_t steps = 500;           // simulation ticks per roast
};

} // namespace conf
} // namespace roast_control

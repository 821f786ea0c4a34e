#pragma once

#include "conf.hpp"
#include "pid/controller.hpp"
#include "powerschedule.hpp"
#include "profile.hpp"
#include "summary.hpp"

#include <cstdint>
#include <vector>

namespace roast_control
{

/*
 * One row of the roast trace.
 */
struct RoastSample
{
    double minutes;      // time since charge
    double target;       // target bean temperature
    double beanMeasured; // probe reading, lags the beans
    double beanTrue;     // bean temperature fed to the controller
    double ror;          // measured rate of rise, degrees per minute
    double power;        // burner power applied, percent
    double drum;         // drum temperature
    double inletEq;      // equilibrium inlet temperature at this power
    double weightPct;    // batch weight relative to charge
    double waterPct;     // water relative to dry coffee
};

struct RoastResult
{
    std::vector<RoastSample> samples;
    RoastSummary summary;
};

/*
 * Thermal model of a small drum roaster.  Every tick the controller is handed
 * the bean temperature and the target from the profile, and its output,
 * limited to the 0..100% burner range, heats the drum and the beans.
 */
class RoastSimulator
{
  public:
    /**
     * @throw ConfigurationException on a zero or huge step count, a non-positive
     * roast length or a zero reference power.
     */
    RoastSimulator(const conf::RoastConfig& config,
                   const TargetProfile& profile);

    /**
     * Roast one batch from charge to drop.  The controller is called once
     * per tick, steps + 1 times in total, with dt in minutes.
     *
     * @param[in] controller - the bean temperature controller.
     * @return the trace, charge state first, and the end-of-roast summary.
     */
    RoastResult run(Controller& controller);

    /** Length of one tick in minutes. */
    double getStepMinutes(void) const
    {
        return _config.dropMinutes / static_cast<double>(_config.steps);
    }

    const std::vector<PowerStep>& getPowerSchedule(void) const
    {
        return _schedule;
    }

  private:
    struct RoastState
    {
        double kg;           // batch mass in kg
        double kgCoffee;     // dry coffee mass
        double water;        // water mass
        double speed;        // effective drum/air factor
        double wfact;        // water loss rate below first crack
        double resp;         // probe and drum response, in ticks
        double tstep;        // minutes per tick
        double minutes;      // time since charge
        double drum;         // drum temperature
        double inletLagged;  // slow-moving inlet temperature
        double mjNow;        // burner energy currently delivered
        double mjTotal;      // sum of mjNow over all ticks
        double beanTrue;     // bean temperature
        double beanMeasured; // probe reading
        double lastMeasured; // probe reading of the previous tick
        double turnMinutes;
        double yellowMinutes;
        double firstCrackMinutes;
        bool pastFirstCrack;
        double radiative;    // accumulated radiative exchange
    };

    void initialize(void);
    RoastSample chargeSample(void) const;
    RoastSample step(Controller& controller, uint64_t index);
    RoastSummary finish(void) const;

    conf::RoastConfig _config;
    std::vector<double> _targets;
    std::vector<PowerStep> _schedule;
    RoastState _state{};
};

} // namespace roast_control

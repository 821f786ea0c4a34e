#pragma once

#include "conf.hpp"

#include <cstdint>
#include <vector>

namespace roast_control
{

/*
 * The target roast curve: temperatures at increasing times since charge,
 * linearly interpolated in between.
 */
class TargetProfile
{
  public:
    /**
     * @param[in] points - knots, strictly increasing in time.
     * @throw ConfigurationException when empty or out of order.
     */
    explicit TargetProfile(const std::vector<conf::ProfilePoint>& points);

    /** The curve used when the configuration does not provide one. */
    static TargetProfile defaultProfile(void);

    /**
     * Target temperature at the given time.  Before the first knot the
     * first temperature is returned, after the last knot the last one.
     */
    double at(double seconds) const;

    /**
     * Evaluate the curve at steps + 1 evenly spaced times from 0 to
     * totalSeconds inclusive.
     */
    std::vector<double> sample(double totalSeconds, uint64_t steps) const;

    const std::vector<conf::ProfilePoint>& getPoints(void) const
    {
        return _points;
    }

  private:
    std::vector<conf::ProfilePoint> _points;
};

} // namespace roast_control

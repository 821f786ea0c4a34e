#include "pid/ec/pid.hpp"
#include "pid/pidcontroller.hpp"

#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace roast_control
{
namespace
{

TEST(PIDControllerTest, StartsWithZeroedAccumulators)
{
    ec::pidinfo initial;
    initial.proportionalCoeff = 1.0;
    initial.integralCoeff = 2.0;
    initial.derivativeCoeff = 3.0;

    PIDController p("beantemp", initial);

    EXPECT_EQ("beantemp", p.getID());
    EXPECT_DOUBLE_EQ(0.0, p.getIntegral());
    EXPECT_DOUBLE_EQ(0.0, p.getPreviousError());

    const auto* info = p.getPIDInfo();
    EXPECT_DOUBLE_EQ(1.0, info->proportionalCoeff);
    EXPECT_DOUBLE_EQ(2.0, info->integralCoeff);
    EXPECT_DOUBLE_EQ(3.0, info->derivativeCoeff);
}

TEST(PIDControllerTest, UpdateMatchesCoreAlgorithm)
{
    // Kp=1, Ki=0, Kd=0 at measurement 50 and target 100.

    ec::pidinfo initial;
    initial.proportionalCoeff = 1.0;

    PIDController p("beantemp", initial);

    EXPECT_DOUBLE_EQ(50.0, p.update(50.0, 100.0, 1.0));
}

TEST(PIDControllerTest, UpdateMutatesBothAccumulators)
{
    ec::pidinfo initial;
    initial.proportionalCoeff = 1.0;

    PIDController p("beantemp", initial);

    p.update(90.0, 100.0, 0.5);

    // Updated even though the integral and derivative gains are zero.
    EXPECT_DOUBLE_EQ(5.0, p.getIntegral());
    EXPECT_DOUBLE_EQ(10.0, p.getPreviousError());

    p.update(104.0, 100.0, 0.5);

    EXPECT_DOUBLE_EQ(3.0, p.getIntegral());
    EXPECT_DOUBLE_EQ(-4.0, p.getPreviousError());
}

TEST(PIDControllerTest, GainsDoNotChangeDuringUpdates)
{
    ec::pidinfo initial;
    initial.proportionalCoeff = 0.4;
    initial.integralCoeff = 0.2;
    initial.derivativeCoeff = 0.1;

    PIDController p("beantemp", initial);

    for (int i = 0; i < 10; ++i)
    {
        p.update(20.0 + i, 200.0, 0.024);
    }

    const auto* info = p.getPIDInfo();
    EXPECT_DOUBLE_EQ(0.4, info->proportionalCoeff);
    EXPECT_DOUBLE_EQ(0.2, info->integralCoeff);
    EXPECT_DOUBLE_EQ(0.1, info->derivativeCoeff);
}

TEST(PIDControllerTest, InstancesDoNotShareState)
{
    ec::pidinfo initial;
    initial.integralCoeff = 1.0;

    PIDController first("first", initial);
    PIDController second("second", initial);

    EXPECT_DOUBLE_EQ(2.0, first.update(8.0, 10.0, 1.0));
    EXPECT_DOUBLE_EQ(4.0, first.update(8.0, 10.0, 1.0));

    // The second controller starts from scratch.
    EXPECT_DOUBLE_EQ(2.0, second.update(8.0, 10.0, 1.0));
    EXPECT_DOUBLE_EQ(4.0, first.getIntegral());
}

TEST(PIDControllerTest, FreshInstanceActsAsReset)
{
    ec::pidinfo initial;
    initial.derivativeCoeff = 1.0;

    auto p = std::make_unique<PIDController>("beantemp", initial);
    EXPECT_DOUBLE_EQ(5.0, p->update(5.0, 10.0, 1.0));
    EXPECT_DOUBLE_EQ(3.0, p->update(2.0, 10.0, 1.0));

    p = std::make_unique<PIDController>("beantemp", initial);
    EXPECT_DOUBLE_EQ(5.0, p->update(5.0, 10.0, 1.0));
}

TEST(PIDControllerTest, UsableThroughControllerInterface)
{
    ec::pidinfo initial;
    initial.proportionalCoeff = 2.0;

    std::unique_ptr<Controller> c =
        std::make_unique<PIDController>("beantemp", initial);

    EXPECT_DOUBLE_EQ(20.0, c->update(90.0, 100.0, 1.0));
    EXPECT_EQ("beantemp", c->getID());
}

} // namespace
} // namespace roast_control

#include "pid/ec/logging.hpp"
#include "pid/ec/pid.hpp"
#include "pid/pidcontroller.hpp"
#include "pid/tuning.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace roast_control
{
namespace
{

TEST(PidLoggingTest, StrCleanKeepsAlphanumerics)
{
    EXPECT_EQ("beantemp1", ec::StrClean("bean temp-1"));
    EXPECT_EQ("BT", ec::StrClean("B/T"));
    EXPECT_EQ("", ec::StrClean(" _.-"));
}

static size_t countLines(const std::filesystem::path& path)
{
    std::ifstream file(path);
    std::string line;
    size_t count = 0;
    while (std::getline(file, line))
    {
        ++count;
    }
    return count;
}

class CoreLoggingTest : public ::testing::Test
{
  protected:
    CoreLoggingTest()
    {
        dir = std::filesystem::temp_directory_path() /
              ("roastpid_logging_" +
               std::string(::testing::UnitTest::GetInstance()
                               ->current_test_info()
                               ->name()));
        std::filesystem::create_directories(dir);
        loggingPath = dir.string();
    }

    ~CoreLoggingTest() override
    {
        ec::LogClear();
        coreLoggingEnabled = false;
        loggingPath.clear();
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
};

TEST_F(CoreLoggingTest, WritesContextAndCoeffFiles)
{
    coreLoggingEnabled = true;

    ec::pidinfo gains;
    gains.proportionalCoeff = 2.0;
    gains.integralCoeff = 0.5;
    PIDController controller("bean temp", gains);

    controller.update(20.0, 100.0, 0.024);
    controller.update(25.0, 100.0, 0.024);
    controller.update(30.0, 100.0, 0.024);

    ASSERT_NE(nullptr, ec::LogPeek(controller.getPIDInfo()));
    ec::LogClear();

    EXPECT_TRUE(std::filesystem::exists(dir / "pidcore.beantemp"));
    EXPECT_TRUE(std::filesystem::exists(dir / "pidcoeffs.beantemp"));

    // header plus one row per distinct step
    EXPECT_EQ(4u, countLines(dir / "pidcore.beantemp"));
    // header plus the gains written once
    EXPECT_EQ(2u, countLines(dir / "pidcoeffs.beantemp"));
}

TEST_F(CoreLoggingTest, RepeatedContextIsThrottled)
{
    coreLoggingEnabled = true;

    ec::pid_info_t info;
    info.proportionalCoeff = 1.0;
    const std::string name = "steady";

    // Zero error and zero dt keep the context identical
    ec::pid(&info, 50.0, 50.0, 0.0, &name);
    ec::pid(&info, 50.0, 50.0, 0.0, &name);
    ec::pid(&info, 50.0, 50.0, 0.0, &name);

    ec::LogClear();

    EXPECT_EQ(2u, countLines(dir / "pidcore.steady"));
}

TEST_F(CoreLoggingTest, DisabledLoggingWritesNothing)
{
    ec::pidinfo gains;
    gains.proportionalCoeff = 1.0;
    PIDController controller("quiet", gains);

    controller.update(20.0, 100.0, 0.024);

    EXPECT_EQ(nullptr, ec::LogPeek(controller.getPIDInfo()));
    EXPECT_FALSE(std::filesystem::exists(dir / "pidcore.quiet"));
}

TEST_F(CoreLoggingTest, UnusableNameIsNotLogged)
{
    coreLoggingEnabled = true;

    ec::pid_info_t info;
    const std::string name = "--";

    ec::pid(&info, 20.0, 100.0, 1.0, &name);

    EXPECT_EQ(nullptr, ec::LogPeek(&info));
}

TEST_F(CoreLoggingTest, DestroyedControllerClosesItsLog)
{
    coreLoggingEnabled = true;

    ec::pidinfo gains;
    gains.proportionalCoeff = 1.0;

    const ec::pid_info_t* state = nullptr;
    {
        PIDController controller("shortlived", gains);
        controller.update(20.0, 100.0, 0.024);
        state = controller.getPIDInfo();
        EXPECT_NE(nullptr, ec::LogPeek(state));
    }

    EXPECT_EQ(nullptr, ec::LogPeek(state));
    EXPECT_EQ(2u, countLines(dir / "pidcore.shortlived"));
    EXPECT_EQ(2u, countLines(dir / "pidcoeffs.shortlived"));
}

TEST_F(CoreLoggingTest, ThrottleExpiresAfterOneMinute)
{
    ec::PidCoreLog log(dir.string(), "direct");
    ASSERT_TRUE(log.isOpen());

    ec::PidCoreContext context{};
    context.input = 42.0;

    log.writeContext(std::chrono::milliseconds(1000), context);
    log.writeContext(std::chrono::milliseconds(30000), context);
    log.writeContext(std::chrono::milliseconds(61000), context);

    context.output = 1.0;
    log.writeContext(std::chrono::milliseconds(61001), context);

    EXPECT_EQ(4u, countLines(dir / "pidcore.direct"));
}

TEST_F(CoreLoggingTest, MissingDirectoryDisablesLogging)
{
    coreLoggingEnabled = true;
    loggingPath = (dir / "absent").string();

    ec::pid_info_t info;
    const std::string name = "nowhere";

    EXPECT_DOUBLE_EQ(0.0, ec::pid(&info, 20.0, 100.0, 1.0, &name));
    EXPECT_EQ(nullptr, ec::LogPeek(&info));
}

} // namespace
} // namespace roast_control

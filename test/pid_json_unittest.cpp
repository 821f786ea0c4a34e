#include "pid/buildjson.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace roast_control
{
namespace
{

TEST(ControllerFromJson, allCoefficients)
{
    auto j2 = R"(
      {
        "pid": {
          "name": "drum-bean",
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5,
          "derivativeCoeff": 0.1
        }
      }
    )"_json;

    auto info = buildControllerFromJson(j2);

    EXPECT_EQ("drum-bean", info.name);
    EXPECT_DOUBLE_EQ(2.0, info.pidInfo.proportionalCoeff);
    EXPECT_DOUBLE_EQ(0.5, info.pidInfo.integralCoeff);
    EXPECT_DOUBLE_EQ(0.1, info.pidInfo.derivativeCoeff);
}

TEST(ControllerFromJson, derivativeAndNameAreOptional)
{
    // Intentionally omits "derivativeCoeff" and "name" to test that they
    // are optional.

    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5
        }
      }
    )"_json;

    auto info = buildControllerFromJson(j2);

    EXPECT_EQ("beantemp", info.name);
    EXPECT_DOUBLE_EQ(2.0, info.pidInfo.proportionalCoeff);
    EXPECT_DOUBLE_EQ(0.5, info.pidInfo.integralCoeff);
    EXPECT_DOUBLE_EQ(0.0, info.pidInfo.derivativeCoeff);
}

TEST(ControllerFromJson, missingProportionalThrows)
{
    auto j2 = R"(
      {
        "pid": {
          "integralCoeff": 0.5
        }
      }
    )"_json;

    EXPECT_THROW(buildControllerFromJson(j2), nlohmann::json::exception);
}

TEST(ControllerFromJson, missingIntegralThrows)
{
    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": 2.0
        }
      }
    )"_json;

    EXPECT_THROW(buildControllerFromJson(j2), nlohmann::json::exception);
}

TEST(ControllerFromJson, wrongTypeThrows)
{
    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": "fast",
          "integralCoeff": 0.5
        }
      }
    )"_json;

    EXPECT_THROW(buildControllerFromJson(j2), nlohmann::json::exception);
}

} // namespace
} // namespace roast_control

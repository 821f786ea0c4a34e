#include "buildjson/buildjson.hpp"
#include "errors/exception.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

TEST(ConfigurationVerificationTest, VerifyHappy)
{
    auto j2 = R"(
      {
        "pid": {
          "name": "beantemp",
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5,
          "derivativeCoeff": 0.1
        },
        "roast": {
          "batchGrams": 300,
          "dropMinutes": 12.0
        },
        "profile": [
          {"seconds": 0, "temp": 20},
          {"seconds": 1200, "temp": 227}
        ]
      }
    )"_json;

    validateJson(j2);
}

TEST(ConfigurationVerificationTest, VerifyOnlyPid)
{
    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5
        }
      }
    )"_json;

    validateJson(j2);
}

TEST(ConfigurationVerificationTest, VerifyNoPidKey)
{
    auto j2 = R"(
      {
        "roast": {
          "batchGrams": 300
        }
      }
    )"_json;

    EXPECT_THROW(validateJson(j2), ConfigurationException);
}

TEST(ConfigurationVerificationTest, VerifyPidNotObject)
{
    auto j2 = R"(
      {
        "pid": [2.0, 0.5, 0.1]
      }
    )"_json;

    EXPECT_THROW(validateJson(j2), ConfigurationException);
}

TEST(ConfigurationVerificationTest, VerifyRoastNotObject)
{
    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5
        },
        "roast": 300
      }
    )"_json;

    EXPECT_THROW(validateJson(j2), ConfigurationException);
}

TEST(ConfigurationVerificationTest, VerifyProfileNotArray)
{
    auto j2 = R"(
      {
        "pid": {
          "proportionalCoeff": 2.0,
          "integralCoeff": 0.5
        },
        "profile": {"seconds": 0, "temp": 20}
      }
    )"_json;

    EXPECT_THROW(validateJson(j2), ConfigurationException);
}

class ConfigurationFileTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        path = std::filesystem::temp_directory_path() /
               ("roastpid_json_parse_" +
                std::string(::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()) +
                ".json");
    }

    void TearDown() override
    {
        std::filesystem::remove(path);
    }

    void writeFile(const std::string& contents)
    {
        std::ofstream out(path);
        out << contents;
    }

    std::filesystem::path path;
};

TEST_F(ConfigurationFileTest, ParsesValidFile)
{
    writeFile(R"({"pid": {"proportionalCoeff": 1.0, "integralCoeff": 0.0}})");

    auto data = parseValidateJson(path.string());

    EXPECT_DOUBLE_EQ(1.0, data["pid"]["proportionalCoeff"].get<double>());
}

TEST_F(ConfigurationFileTest, MissingFileThrows)
{
    EXPECT_THROW(parseValidateJson(path.string()), ConfigurationException);
}

TEST_F(ConfigurationFileTest, MalformedFileThrows)
{
    writeFile(R"({"pid": {"proportionalCoeff": 1.0,)");

    EXPECT_THROW(parseValidateJson(path.string()), ConfigurationException);
}

TEST_F(ConfigurationFileTest, FileWithoutPidThrows)
{
    writeFile(R"({"roast": {}})");

    EXPECT_THROW(parseValidateJson(path.string()), ConfigurationException);
}

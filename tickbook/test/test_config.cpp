#include "../src/engineconfig.hpp"
#include "../src/jsonutils.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using namespace tickbook;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        // Create temporary test file
        std::ofstream out("test_engine_config.json");
        out << R"({
            "symbol": "TEST",
            "price_scale": 10000,
            "self_match_policy": "cancel_resting",
            "verify_invariants": true,
            "log_level": "warn",
            "display_depth": 3
        })";
        out.close();
    }

    void TearDown() override { std::remove("test_engine_config.json"); }
};

TEST_F(EngineConfigTest, LoadFromFile)
{
    auto config = EngineConfig::loadFromFile("test_engine_config.json");

    EXPECT_EQ("TEST", config.symbol);
    EXPECT_EQ(10000, config.priceScale);
    EXPECT_EQ(SelfMatchPolicy::CancelResting, config.selfMatchPolicy);
    EXPECT_TRUE(config.verifyInvariants);
    EXPECT_EQ(LogLevel::Warn, config.logLevel);
    EXPECT_EQ(3u, config.displayDepth);
}

TEST_F(EngineConfigTest, MissingFileThrows)
{
    EXPECT_THROW(EngineConfig::loadFromFile("no_such_config.json"), std::runtime_error);
}

TEST(EngineConfigParseTest, MissingKeysKeepDefaults)
{
    auto config = EngineConfig::parse(R"({"symbol": "XYZ"})");

    EXPECT_EQ("XYZ", config.symbol);
    EXPECT_EQ(1, config.priceScale);
    EXPECT_EQ(SelfMatchPolicy::Allow, config.selfMatchPolicy);
    EXPECT_FALSE(config.verifyInvariants);
    EXPECT_EQ(LogLevel::Info, config.logLevel);
    EXPECT_EQ(5u, config.displayDepth);
}

TEST(EngineConfigParseTest, RejectsBadValues)
{
    EXPECT_THROW(EngineConfig::parse(R"({"self_match_policy": "sometimes"})"), std::runtime_error);
    EXPECT_THROW(EngineConfig::parse(R"({"log_level": "loud"})"), std::runtime_error);
    EXPECT_THROW(EngineConfig::parse(R"({"price_scale": 0})"), std::runtime_error);
    EXPECT_THROW(EngineConfig::parse(R"({"price_scale": 0.01})"), std::runtime_error);
    EXPECT_THROW(EngineConfig::parse(R"({"price_scale": 50})"), std::runtime_error);
    EXPECT_THROW(EngineConfig::parse(R"({"display_depth": -2})"), std::runtime_error);
}

TEST(EngineConfigParseTest, PolicyNames)
{
    EXPECT_EQ(SelfMatchPolicy::CancelTaker, parseSelfMatchPolicy("cancel_taker").value());
    EXPECT_FALSE(parseSelfMatchPolicy("Allow").has_value());
    EXPECT_STREQ("cancel_resting", toString(SelfMatchPolicy::CancelResting));

    EXPECT_EQ(LogLevel::Off, parseLogLevel("off").value());
    EXPECT_FALSE(parseLogLevel("trace").has_value());
}

TEST(EngineConfigParseTest, PriceScaleIsPowerOfTen)
{
    EXPECT_TRUE(isPowerOfTen(1));
    EXPECT_TRUE(isPowerOfTen(1000));
    EXPECT_FALSE(isPowerOfTen(0));
    EXPECT_FALSE(isPowerOfTen(-10));
    EXPECT_FALSE(isPowerOfTen(50));
    EXPECT_FALSE(isPowerOfTen(110));

    EXPECT_EQ(100, EngineConfig::parse(R"({"price_scale": 100})").priceScale);
}

TEST(JsonUtilsTest, ExtractValues)
{
    const std::string json = R"({"name": "book", "offset": -42, "enabled": false, "ratio": 1.5})";

    EXPECT_EQ("book", json::extractString(json, "name").value());
    EXPECT_EQ(-42, json::extractInt(json, "offset").value());
    EXPECT_FALSE(json::extractBool(json, "enabled").value());

    // Absent or wrongly typed keys
    EXPECT_FALSE(json::extractString(json, "missing").has_value());
    EXPECT_FALSE(json::extractString(json, "offset").has_value());
    EXPECT_FALSE(json::extractBool(json, "name").has_value());
    EXPECT_THROW((void)json::extractInt(json, "ratio"), std::runtime_error);
}

TEST(LoggerTest, FiltersBelowLevel)
{
    std::ostringstream out;
    Logger log(LogLevel::Warn, out);

    log.info("hidden");
    log.warn("shown");
    log.error("also shown");

    EXPECT_EQ("[tickbook] WARN shown\n[tickbook] ERROR also shown\n", out.str());

    log.setLevel(LogLevel::Off);
    log.error("silenced");
    EXPECT_EQ(std::string::npos, out.str().find("silenced"));
}

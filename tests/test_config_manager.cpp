/**
 * @file test_config_manager.cpp
 * @brief Unit tests for ConfigManager typed lookups
 *
 * Keys are unique per test; the singleton outlives individual tests.
 */

#include <gtest/gtest.h>
#include <fizzbuzz/common/config_manager.h>

#include <cstdlib>
#include <string>

using fizzbuzz::common::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& config_ = ConfigManager::getInstance();
};

TEST_F(ConfigManagerTest, Singleton_SameInstance) {
    EXPECT_EQ(&ConfigManager::getInstance(), &config_);
}

TEST_F(ConfigManagerTest, GetString_DefaultWhenMissing) {
    EXPECT_EQ(config_.getString("FIZZBUZZ_TEST_MISSING_STRING", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, SetThenGetString) {
    config_.set("FIZZBUZZ_TEST_STRING", "value");
    EXPECT_EQ(config_.getString("FIZZBUZZ_TEST_STRING"), "value");
}

TEST_F(ConfigManagerTest, GetString_FallsBackToEnvironment) {
    ASSERT_EQ(setenv("FIZZBUZZ_TEST_ENV_ONLY", "from-env", 1), 0);
    EXPECT_EQ(config_.getString("FIZZBUZZ_TEST_ENV_ONLY"), "from-env");
    unsetenv("FIZZBUZZ_TEST_ENV_ONLY");
}

TEST_F(ConfigManagerTest, GetBool_MissingUsesDefault) {
    EXPECT_TRUE(config_.getBool("FIZZBUZZ_TEST_BOOL_MISSING", true));
    EXPECT_FALSE(config_.getBool("FIZZBUZZ_TEST_BOOL_MISSING", false));
}

TEST_F(ConfigManagerTest, GetBool_AcceptedSpellings) {
    for (const char* truthy : {"true", "TRUE", "1", "yes", "On"}) {
        config_.set("FIZZBUZZ_TEST_BOOL", truthy);
        EXPECT_TRUE(config_.getBool("FIZZBUZZ_TEST_BOOL", false)) << truthy;
    }
    for (const char* falsy : {"false", "0", "No", "off"}) {
        config_.set("FIZZBUZZ_TEST_BOOL", falsy);
        EXPECT_FALSE(config_.getBool("FIZZBUZZ_TEST_BOOL", true)) << falsy;
    }
}

TEST_F(ConfigManagerTest, GetBool_InvalidUsesDefault) {
    config_.set("FIZZBUZZ_TEST_BOOL_BAD", "maybe");
    EXPECT_TRUE(config_.getBool("FIZZBUZZ_TEST_BOOL_BAD", true));
    EXPECT_FALSE(config_.getBool("FIZZBUZZ_TEST_BOOL_BAD", false));
}

TEST_F(ConfigManagerTest, LoadFromEnvironment_PicksUpLogLevel) {
    const char* env = std::getenv(ConfigManager::LOG_LEVEL);
    const std::string previous = env ? env : "";
    ASSERT_EQ(setenv(ConfigManager::LOG_LEVEL, "debug", 1), 0);

    config_.loadFromEnvironment();
    EXPECT_EQ(config_.getString(ConfigManager::LOG_LEVEL), "debug");

    // Restore
    config_.set(ConfigManager::LOG_LEVEL,
                previous.empty() ? ConfigManager::DEFAULT_LOG_LEVEL : previous);
    if (previous.empty()) {
        unsetenv(ConfigManager::LOG_LEVEL);
    } else {
        setenv(ConfigManager::LOG_LEVEL, previous.c_str(), 1);
    }
}

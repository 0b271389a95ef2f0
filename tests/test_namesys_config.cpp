#include <gtest/gtest.h>
#include "namesys_config.hpp"
#include "errors.hpp"
#include <cstdlib>

using namespace namesys;

class NameSysConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("NAMESYS_REDIS_URL");
        unsetenv("NAMESYS_PRIVATE_KEY");
        unsetenv("NAMESYS_RESOLVE_TIMEOUT_MS");
        unsetenv("NAMESYS_CACHE_TRUST_SEC");
        unsetenv("NAMESYS_RECORD_LIFETIME_SEC");
        unsetenv("NAMESYS_REPUBLISH_INTERVAL_SEC");
    }
};

TEST_F(NameSysConfigTest, DefaultValues) {
    NameSysConfig config;
    EXPECT_EQ(config.self_key_name, "self");
    EXPECT_EQ(config.default_resolve_timeout_ms, 0);
    EXPECT_EQ(config.record_lifetime_sec, 24 * 60 * 60);
    EXPECT_EQ(config.record_ttl_sec, 60);
    EXPECT_EQ(config.subscriber_retry_attempts, 5);
    EXPECT_EQ(config.subscriber_retry_interval_ms, 2000);
    EXPECT_TRUE(config.private_key_hex.empty());
}

TEST_F(NameSysConfigTest, EnvironmentOverrides) {
    setenv("NAMESYS_REDIS_URL", "tcp://redis:6380", 1);
    setenv("NAMESYS_RESOLVE_TIMEOUT_MS", "2500", 1);
    setenv("NAMESYS_CACHE_TRUST_SEC", "0", 1);
    setenv("NAMESYS_RECORD_LIFETIME_SEC", "7200", 1);
    setenv("NAMESYS_REPUBLISH_INTERVAL_SEC", "600", 1);

    NameSysConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.redis_url, "tcp://redis:6380");
    EXPECT_EQ(config.default_resolve_timeout_ms, 2500);
    EXPECT_EQ(config.cache_trust_sec, 0);
    EXPECT_EQ(config.record_lifetime_sec, 7200);
    EXPECT_EQ(config.republish_interval_sec, 600);
}

TEST_F(NameSysConfigTest, InvalidNumbersRejected) {
    NameSysConfig config;
    setenv("NAMESYS_RESOLVE_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);

    setenv("NAMESYS_RESOLVE_TIMEOUT_MS", "-5", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);

    setenv("NAMESYS_RESOLVE_TIMEOUT_MS", "10ms", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

TEST_F(NameSysConfigTest, OutOfRangeNumbersRejected) {
    NameSysConfig config;
    setenv("NAMESYS_RESOLVE_TIMEOUT_MS", "5000000000", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    EXPECT_EQ(config.default_resolve_timeout_ms, 0);
    unsetenv("NAMESYS_RESOLVE_TIMEOUT_MS");

    setenv("NAMESYS_REPUBLISH_INTERVAL_SEC", "2147483648", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    setenv("NAMESYS_REPUBLISH_INTERVAL_SEC", "2147483647", 1);
    EXPECT_NO_THROW(apply_env_overrides(config));
    EXPECT_EQ(config.republish_interval_sec, 2147483647);

    setenv("NAMESYS_RECORD_LIFETIME_SEC", "99999999999999", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

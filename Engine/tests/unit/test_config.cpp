/**
 * @file test_config.cpp
 * @brief Configuration defaults, environment overrides and validation
 */

#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>

using namespace Reef;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(ConfigTest, Defaults) {
    ReefConfig c;
    EXPECT_DOUBLE_EQ(c.lifecycle.review_threshold, 0.5);
    EXPECT_DOUBLE_EQ(c.lifecycle.approval_threshold, 0.6);
    EXPECT_EQ(c.lifecycle.max_review_cycles, 3u);
    EXPECT_EQ(c.lifecycle.min_attestations, 1u);
    EXPECT_EQ(c.search.rank_mode, RankMode::Similarity);
    EXPECT_DOUBLE_EQ(c.default_reputation, 0.5);
    EXPECT_EQ(c.blocks_per_epoch, 360u);
    EXPECT_NO_THROW(c.validate());
}

TEST(ConfigTest, EnvironmentOverrides) {
    ScopedEnv a("REEF_APPROVAL_THRESHOLD", "0.75");
    ScopedEnv b("REEF_MAX_REVIEW_CYCLES", "5");
    ScopedEnv c("REEF_RANK_MODE", "trust");
    ScopedEnv d("REEF_SCORE_WEIGHTS", "0.4,0.2,0.2,0.1,0.1");
    ScopedEnv e("REEF_LOG_LEVEL", "debug");

    ReefConfig cfg = ReefConfig::from_env();
    EXPECT_DOUBLE_EQ(cfg.lifecycle.approval_threshold, 0.75);
    EXPECT_EQ(cfg.lifecycle.max_review_cycles, 5u);
    EXPECT_EQ(cfg.search.rank_mode, RankMode::TrustWeighted);
    EXPECT_DOUBLE_EQ(cfg.weights.zk_validity, 0.4);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ConfigTest, UnparsableValueNamesVariable) {
    ScopedEnv a("REEF_OVERFETCH", "lots");
    try {
        ReefConfig::from_env();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("REEF_OVERFETCH"), std::string::npos);
    }
}

TEST(ConfigTest, NegativeCountRejected) {
    ScopedEnv a("REEF_SWEEP_WORKERS", "-2");
    EXPECT_THROW(ReefConfig::from_env(), ConfigError);
}

TEST(ConfigTest, ValidateRanges) {
    ReefConfig c;
    c.lifecycle.approval_threshold = 1.5;
    EXPECT_THROW(c.validate(), ConfigError);

    c = ReefConfig{};
    c.lifecycle.max_review_cycles = 0;
    EXPECT_THROW(c.validate(), ConfigError);

    c = ReefConfig{};
    c.db_connections = 0;
    EXPECT_THROW(c.validate(), ConfigError);

    c = ReefConfig{};
    c.index.M = 1;
    EXPECT_THROW(c.validate(), ConfigError);

    c = ReefConfig{};
    c.log_level = "loud";
    EXPECT_THROW(c.validate(), ConfigError);
}

TEST(ConfigTest, RankModeNames) {
    EXPECT_EQ(parse_rank_mode(rank_mode_name(RankMode::Similarity)), RankMode::Similarity);
    EXPECT_EQ(parse_rank_mode(rank_mode_name(RankMode::TrustWeighted)), RankMode::TrustWeighted);
    EXPECT_THROW(parse_rank_mode("random"), ConfigError);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::Debug);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::Error);
    EXPECT_EQ(Logger::parse_level("info"), Logger::Level::Info);
}

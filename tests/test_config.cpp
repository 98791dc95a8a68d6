/*
 * vidflow - Staged Video Generation Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "vidflow/config.hpp"
#include "vidflow/logger.hpp"

namespace vidflow {
namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
            hadPrevious_ = true;
        }
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (hadPrevious_) {
            setenv(name_.c_str(), previous_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string previous_;
    bool hadPrevious_ = false;
};

TEST(ConfigTest, DefaultsPlaceDirectoriesUnderWorkspace) {
    Config config = Config::defaults("/srv/vidflow");
    EXPECT_EQ(config.outputDir.string(), "/srv/vidflow/outputs");
    EXPECT_EQ(config.bucketDir.string(), "/srv/vidflow/bucket");
    EXPECT_EQ(config.bucket, "videos");
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.budgets.total(), 100);
    EXPECT_EQ(config.generatePool.maxReplicas, 1);
    EXPECT_EQ(config.interpolatePool.maxReplicas, 5);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ScopedEnv workers("VIDFLOW_WORKERS", "2");
    ScopedEnv bucket("VIDFLOW_BUCKET", "clips");
    ScopedEnv scan("VIDFLOW_SCAN_INTERVAL_MS", "250");
    ScopedEnv models("VIDFLOW_BASE_MODELS", "sd15,sdxl");
    ScopedEnv scales("VIDFLOW_SUPPORTED_SCALES", "2,4");
    ScopedEnv upscaleMax("VIDFLOW_UPSCALE_MAX_REPLICAS", "6");
    ScopedEnv upscaleDelay("VIDFLOW_UPSCALE_DOWNSCALE_DELAY_S", "30");

    Config config = Config::fromEnv("/tmp/ws");
    EXPECT_EQ(config.workers, 2);
    EXPECT_EQ(config.bucket, "clips");
    EXPECT_EQ(config.scanInterval.count(), 250);
    EXPECT_EQ(config.generator.baseModels, (std::vector<std::string>{"sd15", "sdxl"}));
    EXPECT_EQ(config.upscale.supportedScales, (std::vector<int>{2, 4}));
    EXPECT_EQ(config.upscalePool.maxReplicas, 6);
    EXPECT_EQ(config.upscalePool.downscaleDelay.count(), 30);
    EXPECT_EQ(config.upscalePool.minReplicas, 1);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, MalformedNumbersKeepDefaults) {
    ScopedEnv workers("VIDFLOW_WORKERS", "many");
    ScopedEnv scales("VIDFLOW_SUPPORTED_SCALES", "2,x");
    Config config = Config::fromEnv("/tmp/ws");
    EXPECT_EQ(config.workers, 4);
    EXPECT_EQ(config.upscale.supportedScales, (std::vector<int>{2, 4, 8}));
}

TEST(ConfigTest, ValidateRejectsBadBudgets) {
    Config config = Config::defaults("/tmp/ws");
    config.budgets.generation = 60;
    auto error = config.validate();
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("sum to 100"), std::string::npos);
}

TEST(ConfigTest, ValidateRejectsBadPools) {
    Config config = Config::defaults("/tmp/ws");
    config.interpolatePool.minReplicas = 4;
    config.interpolatePool.maxReplicas = 2;
    auto error = config.validate();
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("interpolate"), std::string::npos);
}

TEST(ConfigTest, ValidateRejectsBadBucketAndScales) {
    Config config = Config::defaults("/tmp/ws");
    config.bucket = "a/b";
    EXPECT_TRUE(config.validate().has_value());

    config = Config::defaults("/tmp/ws");
    config.upscale.supportedScales = {1, 2};
    EXPECT_TRUE(config.validate().has_value());

    config = Config::defaults("/tmp/ws");
    config.workers = 0;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("loud").has_value());
}

TEST(LoggerTest, LevelGatesMessages) {
    LogLevel previous = Logger::level();
    Logger::setLevel(LogLevel::WARN);
    EXPECT_TRUE(Logger::enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::enabled(LogLevel::INFO));
    Logger::setLevel(previous);
}

}
}

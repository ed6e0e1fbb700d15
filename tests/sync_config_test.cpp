// SPDX-License-Identifier: MIT

// tests/sync_config_test.cpp
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "src/sync_config.hpp"

using namespace stream_sync;
using namespace std::chrono_literals;

TEST(SyncConfigTest, Defaults) {
    SyncConfig config;
    EXPECT_GE(config.max_workers, 1u);
    EXPECT_EQ(config.max_concurrent_partition_generators, 1u);
    EXPECT_EQ(config.queue_timeout, 900s);
    EXPECT_EQ(config.queue_capacity, 0u);
    EXPECT_TRUE(config.raise_exception_on_missing_stream);
    EXPECT_FALSE(config.log_slices);
    EXPECT_TRUE(ValidateSyncConfig(config).has_value());
}

TEST(SyncConfigTest, ValidateRejectsZeroCaps) {
    SyncConfig no_workers{.max_workers = 0};
    auto r1 = ValidateSyncConfig(no_workers);
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidConfig);

    SyncConfig no_generators{.max_concurrent_partition_generators = 0};
    EXPECT_FALSE(ValidateSyncConfig(no_generators).has_value());

    SyncConfig no_timeout{.queue_timeout = 0ms};
    EXPECT_FALSE(ValidateSyncConfig(no_timeout).has_value());
}

TEST(SyncConfigTest, ParseReadsEveryKey) {
    auto config = ParseSyncConfig(R"({
        "max_workers": 4,
        "max_concurrent_partition_generators": 2,
        "timeout_seconds": 1.5,
        "queue_capacity": 100,
        "raise_exception_on_missing_stream": false,
        "log_slices": true,
        "unrelated": "ignored"
    })");
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->max_workers, 4u);
    EXPECT_EQ(config->max_concurrent_partition_generators, 2u);
    EXPECT_EQ(config->queue_timeout, 1500ms);
    EXPECT_EQ(config->queue_capacity, 100u);
    EXPECT_FALSE(config->raise_exception_on_missing_stream);
    EXPECT_TRUE(config->log_slices);
}

TEST(SyncConfigTest, ParseEmptyObjectKeepsDefaults) {
    auto config = ParseSyncConfig("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->max_concurrent_partition_generators, 1u);
    EXPECT_EQ(config->queue_timeout, 900s);
}

TEST(SyncConfigTest, ParseRejectsMalformedJson) {
    auto config = ParseSyncConfig("{\"max_workers\": ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ParseError);
}

TEST(SyncConfigTest, ParseRejectsWrongTypes) {
    auto config = ParseSyncConfig(R"({"max_workers": "four"})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    EXPECT_NE(config.error().message.find("max_workers"), std::string::npos);

    EXPECT_FALSE(ParseSyncConfig(R"({"log_slices": 1})").has_value());
    EXPECT_FALSE(ParseSyncConfig("[]").has_value());
}

TEST(SyncConfigTest, ParseRejectsOutOfRangeTimeout) {
    for (const char* json : {R"({"timeout_seconds": 1e300})",
                             R"({"timeout_seconds": -5})",
                             R"({"timeout_seconds": 0})"}) {
        auto config = ParseSyncConfig(json);
        ASSERT_FALSE(config.has_value()) << json;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig) << json;
        EXPECT_NE(config.error().message.find("timeout_seconds"), std::string::npos) << json;
    }

    auto largest = ParseSyncConfig(R"({"timeout_seconds": 1e9})");
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->queue_timeout, std::chrono::milliseconds(1'000'000'000'000LL));
}

TEST(SyncConfigTest, ParseValidatesResult) {
    auto config = ParseSyncConfig(R"({"max_workers": 0})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(SyncConfigTest, ReadTextFile) {
    std::string path = ::testing::TempDir() + "sync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"max_workers": 2})";
    }
    auto text = ReadTextFile(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, R"({"max_workers": 2})");
    std::remove(path.c_str());

    auto missing = ReadTextFile(path);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::IoError);
}

#include <gtest/gtest.h>
#include <augur/pipeline/pipeline_config.hpp>
#include <augur/utils/config.hpp>
#include <augur/utils/logger.hpp>
#include <augur/utils/time_utils.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace augur::utils;

TEST(ConfigTest, ParsesKeyValueText) {
    Config config;
    config.load_from_string(
        "# comment line\n"
        "database_path = /tmp/augur.db\n"
        "\n"
        "worker_count=8\n"
        "holdout_fraction = 0.25\n"
        "verbose = yes\n"
        "symbols = CBA.AX, WBC.AX ,, ANZ.AX\n");

    EXPECT_EQ(config.get("database_path", "augur.db"), "/tmp/augur.db");
    EXPECT_EQ(config.get<int>("worker_count", 1), 8);
    EXPECT_DOUBLE_EQ(config.get<double>("holdout_fraction", 0.2), 0.25);
    EXPECT_TRUE(config.get_bool("verbose", false));
    EXPECT_EQ(config.get<int>("missing", 42), 42);

    auto symbols = config.get_list("symbols");
    ASSERT_EQ(symbols.size(), 3u);
    EXPECT_EQ(symbols[0], "CBA.AX");
    EXPECT_EQ(symbols[1], "WBC.AX");
    EXPECT_EQ(symbols[2], "ANZ.AX");
}

TEST(ConfigTest, MalformedNumberFallsBack) {
    Config config;
    config.load_from_string("worker_count = many\n");
    EXPECT_EQ(config.get<int>("worker_count", 4), 4);
    EXPECT_FALSE(config.load_from_file("/nonexistent/augur.conf"));
}

TEST(ConfigTest, PipelineConfigFromKeys) {
    Config config;
    config.load_from_string(
        "symbols = CBA.AX, NAB.AX\n"
        "market_utc_offset_minutes = 0\n"
        "min_training_samples = 80\n"
        "promotion_min_accuracy = 0.7\n"
        "strong_confidence = 0.9\n"
        "signal_timeout_ms = 250\n");
    auto pipeline = augur::pipeline::PipelineConfig::from_config(config);

    EXPECT_EQ(pipeline.symbols.size(), 2u);
    EXPECT_EQ(pipeline.features.market_utc_offset_minutes, 0);
    EXPECT_EQ(pipeline.predictor.min_training_samples, 80u);
    EXPECT_DOUBLE_EQ(pipeline.tracker.min_direction_accuracy, 0.7);
    EXPECT_DOUBLE_EQ(pipeline.predictor.thresholds.strong_confidence, 0.9);
    EXPECT_EQ(pipeline.signal_timeout.count(), 250);
    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(pipeline.tracker.max_magnitude_mae, 2.0);
    EXPECT_EQ(pipeline.database_path, "augur.db");
}

TEST(TimeUtilsTest, ParseAndFormat) {
    Timestamp ts = 0;
    ASSERT_TRUE(parse_timestamp("2026-10-19T09:30:00Z", ts));
    EXPECT_EQ(format_iso8601(ts), "2026-10-19T09:30:00Z");

    ASSERT_TRUE(parse_timestamp("1700000000", ts));
    EXPECT_EQ(ts, 1700000000);

    EXPECT_FALSE(parse_timestamp("", ts));
    EXPECT_FALSE(parse_timestamp("2026-02-30T00:00:00Z", ts));
    EXPECT_FALSE(parse_timestamp("2026-10-19T09:30:00+02", ts));
}

TEST(TimeUtilsTest, CivilFieldsWithOffset) {
    Timestamp ts = 0;
    // Monday 2026-10-19 23:30 UTC is Tuesday 09:30 at UTC+10
    ASSERT_TRUE(parse_timestamp("2026-10-19T23:30:00Z", ts));
    CivilTime utc = to_civil(ts);
    EXPECT_EQ(utc.weekday, 0);
    EXPECT_EQ(utc.hour, 23);

    CivilTime local = to_civil(ts, 600);
    EXPECT_EQ(local.day, 20);
    EXPECT_EQ(local.hour, 9);
    EXPECT_EQ(local.weekday, 1);
    EXPECT_EQ(trade_day(ts, 600), trade_day(ts) + 1);
    EXPECT_EQ(from_civil(local, 600), ts);
}

TEST(LoggerTest, LevelNames) {
    LogLevel saved = Logger::level();
    EXPECT_TRUE(Logger::set_level("debug"));
    EXPECT_EQ(Logger::level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::set_level("error"));
    EXPECT_EQ(Logger::level(), LogLevel::LOG_ERROR);
    EXPECT_FALSE(Logger::set_level("chatty"));
    EXPECT_EQ(Logger::level(), LogLevel::LOG_ERROR);
    Logger::set_level(saved);
}

TEST(LoggerTest, ConcurrentLogging) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < 50; ++j) {
                Logger::debug() << "thread " << i << " message " << j << Logger::endl;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    SUCCEED();
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

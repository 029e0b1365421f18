#pragma once
#include <augur/backtest/backtest_engine.hpp>
#include <augur/features/feature_engineer.hpp>
#include <augur/model/multi_output_predictor.hpp>
#include <augur/tracking/model_performance_tracker.hpp>
#include <augur/utils/config.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace augur::pipeline {

// Typed view of the settings file used by both daily phases.
struct PipelineConfig {
    std::string database_path = "augur.db";
    std::vector<std::string> symbols;

    // Parallel morning workers; 0 uses the hardware concurrency
    size_t worker_count = 4;
    std::chrono::milliseconds signal_timeout{5000};
    // Entry quotes older than this (relative to the feature) are treated as missing
    int64_t max_entry_staleness_seconds = 24 * 3600;

    double flat_threshold_pct = 0.1;
    uint32_t model_seed = 42;

    features::FeatureEngineerConfig features;
    model::PredictorConfig predictor;
    tracking::TrackerConfig tracker;
    backtest::BacktestConfiguration backtest;

    // CSV adapter inputs
    std::string sentiment_csv;
    std::string technical_csv;
    std::string context_csv;
    std::string prices_csv;

    std::string log_level = "info";

    static PipelineConfig from_config(const utils::Config& config);
};

} // namespace augur::pipeline

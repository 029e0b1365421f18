#include <augur/pipeline/pipeline_config.hpp>
#include <algorithm>
#include <thread>

namespace augur::pipeline {

PipelineConfig PipelineConfig::from_config(const utils::Config& config) {
    PipelineConfig c;

    c.database_path = config.get("database_path", c.database_path);
    c.symbols = config.get_list("symbols");

    c.worker_count = config.get<size_t>("worker_count", c.worker_count);
    if (c.worker_count == 0) {
        c.worker_count = std::max(1u, std::thread::hardware_concurrency());
    }
    c.signal_timeout = std::chrono::milliseconds(config.get<int64_t>("signal_timeout_ms", c.signal_timeout.count()));
    c.max_entry_staleness_seconds = config.get<int64_t>("max_entry_staleness_seconds", c.max_entry_staleness_seconds);

    c.flat_threshold_pct = config.get<double>("flat_threshold_pct", c.flat_threshold_pct);
    c.model_seed = config.get<uint32_t>("model_seed", c.model_seed);

    // Feature engineering
    auto& f = c.features;
    f.market_utc_offset_minutes = config.get<int>("market_utc_offset_minutes", f.market_utc_offset_minutes);
    f.market_open_hour = config.get<int>("market_open_hour", f.market_open_hour);
    f.market_close_hour = config.get<int>("market_close_hour", f.market_close_hour);
    f.overbought_rsi = config.get<double>("overbought_rsi", f.overbought_rsi);
    f.oversold_rsi = config.get<double>("oversold_rsi", f.oversold_rsi);
    f.high_vix_level = config.get<double>("high_vix_level", f.high_vix_level);

    // Predictor
    auto& p = c.predictor;
    p.min_training_samples = config.get<size_t>("min_training_samples", p.min_training_samples);
    p.holdout_fraction = config.get<double>("holdout_fraction", p.holdout_fraction);
    p.tree_weight = config.get<double>("ensemble_tree_weight", p.tree_weight);
    p.linear_weight = config.get<double>("ensemble_linear_weight", p.linear_weight);
    p.neighbour_weight = config.get<double>("ensemble_neighbour_weight", p.neighbour_weight);
    p.trees.tree_count = config.get<int>("tree_count", p.trees.tree_count);
    p.trees.max_depth = config.get<int>("tree_max_depth", p.trees.max_depth);
    p.trees.min_samples_leaf = config.get<size_t>("tree_min_samples_leaf", p.trees.min_samples_leaf);
    p.linear.epochs = config.get<int>("linear_epochs", p.linear.epochs);
    p.linear.learning_rate = config.get<double>("linear_learning_rate", p.linear.learning_rate);
    p.neighbours = config.get<size_t>("neighbours", p.neighbours);

    auto& t = p.thresholds;
    t.strong_confidence = config.get<double>("strong_confidence", t.strong_confidence);
    t.strong_magnitude_pct = config.get<double>("strong_magnitude_pct", t.strong_magnitude_pct);
    t.confidence = config.get<double>("action_confidence", t.confidence);
    t.magnitude_pct = config.get<double>("action_magnitude_pct", t.magnitude_pct);

    // Promotion gate and anomalies
    c.tracker.min_direction_accuracy = config.get<double>("promotion_min_accuracy", c.tracker.min_direction_accuracy);
    c.tracker.max_magnitude_mae = config.get<double>("promotion_max_mae", c.tracker.max_magnitude_mae);
    c.tracker.anomaly_min_samples = config.get<int64_t>("anomaly_min_samples", c.tracker.anomaly_min_samples);

    c.backtest.initial_equity = config.get<double>("backtest_initial_equity", c.backtest.initial_equity);
    c.backtest.risk_free_rate = config.get<double>("backtest_risk_free_rate", c.backtest.risk_free_rate);

    c.sentiment_csv = config.get("sentiment_csv", c.sentiment_csv);
    c.technical_csv = config.get("technical_csv", c.technical_csv);
    c.context_csv = config.get("context_csv", c.context_csv);
    c.prices_csv = config.get("prices_csv", c.prices_csv);

    c.log_level = config.get("log_level", c.log_level);
    return c;
}

} // namespace augur::pipeline

#pragma once
#include <augur/backtest/performance_analyzer.hpp>
#include <augur/core/types.hpp>
#include <augur/store/feature_store.hpp>
#include <map>
#include <string>
#include <vector>

namespace augur::backtest {

struct BacktestConfiguration {
    // Horizon whose exit price closes every trade
    core::Horizon horizon = core::kLongestHorizon;
    double initial_equity = 100.0;
    double risk_free_rate = 0.0;
    int periods_per_year = 252;
};

struct ActionStats {
    int64_t trades = 0;
    int64_t wins = 0;
    double avg_return_pct = 0.0;

    double win_rate() const { return trades > 0 ? static_cast<double>(wins) / trades : 0.0; }
};

struct BacktestResult {
    std::string model_version;
    int64_t trades = 0;
    int64_t holds = 0;
    int64_t excluded = 0;
    double win_rate = 0.0;
    double avg_return_pct = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown_pct = 0.0;
    std::map<core::Action, ActionStats> by_action;
    PerformanceMetrics metrics;
};

/**
 * Replays stored predictions against their realized outcomes in timestamp
 * order. Each non-HOLD prediction opens a position at the entry price and
 * closes it at the configured horizon's exit.
 *
 * Pairs whose outcome was recorded before the horizon could have elapsed are
 * look-ahead and are excluded with a warning, as are incomplete outcomes.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfiguration config = {});

    // Only pairs produced by model_version are replayed; an empty version
    // replays everything.
    BacktestResult backtest(std::vector<store::PredictionOutcomePair> pairs,
                            const std::string& model_version) const;

    const BacktestConfiguration& get_config() const { return config_; }

private:
    BacktestConfiguration config_;

    bool is_look_ahead(const store::PredictionOutcomePair& pair) const;
};

} // namespace augur::backtest

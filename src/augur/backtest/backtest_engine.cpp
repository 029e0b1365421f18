#include <augur/backtest/backtest_engine.hpp>
#include <augur/core/returns.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <iomanip>

namespace augur::backtest {

using utils::Logger;

BacktestEngine::BacktestEngine(BacktestConfiguration config) : config_(config) {}

bool BacktestEngine::is_look_ahead(const store::PredictionOutcomePair& pair) const {
    const auto& outcome = pair.outcome;
    const Timestamp horizon_end = pair.prediction.created_timestamp + core::horizon_seconds(config_.horizon);
    if (!outcome.recorded_timestamp || *outcome.recorded_timestamp < horizon_end) {
        return true;
    }
    const auto& exit_ts = outcome.at(config_.horizon).exit_timestamp;
    return !exit_ts || *exit_ts < horizon_end;
}

BacktestResult BacktestEngine::backtest(std::vector<store::PredictionOutcomePair> pairs,
                                        const std::string& model_version) const {
    BacktestResult result;
    result.model_version = model_version;

    if (!model_version.empty()) {
        pairs.erase(std::remove_if(pairs.begin(), pairs.end(),
                                   [&](const auto& p) { return p.prediction.model_version != model_version; }),
                    pairs.end());
    }

    std::stable_sort(pairs.begin(), pairs.end(), [](const auto& a, const auto& b) {
        return a.prediction.created_timestamp < b.prediction.created_timestamp;
    });

    PerformanceAnalyzer analyzer(config_.initial_equity, config_.risk_free_rate, config_.periods_per_year);
    std::map<core::Action, double> return_sums;

    for (const auto& pair : pairs) {
        const auto& prediction = pair.prediction;
        const auto& outcome = pair.outcome;

        if (!outcome.is_complete()) {
            ++result.excluded;
            continue;
        }
        if (is_look_ahead(pair)) {
            ++result.excluded;
            Logger::warn() << "Look-ahead pair excluded: " << prediction.symbol << " predicted at "
                           << utils::format_iso8601(prediction.created_timestamp) << " recorded at "
                           << (outcome.recorded_timestamp ? utils::format_iso8601(*outcome.recorded_timestamp) : "never")
                           << Logger::endl;
            continue;
        }

        if (core::action_side(prediction.optimal_action) == 0) {
            ++result.holds;
            continue;
        }

        const auto& exit = outcome.at(config_.horizon);
        analyzer.add_trade(prediction.symbol, prediction.optimal_action, prediction.created_timestamp,
                           *exit.exit_timestamp, *outcome.entry_price, *exit.exit_price);

        const double trade_return = analyzer.get_trades().back().return_pct;
        ActionStats& stats = result.by_action[prediction.optimal_action];
        ++stats.trades;
        if (trade_return > 0.0) {
            ++stats.wins;
        }
        return_sums[prediction.optimal_action] += trade_return;
    }

    for (auto& [action, stats] : result.by_action) {
        stats.avg_return_pct = return_sums[action] / stats.trades;
    }

    result.metrics = analyzer.calculate_metrics();
    result.trades = result.metrics.total_trades;
    result.win_rate = result.metrics.win_rate;
    result.avg_return_pct = result.metrics.avg_return_pct;
    result.sharpe_ratio = result.metrics.sharpe_ratio;
    result.max_drawdown_pct = result.metrics.max_drawdown_pct;

    Logger::info() << "Backtest " << (model_version.empty() ? "all" : model_version) << ": "
                   << result.trades << " trades, win rate " << std::fixed << std::setprecision(3)
                   << result.win_rate << ", avg return " << result.avg_return_pct << "%, sharpe "
                   << result.sharpe_ratio << ", max drawdown " << result.max_drawdown_pct << "%, excluded "
                   << result.excluded << Logger::endl;
    return result;
}

} // namespace augur::backtest

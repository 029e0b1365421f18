#include <augur/backtest/performance_analyzer.hpp>
#include <augur/core/returns.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace augur::backtest {

PerformanceAnalyzer::PerformanceAnalyzer(double initial_equity, double risk_free_rate, int periods_per_year)
    : initial_equity_(initial_equity), risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year) {
    equity_curve_.push_back(initial_equity_);
}

void PerformanceAnalyzer::add_trade(const std::string& symbol, core::Action action, Timestamp entry_time,
                                    Timestamp exit_time, double entry_price, double exit_price) {
    if (core::action_side(action) == 0) {
        return;
    }

    Trade trade;
    trade.symbol = symbol;
    trade.action = action;
    trade.entry_time = entry_time;
    trade.exit_time = exit_time;
    trade.entry_price = entry_price;
    trade.exit_price = exit_price;
    trade.return_pct = core::position_return_pct(action, core::realized_return_pct(entry_price, exit_price));
    trades_.push_back(trade);

    equity_curve_.push_back(equity_curve_.back() * (1.0 + trade.return_pct / 100.0));
}

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }

    double sum = std::accumulate(returns.begin(), returns.end(), 0.0);
    double mean = sum / returns.size();

    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }

    double std_dev = std::sqrt(sq_sum / returns.size());

    if (std_dev < 0.000001) {
        return 0.0;
    }

    // Annualize
    double annualized_return = mean * periods_per_year_;
    double annualized_std_dev = std_dev * std::sqrt(periods_per_year_);

    return (annualized_return - risk_free_rate_) / annualized_std_dev;
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& curve) const {
    double max_dd = 0.0;
    double peak = curve.empty() ? 0.0 : curve[0];

    for (size_t i = 1; i < curve.size(); i++) {
        if (curve[i] > peak) {
            peak = curve[i];
        } else {
            max_dd = std::max(max_dd, (peak - curve[i]) / peak);
        }
    }
    return max_dd;
}

PerformanceMetrics PerformanceAnalyzer::calculate_metrics() const {
    PerformanceMetrics metrics;
    if (trades_.empty()) {
        return metrics;
    }

    // Per-trade returns as fractions
    std::vector<double> returns;
    returns.reserve(trades_.size());
    double gross_profit = 0.0;
    double gross_loss = 0.0;

    for (const auto& trade : trades_) {
        returns.push_back(trade.return_pct / 100.0);
        if (trade.return_pct > 0.0) {
            metrics.winning_trades++;
            gross_profit += trade.return_pct;
        } else {
            metrics.losing_trades++;
            gross_loss -= trade.return_pct;
        }
    }

    metrics.total_trades = static_cast<int>(trades_.size());
    metrics.total_return_pct = (equity_curve_.back() / equity_curve_.front() - 1.0) * 100.0;
    metrics.avg_return_pct = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size() * 100.0;
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns);
    metrics.max_drawdown_pct = calculate_max_drawdown(equity_curve_) * 100.0;
    metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades;
    metrics.profit_factor = (gross_loss > 0.000001) ? gross_profit / gross_loss : 0.0;

    return metrics;
}

} // namespace augur::backtest

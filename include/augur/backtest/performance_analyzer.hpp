#pragma once
#include <augur/core/types.hpp>
#include <augur/utils/time_utils.hpp>
#include <string>
#include <vector>

namespace augur::backtest {

using utils::Timestamp;

struct PerformanceMetrics {
    double total_return_pct = 0.0;
    double avg_return_pct = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown_pct = 0.0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
};

struct Trade {
    std::string symbol;
    core::Action action = core::Action::HOLD;
    Timestamp entry_time = 0;
    Timestamp exit_time = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double return_pct = 0.0;   // signed by the position side
};

// Trade-level statistics over a sequence of closed positions. Each trade is
// compounded into an equity curve in the order it was added.
class PerformanceAnalyzer {
private:
    std::vector<double> equity_curve_;
    std::vector<Trade> trades_;
    double initial_equity_;
    double risk_free_rate_;
    int periods_per_year_;

public:
    PerformanceAnalyzer(double initial_equity = 100.0, double risk_free_rate = 0.0,
                        int periods_per_year = 252);

    // Computes return_pct from the prices and the action's side and appends
    // the trade. HOLD is not a position and is ignored.
    void add_trade(const std::string& symbol, core::Action action, Timestamp entry_time,
                   Timestamp exit_time, double entry_price, double exit_price);

    PerformanceMetrics calculate_metrics() const;

    double calculate_sharpe_ratio(const std::vector<double>& returns) const;
    double calculate_max_drawdown(const std::vector<double>& curve) const;

    const std::vector<double>& get_equity_curve() const { return equity_curve_; }
    const std::vector<Trade>& get_trades() const { return trades_; }
};

} // namespace augur::backtest

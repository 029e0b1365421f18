#include <gtest/gtest.h>
#include <augur/backtest/backtest_engine.hpp>
#include <augur/backtest/performance_analyzer.hpp>

using namespace augur;
using core::Action;
using core::Horizon;

namespace {

constexpr utils::Timestamp kMorning = 1792404000;
constexpr utils::Timestamp kDay = 86400;

store::PredictionOutcomePair make_pair(const std::string& symbol, utils::Timestamp ts, Action action,
                                       double entry, double exit_1d, const std::string& version = "v1") {
    store::PredictionOutcomePair pair;
    pair.prediction.symbol = symbol;
    pair.prediction.created_timestamp = ts;
    pair.prediction.optimal_action = action;
    pair.prediction.model_version = version;

    auto& o = pair.outcome;
    o.symbol = symbol;
    o.feature_timestamp = ts;
    o.entry_price = entry;
    for (Horizon h : core::kAllHorizons) {
        o.at(h).exit_price = exit_1d;
        o.at(h).exit_timestamp = ts + core::horizon_seconds(h);
        o.at(h).return_pct = (exit_1d - entry) / entry * 100.0;
        o.at(h).direction = exit_1d > entry ? core::Direction::UP : core::Direction::DOWN;
    }
    o.status = core::OutcomeStatus::COMPLETE;
    o.recorded_timestamp = ts + kDay + 10 * 3600;
    return pair;
}

} // namespace

TEST(PerformanceAnalyzerTest, SideAwareReturns) {
    backtest::PerformanceAnalyzer analyzer(100.0);
    analyzer.add_trade("CBA.AX", Action::BUY, kMorning, kMorning + kDay, 100.0, 110.0);
    analyzer.add_trade("NAB.AX", Action::SELL, kMorning, kMorning + kDay, 100.0, 110.0);
    analyzer.add_trade("ANZ.AX", Action::HOLD, kMorning, kMorning + kDay, 100.0, 150.0);

    ASSERT_EQ(analyzer.get_trades().size(), 2u);
    EXPECT_NEAR(analyzer.get_trades()[0].return_pct, 10.0, 1e-9);
    EXPECT_NEAR(analyzer.get_trades()[1].return_pct, -10.0, 1e-9);

    auto metrics = analyzer.calculate_metrics();
    EXPECT_EQ(metrics.total_trades, 2);
    EXPECT_EQ(metrics.winning_trades, 1);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.5);
    EXPECT_NEAR(metrics.avg_return_pct, 0.0, 1e-9);
    // 100 -> 110 -> 99
    EXPECT_NEAR(analyzer.get_equity_curve().back(), 99.0, 1e-9);
    EXPECT_NEAR(metrics.max_drawdown_pct, 10.0, 1e-9);
    EXPECT_NEAR(metrics.total_return_pct, -1.0, 1e-9);
    EXPECT_NEAR(metrics.profit_factor, 1.0, 1e-9);
}

TEST(PerformanceAnalyzerTest, DrawdownFromRunningPeak) {
    backtest::PerformanceAnalyzer analyzer(100.0);
    analyzer.add_trade("CBA.AX", Action::BUY, kMorning, kMorning + kDay, 100.0, 110.0);
    analyzer.add_trade("CBA.AX", Action::BUY, kMorning + kDay, kMorning + 2 * kDay, 100.0, 80.0);
    analyzer.add_trade("CBA.AX", Action::STRONG_BUY, kMorning + 2 * kDay, kMorning + 3 * kDay, 100.0, 105.0);

    auto metrics = analyzer.calculate_metrics();
    // 100 -> 110 -> 88 -> 92.4
    EXPECT_NEAR(metrics.max_drawdown_pct, 20.0, 1e-9);
    EXPECT_NEAR(metrics.total_return_pct, -7.6, 1e-9);
    EXPECT_EQ(metrics.winning_trades, 2);
    EXPECT_EQ(metrics.losing_trades, 1);
}

TEST(PerformanceAnalyzerTest, EmptyMetrics) {
    backtest::PerformanceAnalyzer analyzer;
    auto metrics = analyzer.calculate_metrics();
    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.sharpe_ratio, 0.0);
}

TEST(BacktestEngineTest, ReplaysInTimestampOrder) {
    std::vector<store::PredictionOutcomePair> pairs;
    pairs.push_back(make_pair("CBA.AX", kMorning + kDay, Action::SELL, 100.0, 95.0));
    pairs.push_back(make_pair("CBA.AX", kMorning, Action::BUY, 100.0, 102.0));
    pairs.push_back(make_pair("NAB.AX", kMorning, Action::HOLD, 50.0, 60.0));
    pairs.push_back(make_pair("WBC.AX", kMorning, Action::STRONG_BUY, 20.0, 19.0));

    backtest::BacktestEngine engine;
    auto result = engine.backtest(pairs, "");

    EXPECT_EQ(result.trades, 3);
    EXPECT_EQ(result.holds, 1);
    EXPECT_EQ(result.excluded, 0);
    EXPECT_NEAR(result.win_rate, 2.0 / 3.0, 1e-9);
    // (+2 + 5 - 5) / 3
    EXPECT_NEAR(result.avg_return_pct, 2.0 / 3.0, 1e-9);

    ASSERT_EQ(result.by_action.count(Action::SELL), 1u);
    EXPECT_EQ(result.by_action[Action::SELL].wins, 1);
    EXPECT_NEAR(result.by_action[Action::SELL].avg_return_pct, 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.by_action[Action::STRONG_BUY].win_rate(), 0.0);
    EXPECT_EQ(result.by_action.count(Action::HOLD), 0u);
}

TEST(BacktestEngineTest, LookAheadExcluded) {
    std::vector<store::PredictionOutcomePair> pairs;
    pairs.push_back(make_pair("CBA.AX", kMorning, Action::BUY, 100.0, 101.0));

    // Outcome recorded before the 1d horizon could have elapsed
    auto early = make_pair("NAB.AX", kMorning, Action::BUY, 100.0, 120.0);
    early.outcome.recorded_timestamp = kMorning + 6 * 3600;
    pairs.push_back(early);

    // Exit stamped before the horizon end
    auto early_exit = make_pair("ANZ.AX", kMorning, Action::SELL, 100.0, 80.0);
    early_exit.outcome.at(Horizon::ONE_DAY).exit_timestamp = kMorning + 3600;
    pairs.push_back(early_exit);

    auto pending = make_pair("MQG.AX", kMorning, Action::BUY, 100.0, 101.0);
    pending.outcome.at(Horizon::ONE_DAY).exit_price.reset();
    pending.outcome.status = core::OutcomeStatus::PENDING;
    pairs.push_back(pending);

    backtest::BacktestEngine engine;
    auto result = engine.backtest(pairs, "");
    EXPECT_EQ(result.trades, 1);
    EXPECT_EQ(result.excluded, 3);
    EXPECT_NEAR(result.avg_return_pct, 1.0, 1e-9);
}

TEST(BacktestEngineTest, FiltersByModelVersion) {
    std::vector<store::PredictionOutcomePair> pairs;
    pairs.push_back(make_pair("CBA.AX", kMorning, Action::BUY, 100.0, 101.0, "v1"));
    pairs.push_back(make_pair("NAB.AX", kMorning, Action::BUY, 100.0, 90.0, "v2"));

    backtest::BacktestEngine engine;
    auto v1 = engine.backtest(pairs, "v1");
    EXPECT_EQ(v1.trades, 1);
    EXPECT_DOUBLE_EQ(v1.win_rate, 1.0);

    auto v2 = engine.backtest(pairs, "v2");
    EXPECT_EQ(v2.trades, 1);
    EXPECT_DOUBLE_EQ(v2.win_rate, 0.0);
}

TEST(BacktestEngineTest, ShorterHorizon) {
    backtest::BacktestConfiguration config;
    config.horizon = Horizon::ONE_HOUR;

    auto pair = make_pair("CBA.AX", kMorning, Action::BUY, 100.0, 101.0);
    pair.outcome.at(Horizon::ONE_HOUR).exit_price = 103.0;

    backtest::BacktestEngine engine(config);
    auto result = engine.backtest({pair}, "");
    EXPECT_EQ(result.trades, 1);
    EXPECT_NEAR(result.avg_return_pct, 3.0, 1e-9);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

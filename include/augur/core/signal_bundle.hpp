#pragma once
#include <augur/utils/time_utils.hpp>
#include <optional>
#include <string>

namespace augur::core {

using utils::Timestamp;

// One struct per source type. Every value is optional: adapters leave a field
// empty when the upstream did not deliver it, and the FeatureEngineer decides
// between observed and defaulted.

struct SentimentSignal {
    Timestamp timestamp = 0;
    std::optional<double> score;          // [-1, 1]
    std::optional<double> confidence;     // [0, 1]
    std::optional<double> article_count;
    std::optional<double> social_score;   // [-1, 1]
    std::optional<double> event_score;
};

struct TechnicalSignal {
    Timestamp timestamp = 0;
    std::optional<double> rsi;            // [0, 100]
    std::optional<double> macd_line;
    std::optional<double> macd_signal;
    std::optional<double> macd_hist;
    std::optional<double> price_vs_sma20; // % above (+) or below (-) the SMA
    std::optional<double> price_vs_sma50;
    std::optional<double> price_vs_sma200;
    std::optional<double> bollinger_width;
    std::optional<double> atr;
    std::optional<double> volatility_20d; // % daily standard deviation
    std::optional<double> volume_ratio;   // volume / 20d average volume
    std::optional<double> current_price;
    std::optional<double> price_change_1d; // %
    std::optional<double> price_change_5d; // %

    bool has_any_value() const;
};

struct MarketContextSignal {
    Timestamp timestamp = 0;
    std::optional<double> index_change_pct;
    std::optional<double> vix;
    std::optional<bool> is_market_hours;
    std::optional<double> sector_performance;
    std::optional<double> market_breadth;
};

// Everything collected for one symbol in one cycle. as_of is the cycle
// timestamp that the resulting FeatureRecord carries.
struct SignalBundle {
    std::string symbol;
    Timestamp as_of = 0;
    std::optional<SentimentSignal> sentiment;
    std::optional<TechnicalSignal> technical;
    std::optional<MarketContextSignal> context;
};

} // namespace augur::core

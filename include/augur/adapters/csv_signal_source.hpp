#pragma once
#include <augur/pipeline/signal_source.hpp>
#include <map>
#include <string>
#include <vector>

namespace augur::adapters {

/**
 * SignalSource over three CSV exports.
 *
 *   sentiment: timestamp,symbol,score,confidence,article_count,social_score,event_score
 *   technical: timestamp,symbol,rsi,macd_line,macd_signal,macd_hist,price_vs_sma20,
 *              price_vs_sma50,price_vs_sma200,bollinger_width,atr,volatility_20d,
 *              volume_ratio,current_price,price_change_1d,price_change_5d
 *   context:   timestamp,index_change_pct,vix,is_market_hours,sector_performance,market_breadth
 *
 * Timestamps are ISO-8601 UTC or epoch seconds. Fetches return the newest row
 * at or before as_of. Everything is read up front, so the timeout is unused.
 */
class CsvSignalSource : public pipeline::SignalSource {
public:
    bool load_sentiment(const std::string& path);
    bool load_technical(const std::string& path);
    bool load_context(const std::string& path);

    void add_sentiment(const std::string& symbol, const core::SentimentSignal& signal);
    void add_technical(const std::string& symbol, const core::TechnicalSignal& signal);
    void add_context(const core::MarketContextSignal& signal);

    std::optional<core::SentimentSignal> fetch_sentiment(const std::string& symbol, utils::Timestamp as_of,
                                                         std::chrono::milliseconds timeout) override;
    std::optional<core::TechnicalSignal> fetch_technical(const std::string& symbol, utils::Timestamp as_of,
                                                         std::chrono::milliseconds timeout) override;
    std::optional<core::MarketContextSignal> fetch_market_context(utils::Timestamp as_of,
                                                                  std::chrono::milliseconds timeout) override;

private:
    // Keyed by timestamp so lookups are a bound search
    std::map<std::string, std::map<utils::Timestamp, core::SentimentSignal>> sentiment_;
    std::map<std::string, std::map<utils::Timestamp, core::TechnicalSignal>> technical_;
    std::map<utils::Timestamp, core::MarketContextSignal> context_;
};

} // namespace augur::adapters

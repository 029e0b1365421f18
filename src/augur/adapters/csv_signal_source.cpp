#include <augur/adapters/csv_signal_source.hpp>
#include <augur/adapters/csv_reader.hpp>
#include <augur/utils/logger.hpp>
#include <iterator>

namespace augur::adapters {

using utils::Logger;

namespace {

// Newest entry at or before as_of
template <typename T>
std::optional<T> latest_at(const std::map<utils::Timestamp, T>& series, utils::Timestamp as_of) {
    auto it = series.upper_bound(as_of);
    if (it == series.begin()) {
        return std::nullopt;
    }
    return std::prev(it)->second;
}

} // namespace

bool CsvSignalSource::load_sentiment(const std::string& path) {
    CsvReader csv;
    if (!csv.load(path)) {
        return false;
    }
    for (size_t row = 0; row < csv.row_count(); ++row) {
        auto ts = csv.timestamp(row, "timestamp");
        auto symbol = csv.text(row, "symbol");
        if (!ts || !symbol) {
            Logger::warn() << path << ": row " << row + 1 << " has no timestamp or symbol" << Logger::endl;
            continue;
        }
        core::SentimentSignal s;
        s.timestamp = *ts;
        s.score = csv.number(row, "score");
        s.confidence = csv.number(row, "confidence");
        s.article_count = csv.number(row, "article_count");
        s.social_score = csv.number(row, "social_score");
        s.event_score = csv.number(row, "event_score");
        add_sentiment(*symbol, s);
    }
    return true;
}

bool CsvSignalSource::load_technical(const std::string& path) {
    CsvReader csv;
    if (!csv.load(path)) {
        return false;
    }
    for (size_t row = 0; row < csv.row_count(); ++row) {
        auto ts = csv.timestamp(row, "timestamp");
        auto symbol = csv.text(row, "symbol");
        if (!ts || !symbol) {
            Logger::warn() << path << ": row " << row + 1 << " has no timestamp or symbol" << Logger::endl;
            continue;
        }
        core::TechnicalSignal t;
        t.timestamp = *ts;
        t.rsi = csv.number(row, "rsi");
        t.macd_line = csv.number(row, "macd_line");
        t.macd_signal = csv.number(row, "macd_signal");
        t.macd_hist = csv.number(row, "macd_hist");
        t.price_vs_sma20 = csv.number(row, "price_vs_sma20");
        t.price_vs_sma50 = csv.number(row, "price_vs_sma50");
        t.price_vs_sma200 = csv.number(row, "price_vs_sma200");
        t.bollinger_width = csv.number(row, "bollinger_width");
        t.atr = csv.number(row, "atr");
        t.volatility_20d = csv.number(row, "volatility_20d");
        t.volume_ratio = csv.number(row, "volume_ratio");
        t.current_price = csv.number(row, "current_price");
        t.price_change_1d = csv.number(row, "price_change_1d");
        t.price_change_5d = csv.number(row, "price_change_5d");
        add_technical(*symbol, t);
    }
    return true;
}

bool CsvSignalSource::load_context(const std::string& path) {
    CsvReader csv;
    if (!csv.load(path)) {
        return false;
    }
    for (size_t row = 0; row < csv.row_count(); ++row) {
        auto ts = csv.timestamp(row, "timestamp");
        if (!ts) {
            Logger::warn() << path << ": row " << row + 1 << " has no timestamp" << Logger::endl;
            continue;
        }
        core::MarketContextSignal c;
        c.timestamp = *ts;
        c.index_change_pct = csv.number(row, "index_change_pct");
        c.vix = csv.number(row, "vix");
        c.is_market_hours = csv.flag(row, "is_market_hours");
        c.sector_performance = csv.number(row, "sector_performance");
        c.market_breadth = csv.number(row, "market_breadth");
        add_context(c);
    }
    return true;
}

void CsvSignalSource::add_sentiment(const std::string& symbol, const core::SentimentSignal& signal) {
    sentiment_[symbol][signal.timestamp] = signal;
}

void CsvSignalSource::add_technical(const std::string& symbol, const core::TechnicalSignal& signal) {
    technical_[symbol][signal.timestamp] = signal;
}

void CsvSignalSource::add_context(const core::MarketContextSignal& signal) {
    context_[signal.timestamp] = signal;
}

std::optional<core::SentimentSignal> CsvSignalSource::fetch_sentiment(const std::string& symbol,
                                                                      utils::Timestamp as_of,
                                                                      std::chrono::milliseconds /*timeout*/) {
    auto it = sentiment_.find(symbol);
    if (it == sentiment_.end()) {
        return std::nullopt;
    }
    return latest_at(it->second, as_of);
}

std::optional<core::TechnicalSignal> CsvSignalSource::fetch_technical(const std::string& symbol,
                                                                      utils::Timestamp as_of,
                                                                      std::chrono::milliseconds /*timeout*/) {
    auto it = technical_.find(symbol);
    if (it == technical_.end()) {
        return std::nullopt;
    }
    return latest_at(it->second, as_of);
}

std::optional<core::MarketContextSignal> CsvSignalSource::fetch_market_context(
        utils::Timestamp as_of, std::chrono::milliseconds /*timeout*/) {
    return latest_at(context_, as_of);
}

} // namespace augur::adapters

#include <augur/features/feature_engineer.hpp>
#include <augur/core/errors.hpp>
#include <augur/store/feature_store.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace augur::features {

using core::FeatureField;
using core::FeatureRecord;
using utils::Logger;

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDefaultVix = 20.0;

struct Range {
    double min;
    double max;
};

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr Range kUnbounded{-kInf, kInf};
constexpr Range kUnit{0.0, 1.0};
constexpr Range kSigned{-1.0, 1.0};
constexpr Range kNonNegative{0.0, kInf};

// Writes value into field when it is present, finite and inside range;
// otherwise writes the default and marks the field as defaulted.
void fill(FeatureRecord& record, FeatureField field, const std::optional<double>& value,
          double fallback, Range range = kUnbounded) {
    if (value && std::isfinite(*value) && *value >= range.min && *value <= range.max) {
        record.set(field, *value);
        return;
    }
    if (value) {
        Logger::warn() << record.symbol << ": " << core::feature_name(field) << " value "
                       << *value << " invalid, using default " << fallback << Logger::endl;
    }
    record.set(field, fallback);
    record.defaulted.set(core::field_index(field));
}

double flag(bool b) {
    return b ? 1.0 : 0.0;
}

} // namespace

FeatureEngineer::FeatureEngineer(FeatureEngineerConfig config) : config_(config) {}

FeatureRecord FeatureEngineer::build(const std::string& symbol, const core::SignalBundle& bundle) const {
    validate_mandatory(symbol, bundle);
    check_signal_times(symbol, bundle);

    FeatureRecord record;
    record.symbol = symbol;
    record.timestamp = bundle.as_of;
    record.sentiment_timestamp = bundle.sentiment ? bundle.sentiment->timestamp : 0;
    record.technical_timestamp = bundle.technical->timestamp;
    record.context_timestamp = bundle.context ? bundle.context->timestamp : 0;

    fold_sentiment(bundle, record);
    fold_technical(bundle, record);
    fold_context(bundle, record);
    derive_indicators(record);
    derive_interactions(record);
    derive_time_features(record);
    derive_quality(record);

    if (record.defaulted_count() > 0) {
        Logger::debug() << symbol << ": " << record.defaulted_count() << " of "
                        << core::kRawFieldCount << " inputs defaulted" << Logger::endl;
    }
    return record;
}

std::optional<FeatureRecord> FeatureEngineer::build_and_store(const std::string& symbol,
                                                              const core::SignalBundle& bundle,
                                                              store::FeatureStore& store) const {
    FeatureRecord record = build(symbol, bundle);
    auto id = store.insert_feature(record);
    if (!id) {
        return std::nullopt;
    }
    record.id = *id;
    return record;
}

void FeatureEngineer::validate_mandatory(const std::string& symbol,
                                         const core::SignalBundle& bundle) const {
    if (symbol.empty()) {
        throw core::IncompleteSignalError(symbol, "symbol is empty");
    }
    if (!bundle.symbol.empty() && bundle.symbol != symbol) {
        throw core::IncompleteSignalError(symbol, "bundle belongs to " + bundle.symbol);
    }
    if (bundle.as_of <= 0) {
        throw core::IncompleteSignalError(symbol, "bundle has no timestamp");
    }
    if (!bundle.technical) {
        throw core::IncompleteSignalError(symbol, "technical signal missing");
    }
    if (bundle.technical->timestamp <= 0) {
        throw core::IncompleteSignalError(symbol, "technical signal has no timestamp");
    }
    if (!bundle.technical->has_any_value()) {
        throw core::IncompleteSignalError(symbol, "technical signal has no observed field");
    }
}

void FeatureEngineer::check_signal_times(const std::string& symbol,
                                         const core::SignalBundle& bundle) const {
    core::ViolationReport report;
    report.phase = "FEATURE_BUILD";
    report.checks_run.push_back("no_future_leakage");

    auto check = [&](const char* source, utils::Timestamp ts) {
        if (ts > bundle.as_of) {
            report.violations.push_back({"no_future_leakage", 1,
                                         symbol + " " + source + " signal at "
                                             + utils::format_iso8601(ts) + " is after "
                                             + utils::format_iso8601(bundle.as_of)});
        }
    };

    if (bundle.sentiment) check("sentiment", bundle.sentiment->timestamp);
    check("technical", bundle.technical->timestamp);
    if (bundle.context) check("market context", bundle.context->timestamp);

    if (!report.passed()) {
        throw core::TemporalIntegrityViolation(report);
    }
}

void FeatureEngineer::fold_sentiment(const core::SignalBundle& bundle, FeatureRecord& record) const {
    const core::SentimentSignal empty;
    const core::SentimentSignal& s = bundle.sentiment ? *bundle.sentiment : empty;

    fill(record, FeatureField::SENTIMENT_SCORE, s.score, 0.0, kSigned);
    fill(record, FeatureField::SENTIMENT_CONFIDENCE, s.confidence, 0.0, kUnit);
    fill(record, FeatureField::ARTICLE_COUNT, s.article_count, 0.0, kNonNegative);
    fill(record, FeatureField::SOCIAL_SCORE, s.social_score, 0.0, kSigned);
    fill(record, FeatureField::EVENT_SCORE, s.event_score, 0.0);
}

void FeatureEngineer::fold_technical(const core::SignalBundle& bundle, FeatureRecord& record) const {
    const core::TechnicalSignal& t = *bundle.technical;

    fill(record, FeatureField::RSI, t.rsi, 50.0, {0.0, 100.0});
    fill(record, FeatureField::MACD_LINE, t.macd_line, 0.0);
    fill(record, FeatureField::MACD_SIGNAL, t.macd_signal, 0.0);
    fill(record, FeatureField::MACD_HISTOGRAM, t.macd_hist, 0.0);
    fill(record, FeatureField::PRICE_VS_SMA20, t.price_vs_sma20, 0.0);
    fill(record, FeatureField::PRICE_VS_SMA50, t.price_vs_sma50, 0.0);
    fill(record, FeatureField::PRICE_VS_SMA200, t.price_vs_sma200, 0.0);
    fill(record, FeatureField::BOLLINGER_WIDTH, t.bollinger_width, 0.0, kNonNegative);
    fill(record, FeatureField::ATR_14, t.atr, 0.0, kNonNegative);
    fill(record, FeatureField::VOLATILITY_20D, t.volatility_20d, 0.0, kNonNegative);
    fill(record, FeatureField::VOLUME_RATIO, t.volume_ratio, 1.0, kNonNegative);

    // Prices must be strictly positive
    std::optional<double> price = t.current_price;
    if (price && *price <= 0.0) {
        Logger::warn() << record.symbol << ": current_price " << *price
                       << " not positive, using default" << Logger::endl;
        price.reset();
    }
    fill(record, FeatureField::CURRENT_PRICE, price, 0.0);

    fill(record, FeatureField::PRICE_CHANGE_1D, t.price_change_1d, 0.0);
    fill(record, FeatureField::PRICE_CHANGE_5D, t.price_change_5d, 0.0);
}

void FeatureEngineer::fold_context(const core::SignalBundle& bundle, FeatureRecord& record) const {
    const core::MarketContextSignal empty;
    const core::MarketContextSignal& c = bundle.context ? *bundle.context : empty;

    fill(record, FeatureField::INDEX_CHANGE_PCT, c.index_change_pct, 0.0);
    fill(record, FeatureField::VIX_LEVEL, c.vix, kDefaultVix, kNonNegative);
    fill(record, FeatureField::SECTOR_PERFORMANCE, c.sector_performance, 0.0);
    fill(record, FeatureField::MARKET_BREADTH, c.market_breadth, 0.0);

    if (c.is_market_hours) {
        record.set(FeatureField::MARKET_HOURS_FLAG, flag(*c.is_market_hours));
    } else {
        // Derived from the clock in derive_time_features
        record.defaulted.set(core::field_index(FeatureField::MARKET_HOURS_FLAG));
    }
}

void FeatureEngineer::derive_indicators(FeatureRecord& record) const {
    const double rsi = record.get(FeatureField::RSI);
    const double price = record.get(FeatureField::CURRENT_PRICE);

    record.set(FeatureField::MOMENTUM_SCORE, record.get(FeatureField::PRICE_CHANGE_1D) + (rsi - 50.0));
    record.set(FeatureField::RSI_OVERBOUGHT, flag(rsi > config_.overbought_rsi));
    record.set(FeatureField::RSI_OVERSOLD, flag(rsi < config_.oversold_rsi));
    record.set(FeatureField::MACD_BULLISH, flag(record.get(FeatureField::MACD_HISTOGRAM) > 0.0));
    record.set(FeatureField::ATR_PCT, price > 0.0 ? record.get(FeatureField::ATR_14) / price * 100.0 : 0.0);
    record.set(FeatureField::HIGH_VIX_REGIME, flag(record.get(FeatureField::VIX_LEVEL) > config_.high_vix_level));
}

void FeatureEngineer::derive_interactions(FeatureRecord& record) const {
    const double score = record.get(FeatureField::SENTIMENT_SCORE);
    const double rsi = record.get(FeatureField::RSI);
    const double volume_ratio = record.get(FeatureField::VOLUME_RATIO);
    const double volatility = record.get(FeatureField::VOLATILITY_20D);

    // +1 when the technicals lean bullish, -1 otherwise
    const double technical_signal = rsi > 50.0 ? 1.0 : -1.0;

    record.set(FeatureField::SENTIMENT_MOMENTUM, score * record.get(FeatureField::MOMENTUM_SCORE));
    record.set(FeatureField::SENTIMENT_RSI, score * (rsi - 50.0) / 50.0);
    record.set(FeatureField::VOLUME_SENTIMENT, volume_ratio * score);
    record.set(FeatureField::CONFIDENCE_VOLATILITY,
               record.get(FeatureField::SENTIMENT_CONFIDENCE) / (volatility + 0.01));
    record.set(FeatureField::NEWS_VOLUME_IMPACT, record.get(FeatureField::ARTICLE_COUNT) * volume_ratio);
    record.set(FeatureField::TECHNICAL_SENTIMENT_DIVERGENCE, std::abs(technical_signal - score));
    record.set(FeatureField::SENTIMENT_INDEX_ALIGNMENT, score * record.get(FeatureField::INDEX_CHANGE_PCT));
    record.set(FeatureField::VOLATILITY_ADJUSTED_SENTIMENT, score / (1.0 + volatility));
}

void FeatureEngineer::derive_time_features(FeatureRecord& record) const {
    const utils::CivilTime local = utils::to_civil(record.timestamp, config_.market_utc_offset_minutes);

    record.set(FeatureField::HOUR_OF_DAY, local.hour);
    record.set(FeatureField::OPENING_HOUR, flag(local.hour == config_.market_open_hour));
    record.set(FeatureField::CLOSING_HOUR, flag(local.hour == config_.market_close_hour - 1));
    record.set(FeatureField::DAY_OF_WEEK, local.weekday);
    record.set(FeatureField::MONDAY_EFFECT, flag(local.weekday == 0));
    record.set(FeatureField::FRIDAY_EFFECT, flag(local.weekday == 4));

    const bool month_end = local.day >= 25;
    const bool quarter_month = local.month % 3 == 0;
    record.set(FeatureField::MONTH_END, flag(month_end));
    record.set(FeatureField::QUARTER_END, flag(month_end && quarter_month));

    const double minute_of_day = local.hour * 60.0 + local.minute;
    const double angle = 2.0 * kPi * minute_of_day / (24.0 * 60.0);
    record.set(FeatureField::TIME_OF_DAY_SIN, std::sin(angle));
    record.set(FeatureField::TIME_OF_DAY_COS, std::cos(angle));

    if (record.is_defaulted(FeatureField::MARKET_HOURS_FLAG)) {
        const bool weekday = local.weekday < 5;
        const bool open = local.hour >= config_.market_open_hour && local.hour < config_.market_close_hour;
        record.set(FeatureField::MARKET_HOURS_FLAG, flag(weekday && open));
    }
}

void FeatureEngineer::derive_quality(FeatureRecord& record) const {
    utils::Timestamp oldest = record.timestamp;
    for (utils::Timestamp ts : {record.sentiment_timestamp, record.technical_timestamp,
                                record.context_timestamp}) {
        if (ts > 0) {
            oldest = std::min(oldest, ts);
        }
    }
    record.set(FeatureField::MAX_SIGNAL_AGE_MINUTES,
               static_cast<double>(record.timestamp - oldest) / utils::kSecondsPerMinute);

    const double ratio = static_cast<double>(record.defaulted_count()) / core::kRawFieldCount;
    record.set(FeatureField::DEFAULTED_RATIO, ratio);
    record.quality_score = 1.0 - ratio;
}

} // namespace augur::features

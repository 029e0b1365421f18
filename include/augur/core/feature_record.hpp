#pragma once
#include <augur/utils/time_utils.hpp>
#include <array>
#include <bitset>
#include <cstdint>
#include <string>
#include <vector>

namespace augur::core {

using utils::Timestamp;

// Column order of the fixed-width feature vector. The names returned by
// feature_name() are the enhanced_features column names and feed the schema
// hash, so renaming or reordering a field changes the hash.
enum class FeatureField : size_t {
    // Sentiment
    SENTIMENT_SCORE,
    SENTIMENT_CONFIDENCE,
    ARTICLE_COUNT,
    SOCIAL_SCORE,
    EVENT_SCORE,
    // Technical
    RSI,
    MACD_LINE,
    MACD_SIGNAL,
    MACD_HISTOGRAM,
    PRICE_VS_SMA20,
    PRICE_VS_SMA50,
    PRICE_VS_SMA200,
    BOLLINGER_WIDTH,
    ATR_14,
    VOLATILITY_20D,
    VOLUME_RATIO,
    CURRENT_PRICE,
    PRICE_CHANGE_1D,
    PRICE_CHANGE_5D,
    // Market context
    INDEX_CHANGE_PCT,
    VIX_LEVEL,
    MARKET_HOURS_FLAG,
    SECTOR_PERFORMANCE,
    MARKET_BREADTH,
    // Derived technical/context
    MOMENTUM_SCORE,
    RSI_OVERBOUGHT,
    RSI_OVERSOLD,
    MACD_BULLISH,
    ATR_PCT,
    HIGH_VIX_REGIME,
    // Interaction
    SENTIMENT_MOMENTUM,
    SENTIMENT_RSI,
    VOLUME_SENTIMENT,
    CONFIDENCE_VOLATILITY,
    NEWS_VOLUME_IMPACT,
    TECHNICAL_SENTIMENT_DIVERGENCE,
    SENTIMENT_INDEX_ALIGNMENT,
    VOLATILITY_ADJUSTED_SENTIMENT,
    // Time
    HOUR_OF_DAY,
    OPENING_HOUR,
    CLOSING_HOUR,
    DAY_OF_WEEK,
    MONDAY_EFFECT,
    FRIDAY_EFFECT,
    MONTH_END,
    QUARTER_END,
    TIME_OF_DAY_SIN,
    TIME_OF_DAY_COS,
    // Data quality
    MAX_SIGNAL_AGE_MINUTES,
    DEFAULTED_RATIO,

    COUNT
};

constexpr size_t kFeatureCount = static_cast<size_t>(FeatureField::COUNT);

// Fields read directly from adapters (everything before the derived block).
// Only these can be defaulted.
constexpr size_t kRawFieldCount = static_cast<size_t>(FeatureField::MOMENTUM_SCORE);

constexpr size_t field_index(FeatureField f) {
    return static_cast<size_t>(f);
}

const char* feature_name(FeatureField f);
const char* feature_name(size_t index);

// Stable FNV-1a hash over the ordered column names, hex encoded.
std::string feature_schema_hash();

using FeatureVector = std::array<double, kFeatureCount>;

struct FeatureRecord {
    int64_t id = 0;                 // 0 until persisted
    std::string symbol;
    Timestamp timestamp = 0;

    FeatureVector values{};
    std::bitset<kFeatureCount> defaulted;

    // Timestamps of the constituent signals; 0 when the source was absent
    Timestamp sentiment_timestamp = 0;
    Timestamp technical_timestamp = 0;
    Timestamp context_timestamp = 0;

    // Fraction of raw input fields that were observed rather than defaulted
    double quality_score = 1.0;

    double get(FeatureField f) const { return values[field_index(f)]; }
    void set(FeatureField f, double v) { values[field_index(f)] = v; }
    bool is_defaulted(FeatureField f) const { return defaulted.test(field_index(f)); }

    size_t defaulted_count() const { return defaulted.count(); }

    // Latest constituent signal timestamp (0 when there are none)
    Timestamp latest_signal_timestamp() const;
};

} // namespace augur::core

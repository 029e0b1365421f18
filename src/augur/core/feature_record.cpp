#include <augur/core/feature_record.hpp>
#include <algorithm>
#include <cstdio>

namespace augur::core {

namespace {

constexpr std::array<const char*, kFeatureCount> kFeatureNames = {
    "sentiment_score",
    "confidence",
    "news_count",
    "social_score",
    "event_score",
    "rsi",
    "macd_line",
    "macd_signal",
    "macd_histogram",
    "price_vs_sma20",
    "price_vs_sma50",
    "price_vs_sma200",
    "bollinger_width",
    "atr_14",
    "volatility_20d",
    "volume_ratio",
    "current_price",
    "price_change_1d",
    "price_change_5d",
    "index_change_pct",
    "vix_level",
    "market_hours",
    "sector_performance",
    "market_breadth",
    "momentum_score",
    "rsi_overbought",
    "rsi_oversold",
    "macd_bullish",
    "atr_pct",
    "high_vix_regime",
    "sentiment_momentum",
    "sentiment_rsi",
    "volume_sentiment",
    "confidence_volatility",
    "news_volume_impact",
    "technical_sentiment_divergence",
    "sentiment_index_alignment",
    "volatility_adjusted_sentiment",
    "hour_of_day",
    "opening_hour",
    "closing_hour",
    "day_of_week",
    "monday_effect",
    "friday_effect",
    "month_end",
    "quarter_end",
    "time_of_day_sin",
    "time_of_day_cos",
    "max_signal_age_minutes",
    "defaulted_ratio",
};

} // namespace

const char* feature_name(FeatureField f) {
    return kFeatureNames[field_index(f)];
}

const char* feature_name(size_t index) {
    return index < kFeatureCount ? kFeatureNames[index] : "";
}

std::string feature_schema_hash() {
    uint64_t hash = 14695981039346656037ULL;
    for (const char* name : kFeatureNames) {
        for (const char* p = name; *p != '\0'; ++p) {
            hash ^= static_cast<unsigned char>(*p);
            hash *= 1099511628211ULL;
        }
        hash ^= static_cast<unsigned char>(',');
        hash *= 1099511628211ULL;
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return buffer;
}

Timestamp FeatureRecord::latest_signal_timestamp() const {
    return std::max({sentiment_timestamp, technical_timestamp, context_timestamp});
}

} // namespace augur::core

#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/signal_bundle.hpp>
#include <optional>
#include <string>

namespace augur::store {
class FeatureStore;
}

namespace augur::features {

struct FeatureEngineerConfig {
    // Offset of the market's local time from UTC (600 = UTC+10)
    int market_utc_offset_minutes = 600;
    int market_open_hour = 10;
    int market_close_hour = 16;
    double overbought_rsi = 70.0;
    double oversold_rsi = 30.0;
    double high_vix_level = 25.0;
};

/**
 * Folds one SignalBundle into a fixed-width FeatureRecord.
 *
 * Optional inputs that are missing, non-finite or out of range are replaced by
 * their neutral default and marked in FeatureRecord::defaulted; quality_score
 * reports the observed fraction. Missing mandatory inputs throw
 * IncompleteSignalError and a signal newer than the bundle throws
 * TemporalIntegrityViolation. Neither produces a record.
 */
class FeatureEngineer {
public:
    explicit FeatureEngineer(FeatureEngineerConfig config = {});

    core::FeatureRecord build(const std::string& symbol, const core::SignalBundle& bundle) const;

    // build() followed by an insert. Returns nullopt when the store already
    // holds a record for this symbol and cycle.
    std::optional<core::FeatureRecord> build_and_store(const std::string& symbol,
                                                       const core::SignalBundle& bundle,
                                                       store::FeatureStore& store) const;

    const FeatureEngineerConfig& config() const { return config_; }

private:
    FeatureEngineerConfig config_;

    void validate_mandatory(const std::string& symbol, const core::SignalBundle& bundle) const;
    void check_signal_times(const std::string& symbol, const core::SignalBundle& bundle) const;

    void fold_sentiment(const core::SignalBundle& bundle, core::FeatureRecord& record) const;
    void fold_technical(const core::SignalBundle& bundle, core::FeatureRecord& record) const;
    void fold_context(const core::SignalBundle& bundle, core::FeatureRecord& record) const;
    void derive_indicators(core::FeatureRecord& record) const;
    void derive_interactions(core::FeatureRecord& record) const;
    void derive_time_features(core::FeatureRecord& record) const;
    void derive_quality(core::FeatureRecord& record) const;
};

} // namespace augur::features

#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/outcome.hpp>
#include <augur/core/types.hpp>
#include <map>
#include <optional>

namespace augur::store {
class FeatureStore;
}

namespace augur::outcome {

using utils::Timestamp;

// Prices observed for one horizon. exit_timestamp defaults to the moment the
// horizon elapsed.
struct HorizonPrice {
    std::optional<double> entry;
    std::optional<double> exit;
    std::optional<Timestamp> exit_timestamp;
};

using HorizonPrices = std::map<core::Horizon, HorizonPrice>;

struct BackfillResult {
    int applied = 0;
    int rejected = 0;
    bool completed = false;
};

/**
 * Turns observed prices into Outcome rows.
 *
 * record() writes one row per feature. Horizons that have elapsed but lack a
 * price are left pending and reported through StalePriceError after the row
 * is persisted; horizons that have not elapsed yet simply stay pending.
 * backfill() fills pending fields; the store accepts each field only once.
 */
class OutcomeRecorder {
public:
    OutcomeRecorder(store::FeatureStore& store, double flat_threshold_pct = 0.1);

    // Returns nullopt when the feature already has an outcome row.
    std::optional<core::Outcome> record(const core::FeatureRecord& feature, const HorizonPrices& prices,
                                        Timestamp now);

    BackfillResult backfill(const core::Outcome& outcome, const HorizonPrices& prices, Timestamp now);

    double flat_threshold_pct() const { return flat_threshold_pct_; }

private:
    store::FeatureStore& store_;
    double flat_threshold_pct_;

    std::optional<core::HorizonOutcome> resolve(const std::string& symbol, Timestamp feature_timestamp,
                                                core::Horizon horizon, double entry,
                                                const HorizonPrice& price) const;
};

} // namespace augur::outcome

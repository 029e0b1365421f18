#pragma once
#include <augur/core/prediction.hpp>
#include <augur/core/types.hpp>

namespace augur::model {

struct ActionThresholds {
    double strong_confidence = 0.8;
    double strong_magnitude_pct = 2.0;
    double confidence = 0.6;
    double magnitude_pct = 0.5;
};

// Deterministic mapping from the longest-horizon forecast to an action.
// FLAT always maps to HOLD; UP/DOWN pick the buy/sell side and the tier is
// decided by confidence and |magnitude|.
core::Action decide_action(const core::HorizonForecast& forecast, const ActionThresholds& thresholds);

} // namespace augur::model

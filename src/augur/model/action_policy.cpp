#include <augur/model/action_policy.hpp>
#include <cmath>

namespace augur::model {

core::Action decide_action(const core::HorizonForecast& forecast, const ActionThresholds& thresholds) {
    if (forecast.direction == core::Direction::FLAT) {
        return core::Action::HOLD;
    }

    const bool up = forecast.direction == core::Direction::UP;
    const double magnitude = std::abs(forecast.magnitude_pct);

    if (forecast.confidence >= thresholds.strong_confidence && magnitude >= thresholds.strong_magnitude_pct) {
        return up ? core::Action::STRONG_BUY : core::Action::STRONG_SELL;
    }
    if (forecast.confidence >= thresholds.confidence && magnitude >= thresholds.magnitude_pct) {
        return up ? core::Action::BUY : core::Action::SELL;
    }
    return core::Action::HOLD;
}

} // namespace augur::model

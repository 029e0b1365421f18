#pragma once
#include <augur/core/types.hpp>
#include <augur/utils/time_utils.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace augur::core {

using utils::Timestamp;

struct HorizonForecast {
    Direction direction = Direction::FLAT;
    // Probability of UP, DOWN, FLAT (indexed by direction_index)
    std::array<double, kDirectionCount> probabilities{{0.0, 0.0, 1.0}};
    double magnitude_pct = 0.0;     // signed % change
    double confidence = 0.0;        // probability of the chosen direction
};

using ForecastSet = std::array<HorizonForecast, kHorizonCount>;

struct Prediction {
    int64_t id = 0;
    int64_t feature_id = 0;         // reference only, the feature stays immutable
    std::string symbol;
    ForecastSet horizons{};
    Action optimal_action = Action::HOLD;
    double average_confidence = 0.0;
    Timestamp created_timestamp = 0; // always the feature timestamp
    std::string model_version;

    const HorizonForecast& at(Horizon h) const { return horizons[horizon_index(h)]; }
    HorizonForecast& at(Horizon h) { return horizons[horizon_index(h)]; }
};

} // namespace augur::core

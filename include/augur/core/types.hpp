#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace augur::core {

enum class Horizon {
    ONE_HOUR,
    FOUR_HOURS,
    ONE_DAY
};

constexpr size_t kHorizonCount = 3;

constexpr std::array<Horizon, kHorizonCount> kAllHorizons = {
    Horizon::ONE_HOUR, Horizon::FOUR_HOURS, Horizon::ONE_DAY
};

constexpr Horizon kShortestHorizon = Horizon::ONE_HOUR;
constexpr Horizon kLongestHorizon = Horizon::ONE_DAY;

constexpr size_t horizon_index(Horizon h) {
    return static_cast<size_t>(h);
}

constexpr int64_t horizon_seconds(Horizon h) {
    switch (h) {
        case Horizon::ONE_HOUR: return 3600;
        case Horizon::FOUR_HOURS: return 4 * 3600;
        case Horizon::ONE_DAY: return 24 * 3600;
    }
    return 0;
}

// Column suffix and display label: "1h", "4h", "1d"
const char* horizon_label(Horizon h);

enum class Direction {
    UP,
    DOWN,
    FLAT
};

constexpr size_t kDirectionCount = 3;

constexpr size_t direction_index(Direction d) {
    return static_cast<size_t>(d);
}

const char* to_string(Direction d);
std::optional<Direction> parse_direction(const std::string& text);

enum class Action {
    STRONG_BUY,
    BUY,
    HOLD,
    SELL,
    STRONG_SELL
};

constexpr std::array<Action, 5> kAllActions = {
    Action::STRONG_BUY, Action::BUY, Action::HOLD, Action::SELL, Action::STRONG_SELL
};

const char* to_string(Action a);
std::optional<Action> parse_action(const std::string& text);

// +1 for the buy actions, -1 for the sell actions, 0 for HOLD
int action_side(Action a);

enum class Phase {
    MORNING,
    EVENING
};

const char* to_string(Phase p);
std::optional<Phase> parse_phase(const std::string& text);

} // namespace augur::core

#include <augur/core/types.hpp>

namespace augur::core {

const char* horizon_label(Horizon h) {
    switch (h) {
        case Horizon::ONE_HOUR: return "1h";
        case Horizon::FOUR_HOURS: return "4h";
        case Horizon::ONE_DAY: return "1d";
    }
    return "?";
}

const char* to_string(Direction d) {
    switch (d) {
        case Direction::UP: return "UP";
        case Direction::DOWN: return "DOWN";
        case Direction::FLAT: return "FLAT";
    }
    return "FLAT";
}

std::optional<Direction> parse_direction(const std::string& text) {
    if (text == "UP") return Direction::UP;
    if (text == "DOWN") return Direction::DOWN;
    if (text == "FLAT") return Direction::FLAT;
    return std::nullopt;
}

const char* to_string(Action a) {
    switch (a) {
        case Action::STRONG_BUY: return "STRONG_BUY";
        case Action::BUY: return "BUY";
        case Action::HOLD: return "HOLD";
        case Action::SELL: return "SELL";
        case Action::STRONG_SELL: return "STRONG_SELL";
    }
    return "HOLD";
}

std::optional<Action> parse_action(const std::string& text) {
    for (Action a : kAllActions) {
        if (text == to_string(a)) {
            return a;
        }
    }
    return std::nullopt;
}

int action_side(Action a) {
    switch (a) {
        case Action::STRONG_BUY:
        case Action::BUY:
            return 1;
        case Action::STRONG_SELL:
        case Action::SELL:
            return -1;
        case Action::HOLD:
            return 0;
    }
    return 0;
}

const char* to_string(Phase p) {
    return p == Phase::MORNING ? "MORNING" : "EVENING";
}

std::optional<Phase> parse_phase(const std::string& text) {
    if (text == "MORNING") return Phase::MORNING;
    if (text == "EVENING") return Phase::EVENING;
    return std::nullopt;
}

} // namespace augur::core

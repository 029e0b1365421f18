#include <augur/core/returns.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace augur::core {

double realized_return_pct(double entry_price, double exit_price) {
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        throw std::invalid_argument("entry price must be positive and finite, got "
                                    + std::to_string(entry_price));
    }
    if (!std::isfinite(exit_price)) {
        throw std::invalid_argument("exit price must be finite");
    }
    return ((exit_price - entry_price) / entry_price) * 100.0;
}

Direction classify_return(double return_pct, double flat_threshold_pct) {
    if (return_pct == 0.0 || std::abs(return_pct) < flat_threshold_pct) {
        return Direction::FLAT;
    }
    return return_pct > 0.0 ? Direction::UP : Direction::DOWN;
}

double position_return_pct(Action action, double return_pct) {
    return static_cast<double>(action_side(action)) * return_pct;
}

} // namespace augur::core

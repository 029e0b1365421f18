#pragma once
#include <augur/core/types.hpp>

namespace augur::core {

// The one return formula of the system: ((exit - entry) / entry) * 100.
// Result is in percentage points (5.0 means +5%). Every call site that turns a
// price pair into a return goes through here.
// Throws std::invalid_argument when entry is not a positive finite price or
// exit is not finite.
double realized_return_pct(double entry_price, double exit_price);

// Classifies a percentage return. Moves with |return| below flat_threshold_pct
// are FLAT.
Direction classify_return(double return_pct, double flat_threshold_pct);

// Return earned by taking the side of an action: buys earn the move, sells
// earn its negation, HOLD earns nothing.
double position_return_pct(Action action, double return_pct);

} // namespace augur::core

#include <augur/core/outcome.hpp>

namespace augur::core {

const char* to_string(OutcomeStatus s) {
    return s == OutcomeStatus::COMPLETE ? "COMPLETE" : "PENDING";
}

bool Outcome::is_complete() const {
    if (!entry_price) {
        return false;
    }
    for (const auto& h : horizons) {
        if (!h.is_filled()) {
            return false;
        }
    }
    return true;
}

} // namespace augur::core

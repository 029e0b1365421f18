#pragma once
#include <augur/core/types.hpp>
#include <augur/utils/time_utils.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace augur::core {

using utils::Timestamp;

enum class OutcomeStatus {
    PENDING,
    COMPLETE
};

const char* to_string(OutcomeStatus s);

// Realized result for one horizon. Empty optionals mean the exit price was not
// available yet; such fields are backfilled exactly once.
struct HorizonOutcome {
    std::optional<double> exit_price;
    std::optional<Timestamp> exit_timestamp;
    std::optional<double> return_pct;
    std::optional<Direction> direction;

    bool is_filled() const { return exit_price.has_value(); }
};

struct Outcome {
    int64_t id = 0;
    int64_t feature_id = 0;         // unique: one outcome per feature
    std::string symbol;
    Timestamp feature_timestamp = 0;
    std::optional<double> entry_price;
    std::array<HorizonOutcome, kHorizonCount> horizons{};
    // Set when the last pending field is filled
    std::optional<Timestamp> recorded_timestamp;
    OutcomeStatus status = OutcomeStatus::PENDING;

    const HorizonOutcome& at(Horizon h) const { return horizons[horizon_index(h)]; }
    HorizonOutcome& at(Horizon h) { return horizons[horizon_index(h)]; }

    bool is_complete() const;
};

} // namespace augur::core

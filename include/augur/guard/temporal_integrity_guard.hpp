#pragma once
#include <augur/core/errors.hpp>
#include <augur/core/types.hpp>
#include <augur/utils/time_utils.hpp>
#include <optional>
#include <string>
#include <vector>

namespace augur::store {
class FeatureStore;
}

namespace augur::guard {

using utils::Timestamp;

/**
 * Pre-flight integrity checks run against the store before each phase.
 *
 * Every check_* method is independent and returns the violations it found
 * (empty when the check passes). The before_* methods bundle the checks each
 * phase needs into one report; enforce() turns a failed report into a
 * TemporalIntegrityViolation.
 */
class TemporalIntegrityGuard {
public:
    explicit TemporalIntegrityGuard(store::FeatureStore& store);

    std::vector<core::Violation> check_no_duplicate_predictions() const;

    // Orphans in either direction. Features are only required to have an
    // outcome once their shortest horizon elapsed at or before maturity_cutoff;
    // without a cutoff only outcome-side orphans are reported.
    std::vector<core::Violation> check_feature_outcome_match(std::optional<Timestamp> maturity_cutoff) const;

    std::vector<core::Violation> check_no_future_leakage() const;
    std::vector<core::Violation> check_schema() const;
    std::vector<core::Violation> check_unique_indexes() const;

    // Evening requires the morning of the same trade day to be the last
    // completed phase.
    std::vector<core::Violation> check_phase_order(int64_t trade_day) const;
    // A morning may not run for a trade day whose evening already completed.
    std::vector<core::Violation> check_morning_order(int64_t trade_day) const;

    core::ViolationReport before_morning(Timestamp now) const;
    core::ViolationReport before_outcome_commit(Timestamp now) const;
    // Count match with cutoff = now, after the evening commit
    core::ViolationReport after_outcome_commit(Timestamp now) const;

    static void enforce(const core::ViolationReport& report);

private:
    store::FeatureStore& store_;

    void run_structural_checks(core::ViolationReport& report) const;
};

} // namespace augur::guard

#pragma once
#include <augur/core/errors.hpp>
#include <augur/utils/time_utils.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace augur::core {

using utils::Timestamp;

struct PhaseStateRecord {
    Phase phase = Phase::MORNING;
    int64_t trade_day = 0;
    Timestamp completed_at = 0;
};

// Machine-readable result of one morning run; one morning_analysis row.
struct MorningSummary {
    Timestamp run_timestamp = 0;
    int64_t trade_day = 0;
    int symbols_requested = 0;
    int symbols_analyzed = 0;
    int features_stored = 0;
    int predictions_made = 0;
    int duplicates_rejected = 0;
    int incomplete_signals = 0;
    int leakage_rejected = 0;
    int degraded_signals = 0;
    int failures = 0;
    bool model_available = false;
    std::string model_version;
    ViolationReport validation;
    bool guard_passed = false;

    int exit_status() const { return guard_passed ? 0 : 2; }
    std::string to_string() const;
};

// Machine-readable result of one evening run; one evening_analysis row.
struct EveningSummary {
    Timestamp run_timestamp = 0;
    int64_t trade_day = 0;
    int outcomes_recorded = 0;
    int outcomes_pending = 0;
    int outcomes_completed = 0;
    int backfills_applied = 0;
    int backfills_rejected = 0;
    int duplicate_outcomes_rejected = 0;
    int failures = 0;
    ViolationReport validation;
    ViolationReport post_commit_validation;
    bool guard_passed = false;

    bool training_skipped = true;
    std::string training_skip_reason;
    int64_t training_samples = 0;
    std::string candidate_version;
    bool model_promoted = false;
    std::string active_version;

    int64_t backtest_trades = 0;
    int64_t backtest_excluded = 0;
    double backtest_win_rate = 0.0;
    double backtest_avg_return = 0.0;
    double backtest_sharpe = 0.0;
    double backtest_max_drawdown = 0.0;

    std::vector<std::string> anomalies;

    int exit_status() const {
        if (!guard_passed) return 2;
        return post_commit_validation.passed() ? 0 : 3;
    }
    std::string to_string() const;
};

} // namespace augur::core

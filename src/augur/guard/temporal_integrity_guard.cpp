#include <augur/guard/temporal_integrity_guard.hpp>
#include <augur/store/feature_store.hpp>
#include <augur/utils/logger.hpp>
#include <utility>

namespace augur::guard {

using core::Violation;
using utils::Logger;

namespace {

const char* const kNoDuplicatePredictions = "no_duplicate_predictions";
const char* const kFeatureOutcomeMatch = "feature_outcome_match";
const char* const kNoFutureLeakage = "no_future_leakage";
const char* const kSchemaPresence = "schema_presence";
const char* const kReferentialIntegrity = "referential_integrity";
const char* const kPhaseOrder = "phase_order";

struct RequiredColumns {
    const char* table;
    std::vector<std::string> columns;
};

const std::vector<RequiredColumns>& required_columns() {
    static const std::vector<RequiredColumns> required = {
        {"enhanced_features", {"symbol", "timestamp", "trade_day", "sentiment_timestamp",
                               "technical_timestamp", "context_timestamp", "feature_version"}},
        {"predictions", {"feature_id", "symbol", "trade_day", "created_timestamp", "optimal_action"}},
        {"enhanced_outcomes", {"feature_id", "prediction_timestamp", "entry_price",
                               "exit_timestamp_1h", "exit_timestamp_4h", "exit_timestamp_1d",
                               "recorded_timestamp", "status"}},
        {"phase_state", {"phase", "trade_day", "completed_at"}},
    };
    return required;
}

struct RequiredIndex {
    const char* table;
    std::vector<std::string> columns;
};

const std::vector<RequiredIndex>& required_indexes() {
    static const std::vector<RequiredIndex> required = {
        {"enhanced_features", {"symbol", "trade_day"}},
        {"predictions", {"symbol", "trade_day"}},
        {"enhanced_outcomes", {"feature_id"}},
    };
    return required;
}

void add_if(std::vector<Violation>& out, const char* check, int64_t rows, std::string detail) {
    if (rows > 0) {
        out.push_back({check, rows, std::move(detail)});
    }
}

void append(core::ViolationReport& report, const char* check, std::vector<Violation> found) {
    report.checks_run.push_back(check);
    for (auto& v : found) {
        report.violations.push_back(std::move(v));
    }
}

} // namespace

TemporalIntegrityGuard::TemporalIntegrityGuard(store::FeatureStore& store) : store_(store) {}

std::vector<Violation> TemporalIntegrityGuard::check_no_duplicate_predictions() const {
    std::vector<Violation> found;
    add_if(found, kNoDuplicatePredictions, store_.duplicate_prediction_rows(),
           "more than one prediction for a (symbol, trade_day)");
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_feature_outcome_match(
        std::optional<Timestamp> maturity_cutoff) const {
    std::vector<Violation> found;
    if (maturity_cutoff) {
        add_if(found, kFeatureOutcomeMatch, store_.features_missing_outcome(*maturity_cutoff),
               "mature features without an outcome (cutoff " + utils::format_iso8601(*maturity_cutoff) + ")");
    }
    add_if(found, kFeatureOutcomeMatch, store_.outcomes_without_feature(),
           "outcomes referencing a missing feature");
    add_if(found, kFeatureOutcomeMatch, store_.features_with_multiple_outcomes(),
           "features with more than one outcome");
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_no_future_leakage() const {
    std::vector<Violation> found;
    add_if(found, kNoFutureLeakage, store_.features_with_future_signals(),
           "features containing a signal newer than the feature");
    add_if(found, kNoFutureLeakage, store_.predictions_with_shifted_timestamp(),
           "predictions whose timestamp differs from their feature");
    add_if(found, kNoFutureLeakage, store_.predictions_without_feature(),
           "predictions referencing a missing feature");
    add_if(found, kNoFutureLeakage, store_.outcomes_exited_before_horizon(),
           "outcomes exited before their horizon elapsed");
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_schema() const {
    std::vector<Violation> found;
    for (const auto& required : required_columns()) {
        auto missing = store_.missing_columns(required.table, required.columns);
        if (missing.empty()) {
            continue;
        }
        std::string detail = std::string(required.table) + " missing:";
        for (const auto& column : missing) {
            detail += " " + column;
        }
        found.push_back({kSchemaPresence, static_cast<int64_t>(missing.size()), detail});
    }
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_unique_indexes() const {
    std::vector<Violation> found;
    for (const auto& required : required_indexes()) {
        if (!store_.has_unique_index(required.table, required.columns)) {
            std::string detail = std::string("no unique index on ") + required.table + "(";
            for (size_t i = 0; i < required.columns.size(); ++i) {
                detail += (i ? ", " : "") + required.columns[i];
            }
            found.push_back({kReferentialIntegrity, 1, detail + ")"});
        }
    }

    // The indexes must also hold for rows written before they existed
    add_if(found, kReferentialIntegrity,
           store_.query_int("SELECT COALESCE(SUM(n), 0) FROM (SELECT COUNT(*) AS n FROM enhanced_features"
                            " GROUP BY symbol, trade_day HAVING COUNT(*) > 1)"),
           "duplicate features for a (symbol, trade_day)");
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_phase_order(int64_t trade_day) const {
    std::vector<Violation> found;
    auto last = store_.last_completed_phase();
    if (!last) {
        found.push_back({kPhaseOrder, 0, "no morning phase completed yet"});
    } else if (last->phase != core::Phase::MORNING) {
        found.push_back({kPhaseOrder, 0, "last completed phase is EVENING; morning must run first"});
    } else if (last->trade_day != trade_day) {
        found.push_back({kPhaseOrder, 0, "last morning ran on day " + std::to_string(last->trade_day)
                                             + ", not " + std::to_string(trade_day)});
    }
    return found;
}

std::vector<Violation> TemporalIntegrityGuard::check_morning_order(int64_t trade_day) const {
    std::vector<Violation> found;
    auto evening = store_.last_completion_of(core::Phase::EVENING);
    if (evening && evening->trade_day >= trade_day) {
        found.push_back({kPhaseOrder, 0, "evening of day " + std::to_string(evening->trade_day)
                                             + " already completed; no morning for day "
                                             + std::to_string(trade_day)});
    }
    return found;
}

void TemporalIntegrityGuard::run_structural_checks(core::ViolationReport& report) const {
    append(report, kSchemaPresence, check_schema());
    append(report, kReferentialIntegrity, check_unique_indexes());
    append(report, kNoDuplicatePredictions, check_no_duplicate_predictions());
    append(report, kNoFutureLeakage, check_no_future_leakage());
}

core::ViolationReport TemporalIntegrityGuard::before_morning(Timestamp now) const {
    core::ViolationReport report;
    report.phase = "MORNING";
    run_structural_checks(report);
    append(report, kPhaseOrder, check_morning_order(store_.trade_day_of(now)));
    append(report, kFeatureOutcomeMatch, check_feature_outcome_match(std::nullopt));

    Logger::info() << "Pre-morning validation at " << utils::format_iso8601(now) << ": "
                   << (report.passed() ? "passed" : report.to_string()) << Logger::endl;
    return report;
}

core::ViolationReport TemporalIntegrityGuard::before_outcome_commit(Timestamp now) const {
    core::ViolationReport report;
    report.phase = "EVENING";
    run_structural_checks(report);
    append(report, kPhaseOrder, check_phase_order(store_.trade_day_of(now)));

    // Features that matured before the previous evening must already have outcomes
    std::optional<Timestamp> cutoff;
    if (auto previous = store_.last_completion_of(core::Phase::EVENING)) {
        cutoff = previous->completed_at;
    }
    append(report, kFeatureOutcomeMatch, check_feature_outcome_match(cutoff));

    Logger::info() << "Pre-commit validation at " << utils::format_iso8601(now) << ": "
                   << (report.passed() ? "passed" : report.to_string()) << Logger::endl;
    return report;
}

core::ViolationReport TemporalIntegrityGuard::after_outcome_commit(Timestamp now) const {
    core::ViolationReport report;
    report.phase = "EVENING_POST_COMMIT";
    append(report, kFeatureOutcomeMatch, check_feature_outcome_match(now));
    append(report, kNoFutureLeakage, check_no_future_leakage());

    if (!report.passed()) {
        Logger::warn() << "Post-commit validation: " << report.to_string() << Logger::endl;
    }
    return report;
}

void TemporalIntegrityGuard::enforce(const core::ViolationReport& report) {
    if (!report.passed()) {
        throw core::TemporalIntegrityViolation(report);
    }
}

} // namespace augur::guard

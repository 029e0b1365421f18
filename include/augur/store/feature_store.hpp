#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/model_version.hpp>
#include <augur/core/outcome.hpp>
#include <augur/core/phase_summary.hpp>
#include <augur/core/prediction.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace augur::store {

using utils::Timestamp;

struct FeatureOutcomePair {
    core::FeatureRecord feature;
    core::Outcome outcome;
};

struct PredictionOutcomePair {
    core::Prediction prediction;
    core::Outcome outcome;
};

/**
 * SQLite-backed append-only store for features, predictions, outcomes, model
 * versions, phase state and run summaries.
 *
 * Uniqueness is enforced by the schema: one feature and one prediction per
 * (symbol, trade day), one outcome per feature_id. Inserts that hit one of
 * those constraints return std::nullopt; any other SQLite failure throws
 * core::StoreError.
 *
 * A store wraps a single connection and is not meant to be shared between
 * threads.
 */
class FeatureStore {
public:
    // path may be ":memory:". utc_offset_minutes defines the calendar day used
    // for the (symbol, trade_day) keys.
    explicit FeatureStore(const std::string& path, int utc_offset_minutes = 0);
    ~FeatureStore();

    FeatureStore(const FeatureStore&) = delete;
    FeatureStore& operator=(const FeatureStore&) = delete;

    // Rolls back on destruction unless commit() was called.
    class Transaction {
    public:
        explicit Transaction(FeatureStore& store);
        ~Transaction();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        FeatureStore& store_;
        bool active_ = true;
    };

    const std::string& path() const { return path_; }
    int64_t trade_day_of(Timestamp ts) const;

    // Features
    std::optional<int64_t> insert_feature(const core::FeatureRecord& record);
    std::optional<core::FeatureRecord> get_feature(int64_t id) const;
    std::vector<core::FeatureRecord> features_for_day(int64_t trade_day) const;
    // Features whose shortest horizon elapsed at or before cutoff and that
    // have no outcome row yet
    std::vector<core::FeatureRecord> features_awaiting_outcome(Timestamp cutoff) const;
    int64_t feature_count() const;

    // Predictions
    std::optional<int64_t> insert_prediction(const core::Prediction& prediction);
    std::optional<core::Prediction> prediction_for_feature(int64_t feature_id) const;
    std::vector<core::Prediction> predictions_for_day(int64_t trade_day) const;
    int64_t prediction_count() const;

    // Outcomes
    std::optional<int64_t> insert_outcome(const core::Outcome& outcome);
    std::optional<core::Outcome> outcome_for_feature(int64_t feature_id) const;
    std::vector<core::Outcome> pending_outcomes() const;
    int64_t outcome_count() const;

    // Each pending field is written at most once; false means it was already set.
    bool backfill_entry_price(int64_t outcome_id, double entry_price);
    bool backfill_horizon(int64_t outcome_id, core::Horizon horizon,
                          const core::HorizonOutcome& value);
    bool mark_outcome_complete(int64_t outcome_id, Timestamp recorded_timestamp);

    // Complete feature/outcome joins with recorded_timestamp <= cutoff, in
    // feature timestamp order
    std::vector<FeatureOutcomePair> complete_pairs(Timestamp cutoff) const;
    std::vector<PredictionOutcomePair> prediction_outcome_pairs() const;

    // Model versions
    void insert_model_version(const core::ModelVersion& version);
    std::optional<core::ModelVersion> get_model_version(const std::string& version_id) const;
    std::vector<core::ModelVersion> model_history() const;
    void activate_model(const std::string& version_id, Timestamp activated_at);
    std::optional<core::ModelVersion> active_model_version() const;

    // Phase state
    void record_phase_completion(const core::PhaseStateRecord& state);
    std::optional<core::PhaseStateRecord> last_completed_phase() const;
    std::optional<core::PhaseStateRecord> last_completion_of(core::Phase phase) const;

    // Run summaries (write-only: reporting reads these, the pipeline does not)
    void record_morning_run(const core::MorningSummary& summary);
    void record_evening_run(const core::EveningSummary& summary);

    // Integrity queries used by the TemporalIntegrityGuard
    int64_t duplicate_prediction_rows() const;
    int64_t features_missing_outcome(Timestamp cutoff) const;
    int64_t outcomes_without_feature() const;
    int64_t features_with_multiple_outcomes() const;
    int64_t features_with_future_signals() const;
    int64_t predictions_with_shifted_timestamp() const;
    int64_t predictions_without_feature() const;
    int64_t outcomes_exited_before_horizon() const;
    std::vector<std::string> missing_columns(const std::string& table,
                                             const std::vector<std::string>& columns) const;
    bool has_unique_index(const std::string& table, const std::vector<std::string>& columns) const;

    // Runs a statement and returns the first column of the first row
    int64_t query_int(const std::string& sql) const;
    void execute(const std::string& sql);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    int utc_offset_minutes_;

    void create_schema();
};

} // namespace augur::store

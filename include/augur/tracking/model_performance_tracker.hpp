#pragma once
#include <augur/core/model_version.hpp>
#include <augur/model/multi_output_predictor.hpp>
#include <augur/store/feature_store.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace augur::tracking {

using utils::Timestamp;

struct TrackerConfig {
    double min_direction_accuracy = 0.60;
    double max_magnitude_mae = 2.0;
    // Actions with at least this many resolved predictions are checked for
    // degenerate win rates
    int64_t anomaly_min_samples = 30;
};

struct PerformanceReport {
    std::string version_id;
    std::array<double, core::kHorizonCount> direction_accuracy{};
    std::array<double, core::kHorizonCount> magnitude_mae{};
    int64_t sample_count = 0;
};

struct ActionWinRate {
    core::Action action = core::Action::HOLD;
    int64_t samples = 0;
    int64_t wins = 0;
    double win_rate = 0.0;
    bool anomalous = false;
};

struct RetrainResult {
    core::ModelVersion version;
    PerformanceReport report;
    bool promoted = false;
    std::string rejection_reason;
    // The fitted candidate, whether promoted or not
    std::shared_ptr<model::MultiOutputPredictor> model;
};

/**
 * Owns model versioning: evaluates candidates on their chronological
 * holdout, applies the promotion gate, records every attempt and rebuilds the
 * active model from the store.
 *
 * retrain() is exclusive; a second concurrent call fails instead of waiting.
 */
class ModelPerformanceTracker {
public:
    ModelPerformanceTracker(store::FeatureStore& store, model::PredictorConfig predictor_config = {},
                            TrackerConfig config = {});

    // Per-horizon direction accuracy and magnitude MAE on the model's holdout
    PerformanceReport evaluate(const model::MultiOutputPredictor& model) const;

    // Empty when the report clears the gate, otherwise the first failing horizon
    std::string gate_failure(const PerformanceReport& report) const;

    // Appends the version row; activates it when the gate passes and throws
    // ModelRejected otherwise.
    void promote(const core::ModelVersion& candidate, const PerformanceReport& report, Timestamp now);

    // Fits a candidate on every complete pair recorded up to now. Throws
    // InsufficientDataError below the sample floor.
    RetrainResult retrain(Timestamp now, uint32_t seed);

    // Refits the active version from its recorded cutoff and seed; nullptr
    // when no version has been activated.
    std::unique_ptr<model::MultiOutputPredictor> load_active() const;

    std::vector<ActionWinRate> win_rates_by_action() const;
    std::vector<std::string> detect_anomalies() const;

    const TrackerConfig& config() const { return config_; }

private:
    store::FeatureStore& store_;
    model::PredictorConfig predictor_config_;
    TrackerConfig config_;
    std::mutex retrain_mutex_;

    std::string next_version_id(Timestamp now) const;
};

} // namespace augur::tracking

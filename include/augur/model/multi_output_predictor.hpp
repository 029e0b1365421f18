#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/prediction.hpp>
#include <augur/model/action_policy.hpp>
#include <augur/model/model_family.hpp>
#include <augur/model/nearest_neighbour_model.hpp>
#include <augur/model/softmax_linear_model.hpp>
#include <augur/model/training_set.hpp>
#include <augur/model/tree_ensemble_model.hpp>
#include <augur/store/feature_store.hpp>
#include <memory>
#include <string>
#include <vector>

namespace augur::model {

struct PredictorConfig {
    size_t min_training_samples = 50;
    // Most recent fraction of the pairs kept out of training for calibration
    // and evaluation
    double holdout_fraction = 0.2;

    double tree_weight = 0.5;
    double linear_weight = 0.25;
    double neighbour_weight = 0.25;

    TreeEnsembleConfig trees;
    SoftmaxLinearConfig linear;
    size_t neighbours = 15;

    ActionThresholds thresholds;
};

/**
 * Weighted ensemble of the three model families producing direction,
 * magnitude and confidence for every horizon plus an optimal action.
 *
 * fit() splits the pairs chronologically: the oldest part trains the
 * families, the newest part (the holdout) fits one softmax temperature per
 * horizon. The same inputs and seed always yield the same model.
 */
class MultiOutputPredictor {
public:
    explicit MultiOutputPredictor(PredictorConfig config = {});

    // Throws InsufficientDataError below min_training_samples complete pairs.
    void fit(const std::vector<store::FeatureOutcomePair>& pairs, uint32_t seed);

    // created_timestamp is the feature's own timestamp.
    core::Prediction predict(const core::FeatureRecord& feature) const;

    bool is_fitted() const { return fitted_; }

    const std::string& version() const { return version_; }
    void set_version(const std::string& version) { version_ = version; }

    const std::vector<store::FeatureOutcomePair>& holdout() const { return holdout_; }
    size_t training_sample_count() const { return training_count_; }
    const std::array<double, core::kHorizonCount>& temperatures() const { return temperatures_; }
    const PredictorConfig& config() const { return config_; }

private:
    struct RawForecast {
        std::array<DirectionProbabilities, core::kHorizonCount> probabilities{};
        std::array<double, core::kHorizonCount> magnitude_pct{};
    };

    PredictorConfig config_;
    FeatureScaler scaler_;
    std::vector<std::pair<std::unique_ptr<ModelFamily>, double>> families_;
    std::array<double, core::kHorizonCount> temperatures_{{1.0, 1.0, 1.0}};
    std::vector<store::FeatureOutcomePair> holdout_;
    size_t training_count_ = 0;
    std::string version_;
    bool fitted_ = false;

    RawForecast combine(const core::FeatureVector& scaled) const;
    void calibrate(const TrainingSet& holdout);
};

// Softmax of log(p) / temperature, renormalized.
DirectionProbabilities apply_temperature(const DirectionProbabilities& p, double temperature);

} // namespace augur::model

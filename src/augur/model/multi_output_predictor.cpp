#include <augur/model/multi_output_predictor.hpp>
#include <augur/core/errors.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace augur::model {

using utils::Logger;

namespace {

constexpr double kMinProbability = 1e-9;
constexpr double kMinTemperature = 0.25;
constexpr double kMaxTemperature = 5.0;
constexpr double kTemperatureStep = 0.05;

size_t argmax(const DirectionProbabilities& p) {
    return static_cast<size_t>(std::max_element(p.begin(), p.end()) - p.begin());
}

core::Direction direction_at(size_t index) {
    switch (index) {
        case 0: return core::Direction::UP;
        case 1: return core::Direction::DOWN;
        default: return core::Direction::FLAT;
    }
}

} // namespace

DirectionProbabilities apply_temperature(const DirectionProbabilities& p, double temperature) {
    DirectionProbabilities out{};
    double max_logit = -std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < core::kDirectionCount; ++c) {
        out[c] = std::log(std::max(p[c], kMinProbability)) / temperature;
        max_logit = std::max(max_logit, out[c]);
    }
    double total = 0.0;
    for (double& v : out) {
        v = std::exp(v - max_logit);
        total += v;
    }
    for (double& v : out) {
        v /= total;
    }
    return out;
}

MultiOutputPredictor::MultiOutputPredictor(PredictorConfig config) : config_(config) {}

void MultiOutputPredictor::fit(const std::vector<store::FeatureOutcomePair>& pairs, uint32_t seed) {
    std::vector<store::FeatureOutcomePair> complete;
    for (const auto& pair : pairs) {
        if (pair.outcome.is_complete()) {
            complete.push_back(pair);
        }
    }

    if (complete.size() < config_.min_training_samples) {
        throw core::InsufficientDataError(static_cast<int64_t>(complete.size()),
                                          static_cast<int64_t>(config_.min_training_samples));
    }

    std::stable_sort(complete.begin(), complete.end(), [](const auto& a, const auto& b) {
        if (a.feature.timestamp != b.feature.timestamp) {
            return a.feature.timestamp < b.feature.timestamp;
        }
        return a.feature.id < b.feature.id;
    });

    size_t holdout_count = static_cast<size_t>(std::floor(complete.size() * config_.holdout_fraction));
    if (config_.holdout_fraction > 0.0) {
        holdout_count = std::max<size_t>(holdout_count, 1);
    }
    holdout_count = std::min(holdout_count, complete.size() - 1);
    const size_t train_count = complete.size() - holdout_count;

    std::vector<store::FeatureOutcomePair> training(complete.begin(), complete.begin() + train_count);
    holdout_.assign(complete.begin() + train_count, complete.end());

    TrainingSet raw_train = make_training_set(training);
    scaler_.fit(raw_train);

    TrainingSet train;
    for (auto sample : raw_train.samples) {
        sample.x = scaler_.transform(sample.x);
        train.samples.push_back(sample);
    }

    families_.clear();
    families_.emplace_back(std::make_unique<TreeEnsembleModel>(config_.trees), config_.tree_weight);
    families_.emplace_back(std::make_unique<SoftmaxLinearModel>(config_.linear), config_.linear_weight);
    families_.emplace_back(std::make_unique<NearestNeighbourModel>(config_.neighbours), config_.neighbour_weight);

    uint32_t family_seed = seed;
    for (auto& family : families_) {
        family.first->fit(train, family_seed++);
    }

    TrainingSet calibration;
    for (auto sample : make_training_set(holdout_).samples) {
        sample.x = scaler_.transform(sample.x);
        calibration.samples.push_back(sample);
    }
    calibrate(calibration);

    training_count_ = train_count;
    fitted_ = true;

    Logger::info() << "Predictor fitted on " << train_count << " samples, holdout " << holdout_count
                   << ", temperatures " << temperatures_[0] << "/" << temperatures_[1] << "/"
                   << temperatures_[2] << Logger::endl;
}

MultiOutputPredictor::RawForecast MultiOutputPredictor::combine(const core::FeatureVector& scaled) const {
    RawForecast raw;
    double total_weight = 0.0;

    for (const auto& [family, weight] : families_) {
        if (weight <= 0.0) {
            continue;
        }
        FamilyOutput out = family->predict(scaled);
        for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
            for (size_t c = 0; c < core::kDirectionCount; ++c) {
                raw.probabilities[hi][c] += weight * out.probabilities[hi][c];
            }
            raw.magnitude_pct[hi] += weight * out.magnitude_pct[hi];
        }
        total_weight += weight;
    }

    if (total_weight <= 0.0) {
        throw std::logic_error("ensemble has no positively weighted family");
    }
    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        for (double& p : raw.probabilities[hi]) {
            p /= total_weight;
        }
        raw.magnitude_pct[hi] /= total_weight;
    }
    return raw;
}

void MultiOutputPredictor::calibrate(const TrainingSet& holdout) {
    temperatures_.fill(1.0);
    if (holdout.empty()) {
        return;
    }

    std::vector<RawForecast> forecasts;
    forecasts.reserve(holdout.size());
    for (const auto& s : holdout.samples) {
        forecasts.push_back(combine(s.x));
    }

    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        double best_nll = std::numeric_limits<double>::infinity();
        double best_t = 1.0;
        const int steps = static_cast<int>(std::round((kMaxTemperature - kMinTemperature) / kTemperatureStep));
        for (int step = 0; step <= steps; ++step) {
            const double t = kMinTemperature + step * kTemperatureStep;
            double nll = 0.0;
            for (size_t i = 0; i < holdout.size(); ++i) {
                const auto p = apply_temperature(forecasts[i].probabilities[hi], t);
                const size_t label = core::direction_index(holdout.samples[i].direction[hi]);
                nll -= std::log(std::max(p[label], kMinProbability));
            }
            if (nll < best_nll - 1e-12) {
                best_nll = nll;
                best_t = t;
            }
        }
        temperatures_[hi] = best_t;
    }
}

core::Prediction MultiOutputPredictor::predict(const core::FeatureRecord& feature) const {
    if (!fitted_) {
        throw std::logic_error("predictor is not fitted");
    }

    const RawForecast raw = combine(scaler_.transform(feature.values));

    core::Prediction prediction;
    prediction.feature_id = feature.id;
    prediction.symbol = feature.symbol;
    prediction.created_timestamp = feature.timestamp;
    prediction.model_version = version_;

    double confidence_sum = 0.0;
    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        core::HorizonForecast& forecast = prediction.horizons[hi];
        forecast.probabilities = apply_temperature(raw.probabilities[hi], temperatures_[hi]);
        const size_t best = argmax(forecast.probabilities);
        forecast.direction = direction_at(best);
        forecast.confidence = forecast.probabilities[best];
        forecast.magnitude_pct = raw.magnitude_pct[hi];
        confidence_sum += forecast.confidence;
    }

    prediction.average_confidence = confidence_sum / core::kHorizonCount;
    prediction.optimal_action = decide_action(prediction.at(core::kLongestHorizon), config_.thresholds);
    return prediction;
}

} // namespace augur::model

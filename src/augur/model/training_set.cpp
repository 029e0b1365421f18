#include <augur/model/training_set.hpp>
#include <algorithm>
#include <cmath>

namespace augur::model {

namespace {

constexpr double kClip = 5.0;

} // namespace

TrainingSet make_training_set(const std::vector<store::FeatureOutcomePair>& pairs) {
    TrainingSet set;
    set.samples.reserve(pairs.size());

    for (const auto& pair : pairs) {
        if (!pair.outcome.is_complete()) {
            continue;
        }
        TrainingSample sample;
        sample.x = pair.feature.values;
        sample.timestamp = pair.feature.timestamp;
        for (core::Horizon h : core::kAllHorizons) {
            const auto& ho = pair.outcome.at(h);
            sample.direction[core::horizon_index(h)] = ho.direction.value_or(core::Direction::FLAT);
            sample.return_pct[core::horizon_index(h)] = ho.return_pct.value_or(0.0);
        }
        set.samples.push_back(sample);
    }
    return set;
}

void FeatureScaler::fit(const TrainingSet& data) {
    mean_.fill(0.0);
    scale_.fill(1.0);
    if (data.empty()) {
        fitted_ = true;
        return;
    }

    const double n = static_cast<double>(data.size());
    for (const auto& s : data.samples) {
        for (size_t j = 0; j < core::kFeatureCount; ++j) {
            mean_[j] += s.x[j] / n;
        }
    }

    core::FeatureVector var{};
    for (const auto& s : data.samples) {
        for (size_t j = 0; j < core::kFeatureCount; ++j) {
            double d = s.x[j] - mean_[j];
            var[j] += d * d / n;
        }
    }

    for (size_t j = 0; j < core::kFeatureCount; ++j) {
        double sd = std::sqrt(var[j]);
        scale_[j] = sd > 1e-9 ? sd : 1.0;
    }
    fitted_ = true;
}

core::FeatureVector FeatureScaler::transform(const core::FeatureVector& x) const {
    core::FeatureVector out{};
    for (size_t j = 0; j < core::kFeatureCount; ++j) {
        out[j] = std::clamp((x[j] - mean_[j]) / scale_[j], -kClip, kClip);
    }
    return out;
}

} // namespace augur::model

#include <augur/model/nearest_neighbour_model.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace augur::model {

NearestNeighbourModel::NearestNeighbourModel(size_t k) : k_(std::max<size_t>(k, 1)) {}

void NearestNeighbourModel::fit(const TrainingSet& data, uint32_t /*seed*/) {
    if (data.empty()) {
        throw std::invalid_argument("nearest neighbour model needs at least one sample");
    }
    data_ = data;
}

FamilyOutput NearestNeighbourModel::predict(const core::FeatureVector& x) const {
    if (data_.empty()) {
        throw std::logic_error("nearest neighbour model is not fitted");
    }

    std::vector<std::pair<double, size_t>> distances;
    distances.reserve(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        double d = 0.0;
        for (size_t j = 0; j < core::kFeatureCount; ++j) {
            double diff = data_.samples[i].x[j] - x[j];
            d += diff * diff;
        }
        distances.emplace_back(std::sqrt(d), i);
    }

    const size_t k = std::min(k_, distances.size());
    std::partial_sort(distances.begin(), distances.begin() + k, distances.end());

    FamilyOutput out;
    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        DirectionProbabilities votes{};
        double magnitude = 0.0;
        double total_weight = 0.0;
        for (size_t n = 0; n < k; ++n) {
            const auto& sample = data_.samples[distances[n].second];
            const double weight = 1.0 / (1.0 + distances[n].first);
            votes[core::direction_index(sample.direction[hi])] += weight;
            magnitude += weight * sample.return_pct[hi];
            total_weight += weight;
        }

        // One pseudo-vote per class avoids hard zeros
        const double smoothing = total_weight / (k + core::kDirectionCount);
        double sum = 0.0;
        for (double& v : votes) {
            v += smoothing;
            sum += v;
        }
        for (double& v : votes) {
            v /= sum;
        }
        out.probabilities[hi] = votes;
        out.magnitude_pct[hi] = magnitude / total_weight;
    }
    return out;
}

} // namespace augur::model

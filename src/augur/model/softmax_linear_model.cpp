#include <augur/model/softmax_linear_model.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace augur::model {

namespace {

constexpr size_t kBias = core::kFeatureCount;

double linear(const std::array<double, core::kFeatureCount + 1>& w, const core::FeatureVector& x) {
    double z = w[kBias];
    for (size_t j = 0; j < core::kFeatureCount; ++j) {
        z += w[j] * x[j];
    }
    return z;
}

} // namespace

SoftmaxLinearModel::SoftmaxLinearModel(SoftmaxLinearConfig config) : config_(config) {}

DirectionProbabilities SoftmaxLinearModel::softmax(const Weights& w, const core::FeatureVector& x) const {
    DirectionProbabilities z{};
    for (size_t c = 0; c < core::kDirectionCount; ++c) {
        z[c] = linear(w[c], x);
    }
    const double max_z = *std::max_element(z.begin(), z.end());
    double total = 0.0;
    for (double& v : z) {
        v = std::exp(v - max_z);
        total += v;
    }
    for (double& v : z) {
        v /= total;
    }
    return z;
}

void SoftmaxLinearModel::fit(const TrainingSet& data, uint32_t seed) {
    if (data.empty()) {
        throw std::invalid_argument("softmax linear model needs at least one sample");
    }

    std::mt19937 rng(seed);
    std::vector<size_t> order(data.size());
    std::iota(order.begin(), order.end(), 0);

    for (auto& w : class_weights_) {
        for (auto& row : w) {
            row.fill(0.0);
        }
    }
    for (auto& w : magnitude_weights_) {
        w.fill(0.0);
    }

    for (int epoch = 0; epoch < config_.epochs; ++epoch) {
        std::shuffle(order.begin(), order.end(), rng);
        // Step size decays so late epochs settle
        const double lr = config_.learning_rate / (1.0 + 0.05 * epoch);

        for (size_t i : order) {
            const auto& s = data.samples[i];
            for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
                Weights& w = class_weights_[hi];
                const DirectionProbabilities p = softmax(w, s.x);
                const size_t label = core::direction_index(s.direction[hi]);

                for (size_t c = 0; c < core::kDirectionCount; ++c) {
                    const double grad = p[c] - (c == label ? 1.0 : 0.0);
                    for (size_t j = 0; j < core::kFeatureCount; ++j) {
                        w[c][j] -= lr * (grad * s.x[j] + config_.l2 * w[c][j]);
                    }
                    w[c][kBias] -= lr * grad;
                }

                RegressionWeights& m = magnitude_weights_[hi];
                const double err = std::clamp(linear(m, s.x) - s.return_pct[hi], -10.0, 10.0);
                for (size_t j = 0; j < core::kFeatureCount; ++j) {
                    m[j] -= lr * (err * s.x[j] + config_.l2 * m[j]) / core::kFeatureCount;
                }
                m[kBias] -= lr * err;
            }
        }
    }

    fitted_ = true;
    utils::Logger::debug() << "Softmax linear model fitted on " << data.size() << " samples" << utils::Logger::endl;
}

FamilyOutput SoftmaxLinearModel::predict(const core::FeatureVector& x) const {
    if (!fitted_) {
        throw std::logic_error("softmax linear model is not fitted");
    }
    FamilyOutput out;
    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        out.probabilities[hi] = softmax(class_weights_[hi], x);
        out.magnitude_pct[hi] = linear(magnitude_weights_[hi], x);
    }
    return out;
}

} // namespace augur::model

#pragma once
#include <augur/model/model_family.hpp>
#include <vector>

namespace augur::model {

struct SoftmaxLinearConfig {
    int epochs = 60;
    double learning_rate = 0.05;
    double l2 = 1e-3;
};

// Multinomial logistic regression for direction and a ridge-penalized linear
// regression for magnitude, both trained by shuffled SGD.
class SoftmaxLinearModel : public ModelFamily {
public:
    explicit SoftmaxLinearModel(SoftmaxLinearConfig config = {});

    std::string name() const override { return "softmax_linear"; }
    void fit(const TrainingSet& data, uint32_t seed) override;
    FamilyOutput predict(const core::FeatureVector& x) const override;
    bool is_fitted() const override { return fitted_; }

private:
    // Row per class, last column is the bias
    using Weights = std::array<std::array<double, core::kFeatureCount + 1>, core::kDirectionCount>;
    using RegressionWeights = std::array<double, core::kFeatureCount + 1>;

    SoftmaxLinearConfig config_;
    std::array<Weights, core::kHorizonCount> class_weights_{};
    std::array<RegressionWeights, core::kHorizonCount> magnitude_weights_{};
    bool fitted_ = false;

    DirectionProbabilities softmax(const Weights& w, const core::FeatureVector& x) const;
};

} // namespace augur::model

#pragma once
#include <augur/model/model_family.hpp>
#include <random>
#include <vector>

namespace augur::model {

struct TreeEnsembleConfig {
    int tree_count = 25;
    int max_depth = 5;
    size_t min_samples_leaf = 5;
    // Features considered per split; 0 means sqrt(feature count)
    size_t features_per_split = 0;
};

// CART tree over standardized features. Classification trees store smoothed
// class frequencies in their leaves, regression trees the mean target.
class DecisionTree {
public:
    struct Node {
        int feature = -1;           // -1 for a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        DirectionProbabilities probabilities{};
        double value = 0.0;
    };

    void fit_classifier(const std::vector<core::FeatureVector>& x, const std::vector<int>& labels,
                        const std::vector<size_t>& rows, const TreeEnsembleConfig& config,
                        std::mt19937& rng);
    void fit_regressor(const std::vector<core::FeatureVector>& x, const std::vector<double>& targets,
                       const std::vector<size_t>& rows, const TreeEnsembleConfig& config,
                       std::mt19937& rng);

    const Node& leaf_for(const core::FeatureVector& x) const;
    size_t node_count() const { return nodes_.size(); }

private:
    std::vector<Node> nodes_;
    bool classify_ = true;

    int build(const std::vector<core::FeatureVector>& x, const std::vector<double>& y,
              std::vector<size_t> rows, int depth, const TreeEnsembleConfig& config, std::mt19937& rng);
    Node make_leaf(const std::vector<double>& y, const std::vector<size_t>& rows) const;
};

// Bagged forest: per horizon, one classification and one regression tree per
// bootstrap sample.
class TreeEnsembleModel : public ModelFamily {
public:
    explicit TreeEnsembleModel(TreeEnsembleConfig config = {});

    std::string name() const override { return "tree_ensemble"; }
    void fit(const TrainingSet& data, uint32_t seed) override;
    FamilyOutput predict(const core::FeatureVector& x) const override;
    bool is_fitted() const override { return fitted_; }

private:
    TreeEnsembleConfig config_;
    std::array<std::vector<DecisionTree>, core::kHorizonCount> classifiers_;
    std::array<std::vector<DecisionTree>, core::kHorizonCount> regressors_;
    bool fitted_ = false;
};

} // namespace augur::model

#include <augur/model/tree_ensemble_model.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace augur::model {

namespace {

// Running statistics of one side of a candidate split
struct SplitSide {
    std::array<double, core::kDirectionCount> counts{};
    double sum = 0.0;
    double sum_sq = 0.0;
    double n = 0.0;

    void add(double y, bool classify) {
        n += 1.0;
        if (classify) {
            counts[static_cast<size_t>(y)] += 1.0;
        } else {
            sum += y;
            sum_sq += y * y;
        }
    }

    void remove(double y, bool classify) {
        n -= 1.0;
        if (classify) {
            counts[static_cast<size_t>(y)] -= 1.0;
        } else {
            sum -= y;
            sum_sq -= y * y;
        }
    }

    // Gini impurity or sum of squared errors, weighted by side size
    double impurity(bool classify) const {
        if (n <= 0.0) {
            return 0.0;
        }
        if (classify) {
            double gini = 1.0;
            for (double c : counts) {
                double p = c / n;
                gini -= p * p;
            }
            return gini * n;
        }
        return sum_sq - sum * sum / n;
    }
};

} // namespace

void DecisionTree::fit_classifier(const std::vector<core::FeatureVector>& x, const std::vector<int>& labels,
                                  const std::vector<size_t>& rows, const TreeEnsembleConfig& config,
                                  std::mt19937& rng) {
    classify_ = true;
    nodes_.clear();
    std::vector<double> y(labels.begin(), labels.end());
    build(x, y, rows, 0, config, rng);
}

void DecisionTree::fit_regressor(const std::vector<core::FeatureVector>& x, const std::vector<double>& targets,
                                 const std::vector<size_t>& rows, const TreeEnsembleConfig& config,
                                 std::mt19937& rng) {
    classify_ = false;
    nodes_.clear();
    build(x, targets, rows, 0, config, rng);
}

DecisionTree::Node DecisionTree::make_leaf(const std::vector<double>& y, const std::vector<size_t>& rows) const {
    Node leaf;
    if (classify_) {
        // Laplace smoothing keeps every class reachable
        std::array<double, core::kDirectionCount> counts{};
        for (size_t r : rows) {
            counts[static_cast<size_t>(y[r])] += 1.0;
        }
        const double total = static_cast<double>(rows.size()) + core::kDirectionCount;
        for (size_t c = 0; c < core::kDirectionCount; ++c) {
            leaf.probabilities[c] = (counts[c] + 1.0) / total;
        }
    } else {
        double sum = 0.0;
        for (size_t r : rows) {
            sum += y[r];
        }
        leaf.value = rows.empty() ? 0.0 : sum / rows.size();
    }
    return leaf;
}

int DecisionTree::build(const std::vector<core::FeatureVector>& x, const std::vector<double>& y,
                        std::vector<size_t> rows, int depth, const TreeEnsembleConfig& config,
                        std::mt19937& rng) {
    const int index = static_cast<int>(nodes_.size());
    nodes_.push_back(make_leaf(y, rows));

    if (depth >= config.max_depth || rows.size() < 2 * config.min_samples_leaf) {
        return index;
    }

    SplitSide all;
    for (size_t r : rows) {
        all.add(y[r], classify_);
    }
    const double parent_impurity = all.impurity(classify_);
    if (parent_impurity <= 1e-12) {
        return index;
    }

    // Random feature subset for this split
    std::vector<size_t> features(core::kFeatureCount);
    std::iota(features.begin(), features.end(), 0);
    std::shuffle(features.begin(), features.end(), rng);
    size_t per_split = config.features_per_split;
    if (per_split == 0) {
        per_split = static_cast<size_t>(std::sqrt(static_cast<double>(core::kFeatureCount)));
    }
    features.resize(std::min(per_split, features.size()));

    double best_impurity = parent_impurity;
    int best_feature = -1;
    double best_threshold = 0.0;

    std::vector<size_t> sorted = rows;
    for (size_t f : features) {
        std::sort(sorted.begin(), sorted.end(), [&](size_t a, size_t b) {
            return x[a][f] < x[b][f] || (x[a][f] == x[b][f] && a < b);
        });

        SplitSide left;
        SplitSide right = all;
        for (size_t i = 0; i + 1 < sorted.size(); ++i) {
            left.add(y[sorted[i]], classify_);
            right.remove(y[sorted[i]], classify_);

            const double here = x[sorted[i]][f];
            const double next = x[sorted[i + 1]][f];
            if (here == next || left.n < config.min_samples_leaf || right.n < config.min_samples_leaf) {
                continue;
            }

            double impurity = left.impurity(classify_) + right.impurity(classify_);
            if (impurity < best_impurity - 1e-12) {
                best_impurity = impurity;
                best_feature = static_cast<int>(f);
                best_threshold = 0.5 * (here + next);
            }
        }
    }

    if (best_feature < 0) {
        return index;
    }

    std::vector<size_t> left_rows;
    std::vector<size_t> right_rows;
    for (size_t r : rows) {
        if (x[r][best_feature] <= best_threshold) {
            left_rows.push_back(r);
        } else {
            right_rows.push_back(r);
        }
    }

    int left = build(x, y, std::move(left_rows), depth + 1, config, rng);
    int right = build(x, y, std::move(right_rows), depth + 1, config, rng);

    Node& node = nodes_[index];
    node.feature = best_feature;
    node.threshold = best_threshold;
    node.left = left;
    node.right = right;
    return index;
}

const DecisionTree::Node& DecisionTree::leaf_for(const core::FeatureVector& x) const {
    if (nodes_.empty()) {
        throw std::logic_error("decision tree is not fitted");
    }
    int current = 0;
    while (nodes_[current].feature >= 0) {
        const Node& node = nodes_[current];
        current = x[node.feature] <= node.threshold ? node.left : node.right;
    }
    return nodes_[current];
}

TreeEnsembleModel::TreeEnsembleModel(TreeEnsembleConfig config) : config_(config) {}

void TreeEnsembleModel::fit(const TrainingSet& data, uint32_t seed) {
    if (data.empty()) {
        throw std::invalid_argument("tree ensemble needs at least one sample");
    }

    std::vector<core::FeatureVector> x;
    x.reserve(data.size());
    for (const auto& s : data.samples) {
        x.push_back(s.x);
    }

    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, data.size() - 1);

    for (core::Horizon h : core::kAllHorizons) {
        const size_t hi = core::horizon_index(h);
        std::vector<int> labels;
        std::vector<double> targets;
        for (const auto& s : data.samples) {
            labels.push_back(static_cast<int>(core::direction_index(s.direction[hi])));
            targets.push_back(s.return_pct[hi]);
        }

        classifiers_[hi].assign(config_.tree_count, DecisionTree());
        regressors_[hi].assign(config_.tree_count, DecisionTree());

        for (int t = 0; t < config_.tree_count; ++t) {
            std::vector<size_t> bootstrap(data.size());
            for (auto& row : bootstrap) {
                row = pick(rng);
            }
            classifiers_[hi][t].fit_classifier(x, labels, bootstrap, config_, rng);
            regressors_[hi][t].fit_regressor(x, targets, bootstrap, config_, rng);
        }
    }

    fitted_ = true;
    utils::Logger::debug() << "Tree ensemble fitted: " << config_.tree_count << " trees per horizon on "
                           << data.size() << " samples" << utils::Logger::endl;
}

FamilyOutput TreeEnsembleModel::predict(const core::FeatureVector& x) const {
    if (!fitted_) {
        throw std::logic_error("tree ensemble is not fitted");
    }

    FamilyOutput out;
    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        DirectionProbabilities probs{};
        for (const auto& tree : classifiers_[hi]) {
            const auto& leaf = tree.leaf_for(x);
            for (size_t c = 0; c < core::kDirectionCount; ++c) {
                probs[c] += leaf.probabilities[c];
            }
        }
        for (double& p : probs) {
            p /= classifiers_[hi].size();
        }
        out.probabilities[hi] = probs;

        double magnitude = 0.0;
        for (const auto& tree : regressors_[hi]) {
            magnitude += tree.leaf_for(x).value;
        }
        out.magnitude_pct[hi] = magnitude / regressors_[hi].size();
    }
    return out;
}

} // namespace augur::model

#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/types.hpp>
#include <augur/store/feature_store.hpp>
#include <array>
#include <vector>

namespace augur::model {

// One supervised example: a feature vector with its realized direction and
// return for every horizon.
struct TrainingSample {
    core::FeatureVector x{};
    std::array<core::Direction, core::kHorizonCount> direction{};
    std::array<double, core::kHorizonCount> return_pct{};
    utils::Timestamp timestamp = 0;
};

struct TrainingSet {
    std::vector<TrainingSample> samples;

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }
};

// Converts complete feature/outcome pairs into samples. Pairs whose outcome
// is not complete are skipped.
TrainingSet make_training_set(const std::vector<store::FeatureOutcomePair>& pairs);

// Per-column standardization fitted on training data. Constant columns pass
// through centred.
class FeatureScaler {
public:
    void fit(const TrainingSet& data);
    core::FeatureVector transform(const core::FeatureVector& x) const;
    bool is_fitted() const { return fitted_; }

private:
    core::FeatureVector mean_{};
    core::FeatureVector scale_{};
    bool fitted_ = false;
};

} // namespace augur::model

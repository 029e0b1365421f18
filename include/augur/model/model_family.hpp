#pragma once
#include <augur/core/feature_record.hpp>
#include <augur/core/types.hpp>
#include <augur/model/training_set.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace augur::model {

using DirectionProbabilities = std::array<double, core::kDirectionCount>;

// Raw (uncalibrated) output of one family for every horizon.
struct FamilyOutput {
    std::array<DirectionProbabilities, core::kHorizonCount> probabilities{};
    std::array<double, core::kHorizonCount> magnitude_pct{};
};

/**
 * One member of the prediction ensemble. Families are fitted on standardized
 * features and must be deterministic for a given training set and seed.
 * predict() is called concurrently from pipeline workers and must not mutate
 * the model.
 */
class ModelFamily {
public:
    virtual ~ModelFamily() = default;

    virtual std::string name() const = 0;
    virtual void fit(const TrainingSet& data, uint32_t seed) = 0;
    virtual FamilyOutput predict(const core::FeatureVector& x) const = 0;
    virtual bool is_fitted() const = 0;
};

} // namespace augur::model

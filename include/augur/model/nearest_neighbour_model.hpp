#pragma once
#include <augur/model/model_family.hpp>
#include <vector>

namespace augur::model {

// Distance-weighted k-nearest-neighbour vote over the training samples.
class NearestNeighbourModel : public ModelFamily {
public:
    explicit NearestNeighbourModel(size_t k = 15);

    std::string name() const override { return "nearest_neighbour"; }
    void fit(const TrainingSet& data, uint32_t seed) override;
    FamilyOutput predict(const core::FeatureVector& x) const override;
    bool is_fitted() const override { return !data_.empty(); }

private:
    size_t k_;
    TrainingSet data_;
};

} // namespace augur::model

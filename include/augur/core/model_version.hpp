#pragma once
#include <augur/core/types.hpp>
#include <augur/utils/time_utils.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace augur::core {

using utils::Timestamp;

enum class ModelStatus {
    ACCEPTED,
    REJECTED
};

const char* to_string(ModelStatus s);

struct ModelVersion {
    std::string version_id;
    Timestamp trained_at = 0;
    // Only outcome rows completed at or before this instant were used for
    // training, which makes the fit reproducible from the store.
    Timestamp training_cutoff = 0;
    uint32_t random_seed = 0;
    std::string feature_schema_hash;
    std::array<double, kHorizonCount> direction_accuracy{};
    std::array<double, kHorizonCount> magnitude_mae{};
    int64_t training_sample_count = 0;
    int64_t evaluation_sample_count = 0;
    ModelStatus status = ModelStatus::REJECTED;
};

} // namespace augur::core

#include <augur/core/model_version.hpp>

namespace augur::core {

const char* to_string(ModelStatus s) {
    return s == ModelStatus::ACCEPTED ? "ACCEPTED" : "REJECTED";
}

} // namespace augur::core

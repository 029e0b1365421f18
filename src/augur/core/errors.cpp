#include <augur/core/errors.hpp>
#include <sstream>
#include <utility>

namespace augur::core {

int64_t ViolationReport::total_affected_rows() const {
    int64_t total = 0;
    for (const auto& v : violations) {
        total += v.affected_rows;
    }
    return total;
}

void ViolationReport::merge(const ViolationReport& other) {
    violations.insert(violations.end(), other.violations.begin(), other.violations.end());
    checks_run.insert(checks_run.end(), other.checks_run.begin(), other.checks_run.end());
}

std::string ViolationReport::to_string() const {
    std::ostringstream out;
    out << (phase.empty() ? "integrity" : phase) << ": "
        << checks_run.size() << " checks, " << violations.size() << " violations";
    for (const auto& v : violations) {
        out << "; " << v.check << " (" << v.affected_rows << " rows)";
        if (!v.detail.empty()) {
            out << ": " << v.detail;
        }
    }
    return out.str();
}

IncompleteSignalError::IncompleteSignalError(const std::string& symbol, const std::string& reason)
    : AugurError("incomplete signal for '" + symbol + "': " + reason), symbol_(symbol) {}

InsufficientDataError::InsufficientDataError(int64_t available, int64_t required)
    : AugurError("insufficient training data: " + std::to_string(available)
                 + " paired samples, " + std::to_string(required) + " required"),
      available_(available), required_(required) {}

namespace {

std::string stale_message(const std::string& symbol, int64_t feature_id,
                          const std::vector<Horizon>& missing, bool entry_missing) {
    std::ostringstream out;
    out << "stale price for " << symbol << " (feature " << feature_id << "):";
    if (entry_missing) {
        out << " entry";
    }
    for (Horizon h : missing) {
        out << " exit_" << horizon_label(h);
    }
    out << " unavailable";
    return out.str();
}

} // namespace

StalePriceError::StalePriceError(const std::string& symbol, int64_t feature_id,
                                 std::vector<Horizon> missing, bool entry_missing)
    : AugurError(stale_message(symbol, feature_id, missing, entry_missing)),
      symbol_(symbol), feature_id_(feature_id), missing_(std::move(missing)),
      entry_missing_(entry_missing) {}

TemporalIntegrityViolation::TemporalIntegrityViolation(ViolationReport report)
    : AugurError("temporal integrity violation: " + report.to_string()),
      report_(std::move(report)) {}

ModelRejected::ModelRejected(ModelVersion candidate, const std::string& reason)
    : AugurError("model " + candidate.version_id + " rejected: " + reason),
      candidate_(std::move(candidate)) {}

} // namespace augur::core

#pragma once
#include <augur/core/model_version.hpp>
#include <augur/core/types.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace augur::core {

// One failed integrity check: its name and how many rows it affects.
struct Violation {
    std::string check;
    int64_t affected_rows = 0;
    std::string detail;
};

struct ViolationReport {
    std::string phase;
    std::vector<Violation> violations;
    std::vector<std::string> checks_run;

    bool passed() const { return violations.empty(); }
    int64_t total_affected_rows() const;
    void merge(const ViolationReport& other);
    std::string to_string() const;
};

class AugurError : public std::runtime_error {
public:
    explicit AugurError(const std::string& message) : std::runtime_error(message) {}
};

// Mandatory inputs missing; the record is discarded.
class IncompleteSignalError : public AugurError {
public:
    IncompleteSignalError(const std::string& symbol, const std::string& reason);
    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// Too few feature/outcome pairs to fit; the prior model stays active.
class InsufficientDataError : public AugurError {
public:
    InsufficientDataError(int64_t available, int64_t required);
    int64_t available() const { return available_; }
    int64_t required() const { return required_; }

private:
    int64_t available_;
    int64_t required_;
};

// Outcome prices missing at horizon elapse; the outcome row stays pending.
class StalePriceError : public AugurError {
public:
    StalePriceError(const std::string& symbol, int64_t feature_id,
                    std::vector<Horizon> missing, bool entry_missing);
    const std::string& symbol() const { return symbol_; }
    int64_t feature_id() const { return feature_id_; }
    const std::vector<Horizon>& missing_horizons() const { return missing_; }
    bool entry_missing() const { return entry_missing_; }

private:
    std::string symbol_;
    int64_t feature_id_;
    std::vector<Horizon> missing_;
    bool entry_missing_;
};

// Duplicate, leakage or referential mismatch; the phase is aborted.
class TemporalIntegrityViolation : public AugurError {
public:
    explicit TemporalIntegrityViolation(ViolationReport report);
    const ViolationReport& report() const { return report_; }

private:
    ViolationReport report_;
};

// Candidate model below the promotion gate; the prior version is retained.
class ModelRejected : public AugurError {
public:
    ModelRejected(ModelVersion candidate, const std::string& reason);
    const ModelVersion& candidate() const { return candidate_; }

private:
    ModelVersion candidate_;
};

// SQLite failure other than an insert rejected by a uniqueness constraint.
class StoreError : public AugurError {
public:
    explicit StoreError(const std::string& message) : AugurError(message) {}
};

} // namespace augur::core

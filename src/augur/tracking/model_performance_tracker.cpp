#include <augur/tracking/model_performance_tracker.hpp>
#include <augur/core/errors.hpp>
#include <augur/core/returns.hpp>
#include <augur/utils/logger.hpp>
#include <cmath>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace augur::tracking {

using utils::Logger;

ModelPerformanceTracker::ModelPerformanceTracker(store::FeatureStore& store,
                                                 model::PredictorConfig predictor_config,
                                                 TrackerConfig config)
    : store_(store), predictor_config_(predictor_config), config_(config) {}

PerformanceReport ModelPerformanceTracker::evaluate(const model::MultiOutputPredictor& model) const {
    PerformanceReport report;
    report.version_id = model.version();

    const auto& holdout = model.holdout();
    std::array<int64_t, core::kHorizonCount> correct{};
    std::array<double, core::kHorizonCount> abs_error{};

    for (const auto& pair : holdout) {
        if (!pair.outcome.is_complete()) {
            continue;
        }
        const core::Prediction prediction = model.predict(pair.feature);
        for (core::Horizon h : core::kAllHorizons) {
            const size_t hi = core::horizon_index(h);
            const auto& actual = pair.outcome.at(h);
            if (prediction.at(h).direction == actual.direction) {
                ++correct[hi];
            }
            abs_error[hi] += std::abs(prediction.at(h).magnitude_pct - *actual.return_pct);
        }
        ++report.sample_count;
    }

    for (size_t hi = 0; hi < core::kHorizonCount; ++hi) {
        if (report.sample_count > 0) {
            report.direction_accuracy[hi] = static_cast<double>(correct[hi]) / report.sample_count;
            report.magnitude_mae[hi] = abs_error[hi] / report.sample_count;
        } else {
            report.direction_accuracy[hi] = 0.0;
            report.magnitude_mae[hi] = std::numeric_limits<double>::infinity();
        }
    }
    return report;
}

std::string ModelPerformanceTracker::gate_failure(const PerformanceReport& report) const {
    if (report.sample_count == 0) {
        return "no holdout samples to evaluate";
    }
    for (core::Horizon h : core::kAllHorizons) {
        const size_t hi = core::horizon_index(h);
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(3);
        if (report.direction_accuracy[hi] < config_.min_direction_accuracy) {
            reason << core::horizon_label(h) << " accuracy " << report.direction_accuracy[hi]
                   << " below " << config_.min_direction_accuracy;
            return reason.str();
        }
        if (report.magnitude_mae[hi] > config_.max_magnitude_mae) {
            reason << core::horizon_label(h) << " MAE " << report.magnitude_mae[hi]
                   << " above " << config_.max_magnitude_mae;
            return reason.str();
        }
    }
    return "";
}

void ModelPerformanceTracker::promote(const core::ModelVersion& candidate, const PerformanceReport& report,
                                      Timestamp now) {
    const std::string failure = gate_failure(report);

    core::ModelVersion version = candidate;
    version.status = failure.empty() ? core::ModelStatus::ACCEPTED : core::ModelStatus::REJECTED;

    store::FeatureStore::Transaction tx(store_);
    store_.insert_model_version(version);
    if (failure.empty()) {
        store_.activate_model(version.version_id, now);
    }
    tx.commit();

    if (!failure.empty()) {
        throw core::ModelRejected(version, failure);
    }
    Logger::info() << "Model " << version.version_id << " promoted to active" << Logger::endl;
}

std::string ModelPerformanceTracker::next_version_id(Timestamp now) const {
    const utils::CivilTime t = utils::to_civil(now);
    std::ostringstream id;
    id << "v" << (store_.model_history().size() + 1) << "_" << std::setfill('0') << std::setw(4) << t.year
       << std::setw(2) << t.month << std::setw(2) << t.day << "T" << std::setw(2) << t.hour
       << std::setw(2) << t.minute << std::setw(2) << t.second;
    return id.str();
}

RetrainResult ModelPerformanceTracker::retrain(Timestamp now, uint32_t seed) {
    std::unique_lock<std::mutex> lock(retrain_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw core::AugurError("retraining already in progress");
    }

    const auto pairs = store_.complete_pairs(now);
    Logger::info() << "Retraining on " << pairs.size() << " complete pairs" << Logger::endl;

    auto candidate = std::make_shared<model::MultiOutputPredictor>(predictor_config_);
    candidate->fit(pairs, seed);
    candidate->set_version(next_version_id(now));

    RetrainResult result;
    result.model = candidate;
    result.report = evaluate(*candidate);

    core::ModelVersion& version = result.version;
    version.version_id = candidate->version();
    version.trained_at = now;
    version.training_cutoff = now;
    version.random_seed = seed;
    version.feature_schema_hash = core::feature_schema_hash();
    version.direction_accuracy = result.report.direction_accuracy;
    version.magnitude_mae = result.report.magnitude_mae;
    version.training_sample_count = static_cast<int64_t>(candidate->training_sample_count());
    version.evaluation_sample_count = result.report.sample_count;

    try {
        promote(version, result.report, now);
        version.status = core::ModelStatus::ACCEPTED;
        result.promoted = true;
    } catch (const core::ModelRejected& e) {
        version.status = core::ModelStatus::REJECTED;
        result.rejection_reason = e.what();
        auto active = store_.active_model_version();
        Logger::warn() << "Candidate " << version.version_id << " rejected (" << e.what() << "), keeping "
                       << (active ? active->version_id : std::string("no active model")) << Logger::endl;
    }
    return result;
}

std::unique_ptr<model::MultiOutputPredictor> ModelPerformanceTracker::load_active() const {
    auto active = store_.active_model_version();
    if (!active) {
        return nullptr;
    }

    if (active->feature_schema_hash != core::feature_schema_hash()) {
        Logger::error() << "Active model " << active->version_id << " was trained on feature schema "
                        << active->feature_schema_hash << ", current is " << core::feature_schema_hash()
                        << Logger::endl;
        return nullptr;
    }

    auto model = std::make_unique<model::MultiOutputPredictor>(predictor_config_);
    model->fit(store_.complete_pairs(active->training_cutoff), active->random_seed);
    model->set_version(active->version_id);

    if (static_cast<int64_t>(model->training_sample_count()) != active->training_sample_count) {
        Logger::warn() << "Rebuilt " << active->version_id << " from " << model->training_sample_count()
                       << " samples, version recorded " << active->training_sample_count << Logger::endl;
    }
    return model;
}

std::vector<ActionWinRate> ModelPerformanceTracker::win_rates_by_action() const {
    std::map<core::Action, ActionWinRate> rates;

    for (const auto& pair : store_.prediction_outcome_pairs()) {
        const core::Action action = pair.prediction.optimal_action;
        if (core::action_side(action) == 0 || !pair.outcome.is_complete()) {
            continue;
        }
        const auto& exit = pair.outcome.at(core::kLongestHorizon);
        const double ret = core::position_return_pct(
            action, core::realized_return_pct(*pair.outcome.entry_price, *exit.exit_price));

        ActionWinRate& rate = rates[action];
        rate.action = action;
        ++rate.samples;
        if (ret > 0.0) {
            ++rate.wins;
        }
    }

    std::vector<ActionWinRate> out;
    for (auto& [action, rate] : rates) {
        rate.win_rate = static_cast<double>(rate.wins) / rate.samples;
        rate.anomalous = rate.samples >= config_.anomaly_min_samples
                         && (rate.wins == 0 || rate.wins == rate.samples);
        out.push_back(rate);
    }
    return out;
}

std::vector<std::string> ModelPerformanceTracker::detect_anomalies() const {
    std::vector<std::string> anomalies;
    for (const auto& rate : win_rates_by_action()) {
        if (!rate.anomalous) {
            continue;
        }
        std::ostringstream message;
        message << core::to_string(rate.action) << " win rate " << std::fixed << std::setprecision(1)
                << rate.win_rate * 100.0 << "% over " << rate.samples << " samples";
        anomalies.push_back(message.str());
        Logger::warn() << "Anomaly: " << message.str() << Logger::endl;
    }
    return anomalies;
}

} // namespace augur::tracking

#include <augur/outcome/outcome_recorder.hpp>
#include <augur/core/errors.hpp>
#include <augur/core/returns.hpp>
#include <augur/store/feature_store.hpp>
#include <augur/utils/logger.hpp>
#include <cmath>
#include <vector>

namespace augur::outcome {

using utils::Logger;

namespace {

bool valid_price(const std::optional<double>& price) {
    return price && std::isfinite(*price) && *price > 0.0;
}

bool elapsed(Timestamp feature_timestamp, core::Horizon h, Timestamp now) {
    return feature_timestamp + core::horizon_seconds(h) <= now;
}

// First valid entry price supplied for any horizon
std::optional<double> entry_from(const HorizonPrices& prices) {
    for (const auto& [horizon, price] : prices) {
        if (valid_price(price.entry)) {
            return price.entry;
        }
    }
    return std::nullopt;
}

} // namespace

OutcomeRecorder::OutcomeRecorder(store::FeatureStore& store, double flat_threshold_pct)
    : store_(store), flat_threshold_pct_(flat_threshold_pct) {}

std::optional<core::HorizonOutcome> OutcomeRecorder::resolve(const std::string& symbol,
                                                             Timestamp feature_timestamp,
                                                             core::Horizon horizon, double entry,
                                                             const HorizonPrice& price) const {
    if (!valid_price(price.exit)) {
        return std::nullopt;
    }

    const Timestamp horizon_end = feature_timestamp + core::horizon_seconds(horizon);
    const Timestamp exit_timestamp = price.exit_timestamp.value_or(horizon_end);
    if (exit_timestamp < horizon_end) {
        Logger::warn() << symbol << " " << core::horizon_label(horizon) << " exit at "
                       << utils::format_iso8601(exit_timestamp) << " precedes horizon end "
                       << utils::format_iso8601(horizon_end) << ", ignored" << Logger::endl;
        return std::nullopt;
    }

    core::HorizonOutcome out;
    out.exit_price = price.exit;
    out.exit_timestamp = exit_timestamp;
    out.return_pct = core::realized_return_pct(entry, *price.exit);
    out.direction = core::classify_return(*out.return_pct, flat_threshold_pct_);
    return out;
}

std::optional<core::Outcome> OutcomeRecorder::record(const core::FeatureRecord& feature,
                                                     const HorizonPrices& prices, Timestamp now) {
    core::Outcome outcome;
    outcome.feature_id = feature.id;
    outcome.symbol = feature.symbol;
    outcome.feature_timestamp = feature.timestamp;
    outcome.entry_price = entry_from(prices);

    std::vector<core::Horizon> missing;
    for (core::Horizon h : core::kAllHorizons) {
        if (!elapsed(feature.timestamp, h, now)) {
            continue;
        }
        auto it = prices.find(h);
        std::optional<core::HorizonOutcome> resolved;
        if (outcome.entry_price && it != prices.end()) {
            resolved = resolve(feature.symbol, feature.timestamp, h, *outcome.entry_price, it->second);
        }
        if (resolved) {
            outcome.at(h) = *resolved;
        } else {
            missing.push_back(h);
        }
    }

    if (outcome.is_complete()) {
        outcome.status = core::OutcomeStatus::COMPLETE;
        outcome.recorded_timestamp = now;
    }

    auto id = store_.insert_outcome(outcome);
    if (!id) {
        return std::nullopt;
    }
    outcome.id = *id;

    const bool entry_missing = !outcome.entry_price.has_value();
    if (!missing.empty() || (entry_missing && elapsed(feature.timestamp, core::kShortestHorizon, now))) {
        throw core::StalePriceError(feature.symbol, feature.id, missing, entry_missing);
    }
    return outcome;
}

BackfillResult OutcomeRecorder::backfill(const core::Outcome& outcome, const HorizonPrices& prices,
                                         Timestamp now) {
    BackfillResult result;
    // Filled fields and the status flip commit together
    store::FeatureStore::Transaction tx(store_);

    std::optional<double> entry = outcome.entry_price;
    const std::optional<double> supplied_entry = entry_from(prices);
    if (supplied_entry) {
        if (store_.backfill_entry_price(outcome.id, *supplied_entry)) {
            ++result.applied;
            entry = supplied_entry;
        } else {
            ++result.rejected;
            Logger::warn() << "Entry price for outcome " << outcome.id
                           << " already set, backfill rejected" << Logger::endl;
        }
    }

    for (core::Horizon h : core::kAllHorizons) {
        auto it = prices.find(h);
        if (it == prices.end() || !entry || !elapsed(outcome.feature_timestamp, h, now)) {
            continue;
        }
        auto resolved = resolve(outcome.symbol, outcome.feature_timestamp, h, *entry, it->second);
        if (!resolved) {
            continue;
        }
        if (store_.backfill_horizon(outcome.id, h, *resolved)) {
            ++result.applied;
        } else {
            ++result.rejected;
            Logger::warn() << core::horizon_label(h) << " exit for outcome " << outcome.id
                           << " already set, backfill rejected" << Logger::endl;
        }
    }

    result.completed = store_.mark_outcome_complete(outcome.id, now);
    tx.commit();
    if (result.completed) {
        Logger::debug() << "Outcome " << outcome.id << " for " << outcome.symbol << " complete"
                        << Logger::endl;
    }
    return result;
}

} // namespace augur::outcome

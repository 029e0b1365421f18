#include <augur/pipeline/daily_pipeline.hpp>
#include <augur/backtest/backtest_engine.hpp>
#include <augur/core/errors.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <future>
#include <utility>

namespace augur::pipeline {

using utils::Logger;

DailyPipeline::DailyPipeline(PipelineConfig config, store::FeatureStore& store, SignalSource& signals,
                             PriceSource& prices)
    : config_(std::move(config)),
      store_(store),
      signals_(signals),
      prices_(prices),
      engineer_(config_.features),
      guard_(store),
      recorder_(store, config_.flat_threshold_pct),
      tracker_(store, config_.predictor, config_.tracker) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

// ---- Morning --------------------------------------------------------------

std::unique_ptr<model::MultiOutputPredictor> DailyPipeline::load_model(core::MorningSummary& summary) {
    std::unique_ptr<model::MultiOutputPredictor> model;
    try {
        model = tracker_.load_active();
    } catch (const core::InsufficientDataError& e) {
        Logger::error() << "Active model could not be rebuilt: " << e.what() << Logger::endl;
    }

    summary.model_available = model != nullptr;
    if (model) {
        summary.model_version = model->version();
        Logger::info() << "Using model " << model->version() << Logger::endl;
    } else {
        Logger::warn() << "No active model, storing features only" << Logger::endl;
    }
    return model;
}

DailyPipeline::SymbolResult DailyPipeline::process_symbol(const std::string& symbol, Timestamp now,
                                                          const std::optional<core::MarketContextSignal>& context,
                                                          const model::MultiOutputPredictor* model) const {
    SymbolResult result;
    result.symbol = symbol;

    try {
        core::SignalBundle bundle;
        bundle.symbol = symbol;
        bundle.as_of = now;
        bundle.context = context;

        try {
            bundle.sentiment = signals_.fetch_sentiment(symbol, now, config_.signal_timeout);
        } catch (const std::exception& e) {
            Logger::warn() << symbol << ": sentiment fetch failed (" << e.what() << "), using defaults"
                           << Logger::endl;
        }
        bundle.technical = signals_.fetch_technical(symbol, now, config_.signal_timeout);

        core::FeatureRecord feature = engineer_.build(symbol, bundle);
        result.degraded = !bundle.sentiment || !context;
        if (model) {
            result.prediction = model->predict(feature);
        }
        result.feature = std::move(feature);
    } catch (const core::IncompleteSignalError& e) {
        result.incomplete = true;
        Logger::warn() << e.what() << Logger::endl;
    } catch (const core::TemporalIntegrityViolation& e) {
        result.leakage = true;
        Logger::error() << symbol << ": " << e.what() << Logger::endl;
    } catch (const std::exception& e) {
        result.failed = true;
        Logger::error() << symbol << ": processing failed: " << e.what() << Logger::endl;
    }
    return result;
}

void DailyPipeline::commit_symbol(const SymbolResult& result, core::MorningSummary& summary) {
    if (result.degraded) ++summary.degraded_signals;
    if (result.incomplete) ++summary.incomplete_signals;
    if (result.leakage) ++summary.leakage_rejected;
    if (result.failed) ++summary.failures;
    if (!result.feature) {
        return;
    }
    ++summary.symbols_analyzed;

    try {
        store::FeatureStore::Transaction tx(store_);

        auto feature_id = store_.insert_feature(*result.feature);
        if (!feature_id) {
            ++summary.duplicates_rejected;
            return;
        }

        bool predicted = false;
        if (result.prediction) {
            core::Prediction prediction = *result.prediction;
            prediction.feature_id = *feature_id;
            if (!store_.insert_prediction(prediction)) {
                ++summary.duplicates_rejected;
                return;
            }
            predicted = true;
        }

        tx.commit();
        ++summary.features_stored;
        if (predicted) {
            ++summary.predictions_made;
            Logger::info() << result.symbol << ": " << core::to_string(result.prediction->optimal_action)
                           << " (confidence " << result.prediction->average_confidence << ")" << Logger::endl;
        }
    } catch (const core::StoreError& e) {
        ++summary.failures;
        Logger::error() << result.symbol << ": commit failed: " << e.what() << Logger::endl;
    }
}

core::MorningSummary DailyPipeline::morning(Timestamp now) {
    core::MorningSummary summary;
    summary.run_timestamp = now;
    summary.trade_day = store_.trade_day_of(now);
    summary.symbols_requested = static_cast<int>(config_.symbols.size());

    Logger::info() << "Morning phase for day " << summary.trade_day << " at " << utils::format_iso8601(now)
                   << ", " << config_.symbols.size() << " symbols" << Logger::endl;

    summary.validation = guard_.before_morning(now);
    summary.guard_passed = summary.validation.passed();
    if (!summary.guard_passed) {
        Logger::error() << "Morning phase blocked: " << summary.validation.to_string() << Logger::endl;
        store_.record_morning_run(summary);
        return summary;
    }

    auto model = load_model(summary);

    // Fetched once and shared by every symbol of this run
    std::optional<core::MarketContextSignal> context;
    try {
        context = signals_.fetch_market_context(now, config_.signal_timeout);
    } catch (const std::exception& e) {
        Logger::warn() << "Market context fetch failed (" << e.what() << "), using defaults" << Logger::endl;
    }

    const auto& symbols = config_.symbols;
    for (size_t start = 0; start < symbols.size(); start += config_.worker_count) {
        const size_t end = std::min(start + config_.worker_count, symbols.size());

        std::vector<std::future<SymbolResult>> futures;
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, &DailyPipeline::process_symbol, this,
                                         symbols[i], now, std::cref(context), model.get()));
        }

        // Commits stay serial and in symbol order
        for (auto& future : futures) {
            commit_symbol(future.get(), summary);
        }
    }

    store_.record_phase_completion({core::Phase::MORNING, summary.trade_day, now});
    store_.record_morning_run(summary);

    Logger::info() << "Morning summary: " << summary.to_string() << Logger::endl;
    return summary;
}

// ---- Evening --------------------------------------------------------------

outcome::HorizonPrices DailyPipeline::collect_prices(const std::string& symbol, Timestamp feature_timestamp,
                                                     const core::Outcome* existing, Timestamp now) {
    std::optional<double> entry;
    if (!existing || !existing->entry_price) {
        auto quote = prices_.quote_at_or_before(symbol, feature_timestamp);
        if (quote && feature_timestamp - quote->timestamp <= config_.max_entry_staleness_seconds) {
            entry = quote->price;
        }
    }

    outcome::HorizonPrices prices;
    for (core::Horizon h : core::kAllHorizons) {
        const Timestamp horizon_end = feature_timestamp + core::horizon_seconds(h);
        if (horizon_end > now || (existing && existing->at(h).is_filled())) {
            continue;
        }
        outcome::HorizonPrice price;
        price.entry = entry;
        if (auto quote = prices_.quote_at_or_after(symbol, horizon_end, now)) {
            price.exit = quote->price;
            price.exit_timestamp = quote->timestamp;
        }
        prices[h] = price;
    }

    // Carries the entry even when no horizon elapsed yet
    if (entry && prices.empty()) {
        prices[core::kShortestHorizon].entry = entry;
    }
    return prices;
}

void DailyPipeline::backfill_outcomes(Timestamp now, core::EveningSummary& summary) {
    for (const auto& pending : store_.pending_outcomes()) {
        try {
            // Empty prices still let a row whose fields are all filled complete
            auto prices = collect_prices(pending.symbol, pending.feature_timestamp, &pending, now);
            auto result = recorder_.backfill(pending, prices, now);
            summary.backfills_applied += result.applied;
            summary.backfills_rejected += result.rejected;
            if (result.completed) {
                ++summary.outcomes_completed;
            }
        } catch (const std::exception& e) {
            ++summary.failures;
            Logger::error() << pending.symbol << ": backfill of outcome " << pending.id << " failed: "
                            << e.what() << Logger::endl;
        }
    }
}

void DailyPipeline::record_outcomes(Timestamp now, core::EveningSummary& summary) {
    for (const auto& feature : store_.features_awaiting_outcome(now)) {
        // A failed lookup still writes the pending row so the feature keeps its outcome
        outcome::HorizonPrices prices;
        try {
            prices = collect_prices(feature.symbol, feature.timestamp, nullptr, now);
        } catch (const std::exception& e) {
            Logger::warn() << feature.symbol << ": price lookup failed: " << e.what() << Logger::endl;
        }

        try {
            auto recorded = recorder_.record(feature, prices, now);
            if (!recorded) {
                ++summary.duplicate_outcomes_rejected;
                continue;
            }
            ++summary.outcomes_recorded;
            if (recorded->is_complete()) {
                ++summary.outcomes_completed;
            }
        } catch (const core::StalePriceError& e) {
            // The row exists and stays pending
            ++summary.outcomes_recorded;
            Logger::warn() << e.what() << Logger::endl;
        } catch (const std::exception& e) {
            ++summary.failures;
            Logger::error() << feature.symbol << ": outcome for feature " << feature.id << " failed: "
                            << e.what() << Logger::endl;
        }
    }
}

void DailyPipeline::retrain_and_backtest(Timestamp now, core::EveningSummary& summary) {
    try {
        auto result = tracker_.retrain(now, config_.model_seed);
        summary.training_skipped = false;
        summary.training_samples = result.version.training_sample_count;
        summary.candidate_version = result.version.version_id;
        summary.model_promoted = result.promoted;

        std::vector<store::PredictionOutcomePair> pairs;
        for (const auto& pair : result.model->holdout()) {
            pairs.push_back({result.model->predict(pair.feature), pair.outcome});
        }
        backtest::BacktestEngine engine(config_.backtest);
        auto backtest = engine.backtest(pairs, result.model->version());

        summary.backtest_trades = backtest.trades;
        summary.backtest_excluded = backtest.excluded;
        summary.backtest_win_rate = backtest.win_rate;
        summary.backtest_avg_return = backtest.avg_return_pct;
        summary.backtest_sharpe = backtest.sharpe_ratio;
        summary.backtest_max_drawdown = backtest.max_drawdown_pct;
    } catch (const core::InsufficientDataError& e) {
        summary.training_skipped = true;
        summary.training_skip_reason = e.what();
        Logger::info() << "Training skipped: " << e.what() << Logger::endl;
    } catch (const core::StoreError& e) {
        ++summary.failures;
        summary.training_skip_reason = e.what();
        Logger::error() << "Training failed: " << e.what() << Logger::endl;
    } catch (const core::AugurError& e) {
        summary.training_skip_reason = e.what();
        Logger::warn() << "Training skipped: " << e.what() << Logger::endl;
    }

    auto active = store_.active_model_version();
    summary.active_version = active ? active->version_id : "";
}

core::EveningSummary DailyPipeline::evening(Timestamp now) {
    core::EveningSummary summary;
    summary.run_timestamp = now;
    summary.trade_day = store_.trade_day_of(now);

    Logger::info() << "Evening phase for day " << summary.trade_day << " at " << utils::format_iso8601(now)
                   << Logger::endl;

    summary.validation = guard_.before_outcome_commit(now);
    summary.guard_passed = summary.validation.passed();
    if (!summary.guard_passed) {
        Logger::error() << "Evening phase blocked: " << summary.validation.to_string() << Logger::endl;
        store_.record_evening_run(summary);
        return summary;
    }

    // Older pending rows first, then rows for features that matured since
    backfill_outcomes(now, summary);
    record_outcomes(now, summary);
    summary.outcomes_pending = static_cast<int>(store_.pending_outcomes().size());

    summary.post_commit_validation = guard_.after_outcome_commit(now);

    retrain_and_backtest(now, summary);
    summary.anomalies = tracker_.detect_anomalies();

    store_.record_phase_completion({core::Phase::EVENING, summary.trade_day, now});
    store_.record_evening_run(summary);

    Logger::info() << "Evening summary: " << summary.to_string() << Logger::endl;
    return summary;
}

} // namespace augur::pipeline

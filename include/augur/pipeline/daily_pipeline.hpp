#pragma once
#include <augur/core/phase_summary.hpp>
#include <augur/core/prediction.hpp>
#include <augur/features/feature_engineer.hpp>
#include <augur/guard/temporal_integrity_guard.hpp>
#include <augur/model/multi_output_predictor.hpp>
#include <augur/outcome/outcome_recorder.hpp>
#include <augur/pipeline/pipeline_config.hpp>
#include <augur/pipeline/signal_source.hpp>
#include <augur/store/feature_store.hpp>
#include <augur/tracking/model_performance_tracker.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace augur::pipeline {

/**
 * The two daily batch phases.
 *
 * morning(): validate, collect signals and predict for every symbol in
 * parallel, then commit each symbol's feature and prediction in its own
 * transaction. Without an active model only features are stored.
 *
 * evening(): validate (including phase order), record and backfill outcomes,
 * re-validate, retrain, backtest the candidate on its holdout and check the
 * live win rates.
 *
 * Both return a summary whose exit_status() is non-zero when the guard
 * blocked the phase.
 */
class DailyPipeline {
public:
    DailyPipeline(PipelineConfig config, store::FeatureStore& store, SignalSource& signals, PriceSource& prices);

    core::MorningSummary morning(Timestamp now);
    core::EveningSummary evening(Timestamp now);

    const PipelineConfig& config() const { return config_; }

private:
    struct SymbolResult {
        std::string symbol;
        std::optional<core::FeatureRecord> feature;
        std::optional<core::Prediction> prediction;
        bool degraded = false;
        bool incomplete = false;
        bool leakage = false;
        bool failed = false;
    };

    PipelineConfig config_;
    store::FeatureStore& store_;
    SignalSource& signals_;
    PriceSource& prices_;
    features::FeatureEngineer engineer_;
    guard::TemporalIntegrityGuard guard_;
    outcome::OutcomeRecorder recorder_;
    tracking::ModelPerformanceTracker tracker_;

    std::unique_ptr<model::MultiOutputPredictor> load_model(core::MorningSummary& summary);

    SymbolResult process_symbol(const std::string& symbol, Timestamp now,
                                const std::optional<core::MarketContextSignal>& context,
                                const model::MultiOutputPredictor* model) const;
    void commit_symbol(const SymbolResult& result, core::MorningSummary& summary);

    outcome::HorizonPrices collect_prices(const std::string& symbol, Timestamp feature_timestamp,
                                          const core::Outcome* existing, Timestamp now);
    void record_outcomes(Timestamp now, core::EveningSummary& summary);
    void backfill_outcomes(Timestamp now, core::EveningSummary& summary);
    void retrain_and_backtest(Timestamp now, core::EveningSummary& summary);
};

} // namespace augur::pipeline

#include <gtest/gtest.h>
#include <augur/core/errors.hpp>
#include <augur/store/feature_store.hpp>

#include <cstdio>
#include <string>

using namespace augur;
using core::Horizon;

namespace {

// 2026-10-19T10:00:00Z
constexpr utils::Timestamp kMorning = 1792404000;

core::FeatureRecord make_feature(const std::string& symbol, utils::Timestamp ts) {
    core::FeatureRecord record;
    record.symbol = symbol;
    record.timestamp = ts;
    record.technical_timestamp = ts - 600;
    record.sentiment_timestamp = ts - 1200;
    record.set(core::FeatureField::RSI, 55.0);
    record.set(core::FeatureField::CURRENT_PRICE, 100.0);
    record.defaulted.set(core::field_index(core::FeatureField::VIX_LEVEL));
    record.quality_score = 1.0 - 1.0 / core::kRawFieldCount;
    return record;
}

core::Prediction make_prediction(int64_t feature_id, const std::string& symbol, utils::Timestamp ts) {
    core::Prediction p;
    p.feature_id = feature_id;
    p.symbol = symbol;
    p.created_timestamp = ts;
    p.model_version = "v1_test";
    for (auto& h : p.horizons) {
        h.direction = core::Direction::UP;
        h.probabilities = {{0.7, 0.2, 0.1}};
        h.magnitude_pct = 1.2;
        h.confidence = 0.7;
    }
    p.optimal_action = core::Action::BUY;
    p.average_confidence = 0.7;
    return p;
}

core::HorizonOutcome filled(Horizon h, utils::Timestamp feature_ts, double entry, double exit) {
    core::HorizonOutcome out;
    out.exit_price = exit;
    out.exit_timestamp = feature_ts + core::horizon_seconds(h);
    out.return_pct = (exit - entry) / entry * 100.0;
    out.direction = exit > entry ? core::Direction::UP : core::Direction::DOWN;
    return out;
}

core::ModelVersion make_version(const std::string& id, core::ModelStatus status) {
    core::ModelVersion v;
    v.version_id = id;
    v.trained_at = kMorning;
    v.training_cutoff = kMorning;
    v.random_seed = 7;
    v.feature_schema_hash = core::feature_schema_hash();
    v.direction_accuracy = {{0.7, 0.65, 0.62}};
    v.magnitude_mae = {{0.5, 0.9, 1.4}};
    v.training_sample_count = 40;
    v.evaluation_sample_count = 10;
    v.status = status;
    return v;
}

} // namespace

class FeatureStoreTest : public ::testing::Test {
protected:
    store::FeatureStore store_{":memory:"};
};

TEST_F(FeatureStoreTest, FeatureRoundTrip) {
    auto feature = make_feature("CBA.AX", kMorning);
    auto id = store_.insert_feature(feature);
    ASSERT_TRUE(id.has_value());

    auto stored = store_.get_feature(*id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->id, *id);
    EXPECT_EQ(stored->symbol, "CBA.AX");
    EXPECT_EQ(stored->timestamp, kMorning);
    EXPECT_EQ(stored->technical_timestamp, kMorning - 600);
    EXPECT_DOUBLE_EQ(stored->get(core::FeatureField::RSI), 55.0);
    EXPECT_TRUE(stored->is_defaulted(core::FeatureField::VIX_LEVEL));
    EXPECT_EQ(stored->defaulted_count(), 1u);

    EXPECT_EQ(store_.features_for_day(store_.trade_day_of(kMorning)).size(), 1u);
}

TEST_F(FeatureStoreTest, SecondFeatureSameDayRejected) {
    ASSERT_TRUE(store_.insert_feature(make_feature("CBA.AX", kMorning)));
    EXPECT_FALSE(store_.insert_feature(make_feature("CBA.AX", kMorning + 3 * 3600)));
    // Another symbol or another day is fine
    EXPECT_TRUE(store_.insert_feature(make_feature("NAB.AX", kMorning)));
    EXPECT_TRUE(store_.insert_feature(make_feature("CBA.AX", kMorning + 86400)));
    EXPECT_EQ(store_.feature_count(), 3);
}

TEST_F(FeatureStoreTest, DuplicatePredictionRejected) {
    auto id = store_.insert_feature(make_feature("WBC.AX", kMorning));
    ASSERT_TRUE(id);
    ASSERT_TRUE(store_.insert_prediction(make_prediction(*id, "WBC.AX", kMorning)));
    EXPECT_FALSE(store_.insert_prediction(make_prediction(*id, "WBC.AX", kMorning)));
    EXPECT_EQ(store_.prediction_count(), 1);

    auto stored = store_.prediction_for_feature(*id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->optimal_action, core::Action::BUY);
    EXPECT_EQ(stored->created_timestamp, kMorning);
    EXPECT_DOUBLE_EQ(stored->at(Horizon::ONE_DAY).probabilities[0], 0.7);
    EXPECT_EQ(stored->model_version, "v1_test");
}

TEST_F(FeatureStoreTest, PredictionForUnknownFeatureThrows) {
    EXPECT_THROW(store_.insert_prediction(make_prediction(999, "ANZ.AX", kMorning)), core::StoreError);
}

TEST_F(FeatureStoreTest, TransactionRollsBackWithoutCommit) {
    {
        store::FeatureStore::Transaction tx(store_);
        ASSERT_TRUE(store_.insert_feature(make_feature("QBE.AX", kMorning)));
    }
    EXPECT_EQ(store_.feature_count(), 0);

    {
        store::FeatureStore::Transaction tx(store_);
        ASSERT_TRUE(store_.insert_feature(make_feature("QBE.AX", kMorning)));
        tx.commit();
    }
    EXPECT_EQ(store_.feature_count(), 1);
}

TEST_F(FeatureStoreTest, OutcomeFieldsBackfillOnce) {
    auto feature_id = store_.insert_feature(make_feature("MQG.AX", kMorning));
    ASSERT_TRUE(feature_id);

    core::Outcome outcome;
    outcome.feature_id = *feature_id;
    outcome.symbol = "MQG.AX";
    outcome.feature_timestamp = kMorning;
    auto outcome_id = store_.insert_outcome(outcome);
    ASSERT_TRUE(outcome_id);

    // Second row for the same feature is refused
    EXPECT_FALSE(store_.insert_outcome(outcome));

    EXPECT_TRUE(store_.backfill_entry_price(*outcome_id, 200.0));
    EXPECT_FALSE(store_.backfill_entry_price(*outcome_id, 201.0));

    EXPECT_TRUE(store_.backfill_horizon(*outcome_id, Horizon::ONE_HOUR,
                                        filled(Horizon::ONE_HOUR, kMorning, 200.0, 202.0)));
    EXPECT_FALSE(store_.backfill_horizon(*outcome_id, Horizon::ONE_HOUR,
                                         filled(Horizon::ONE_HOUR, kMorning, 200.0, 190.0)));
    EXPECT_FALSE(store_.mark_outcome_complete(*outcome_id, kMorning + 90000));

    EXPECT_TRUE(store_.backfill_horizon(*outcome_id, Horizon::FOUR_HOURS,
                                        filled(Horizon::FOUR_HOURS, kMorning, 200.0, 204.0)));
    EXPECT_TRUE(store_.backfill_horizon(*outcome_id, Horizon::ONE_DAY,
                                        filled(Horizon::ONE_DAY, kMorning, 200.0, 198.0)));
    EXPECT_TRUE(store_.mark_outcome_complete(*outcome_id, kMorning + 90000));
    EXPECT_FALSE(store_.mark_outcome_complete(*outcome_id, kMorning + 95000));

    auto stored = store_.outcome_for_feature(*feature_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, core::OutcomeStatus::COMPLETE);
    EXPECT_DOUBLE_EQ(*stored->entry_price, 200.0);
    EXPECT_DOUBLE_EQ(*stored->at(Horizon::ONE_HOUR).exit_price, 202.0);
    EXPECT_EQ(stored->at(Horizon::ONE_DAY).direction, core::Direction::DOWN);
    EXPECT_EQ(*stored->recorded_timestamp, kMorning + 90000);

    // Complete rows are immutable
    EXPECT_FALSE(store_.backfill_horizon(*outcome_id, Horizon::ONE_DAY,
                                         filled(Horizon::ONE_DAY, kMorning, 200.0, 210.0)));
    EXPECT_TRUE(store_.pending_outcomes().empty());
}

TEST_F(FeatureStoreTest, CompletePairsRespectCutoff) {
    auto feature_id = store_.insert_feature(make_feature("SUN.AX", kMorning));
    ASSERT_TRUE(feature_id);

    core::Outcome outcome;
    outcome.feature_id = *feature_id;
    outcome.symbol = "SUN.AX";
    outcome.feature_timestamp = kMorning;
    outcome.entry_price = 10.0;
    for (Horizon h : core::kAllHorizons) {
        outcome.at(h) = filled(h, kMorning, 10.0, 10.5);
    }
    outcome.status = core::OutcomeStatus::COMPLETE;
    outcome.recorded_timestamp = kMorning + 100000;
    ASSERT_TRUE(store_.insert_outcome(outcome));

    EXPECT_TRUE(store_.complete_pairs(kMorning + 99999).empty());
    auto pairs = store_.complete_pairs(kMorning + 100000);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].feature.symbol, "SUN.AX");
    EXPECT_NEAR(*pairs[0].outcome.at(Horizon::ONE_DAY).return_pct, 5.0, 1e-9);
}

TEST_F(FeatureStoreTest, FeaturesAwaitingOutcome) {
    ASSERT_TRUE(store_.insert_feature(make_feature("ANZ.AX", kMorning)));
    EXPECT_TRUE(store_.features_awaiting_outcome(kMorning + 3599).empty());
    EXPECT_EQ(store_.features_awaiting_outcome(kMorning + 3600).size(), 1u);
}

TEST_F(FeatureStoreTest, ModelActivation) {
    EXPECT_FALSE(store_.active_model_version().has_value());

    store_.insert_model_version(make_version("v1", core::ModelStatus::ACCEPTED));
    store_.insert_model_version(make_version("v2", core::ModelStatus::REJECTED));
    EXPECT_THROW(store_.insert_model_version(make_version("v1", core::ModelStatus::ACCEPTED)),
                 core::StoreError);

    EXPECT_THROW(store_.activate_model("v2", kMorning), core::StoreError);
    EXPECT_THROW(store_.activate_model("v9", kMorning), core::StoreError);
    store_.activate_model("v1", kMorning);

    auto active = store_.active_model_version();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->version_id, "v1");
    EXPECT_EQ(active->random_seed, 7u);
    EXPECT_DOUBLE_EQ(active->direction_accuracy[2], 0.62);
    EXPECT_EQ(store_.model_history().size(), 2u);
}

TEST_F(FeatureStoreTest, PhaseState) {
    EXPECT_FALSE(store_.last_completed_phase().has_value());
    store_.record_phase_completion({core::Phase::MORNING, 10, kMorning});
    store_.record_phase_completion({core::Phase::EVENING, 10, kMorning + 36000});

    auto last = store_.last_completed_phase();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->phase, core::Phase::EVENING);

    auto morning = store_.last_completion_of(core::Phase::MORNING);
    ASSERT_TRUE(morning.has_value());
    EXPECT_EQ(morning->completed_at, kMorning);
}

TEST_F(FeatureStoreTest, SchemaIntrospection) {
    EXPECT_TRUE(store_.missing_columns("enhanced_outcomes", {"feature_id", "status"}).empty());
    auto missing = store_.missing_columns("enhanced_outcomes", {"feature_id", "no_such_column"});
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], "no_such_column");

    EXPECT_TRUE(store_.has_unique_index("predictions", {"symbol", "trade_day"}));
    EXPECT_TRUE(store_.has_unique_index("enhanced_features", {"trade_day", "symbol"}));
    EXPECT_TRUE(store_.has_unique_index("enhanced_outcomes", {"feature_id"}));
    EXPECT_FALSE(store_.has_unique_index("predictions", {"symbol"}));
}

TEST(FeatureStoreFileTest, ReopenKeepsRows) {
    const std::string path = ::testing::TempDir() + "augur_store_test.db";
    std::remove(path.c_str());
    {
        store::FeatureStore store(path);
        ASSERT_TRUE(store.insert_feature(make_feature("CBA.AX", kMorning)));
    }
    {
        store::FeatureStore store(path);
        EXPECT_EQ(store.feature_count(), 1);
        EXPECT_FALSE(store.insert_feature(make_feature("CBA.AX", kMorning)));
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

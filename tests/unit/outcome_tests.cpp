#include <gtest/gtest.h>
#include <augur/core/errors.hpp>
#include <augur/core/returns.hpp>
#include <augur/outcome/outcome_recorder.hpp>
#include <augur/store/feature_store.hpp>

using namespace augur;
using core::Horizon;
using outcome::HorizonPrice;
using outcome::HorizonPrices;

namespace {

// 2026-10-19T10:00:00Z
constexpr utils::Timestamp kMorning = 1792404000;
constexpr utils::Timestamp kHour = 3600;

HorizonPrice price(double entry, double exit) {
    HorizonPrice p;
    p.entry = entry;
    p.exit = exit;
    return p;
}

} // namespace

class OutcomeRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        feature_.symbol = "CBA.AX";
        feature_.timestamp = kMorning;
        feature_.technical_timestamp = kMorning - 600;
        feature_.id = *store_.insert_feature(feature_);
    }

    store::FeatureStore store_{":memory:"};
    outcome::OutcomeRecorder recorder_{store_, 0.1};
    core::FeatureRecord feature_;
};

TEST_F(OutcomeRecorderTest, CompleteWhenAllHorizonsElapsed) {
    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(100.0, 101.0);
    prices[Horizon::FOUR_HOURS] = price(100.0, 99.95);
    prices[Horizon::ONE_DAY] = price(100.0, 97.0);

    auto recorded = recorder_.record(feature_, prices, kMorning + 25 * kHour);
    ASSERT_TRUE(recorded.has_value());
    EXPECT_TRUE(recorded->is_complete());
    EXPECT_EQ(recorded->status, core::OutcomeStatus::COMPLETE);
    EXPECT_EQ(*recorded->recorded_timestamp, kMorning + 25 * kHour);

    EXPECT_NEAR(*recorded->at(Horizon::ONE_HOUR).return_pct, 1.0, 1e-9);
    EXPECT_EQ(recorded->at(Horizon::ONE_HOUR).direction, core::Direction::UP);
    EXPECT_EQ(recorded->at(Horizon::FOUR_HOURS).direction, core::Direction::FLAT);
    EXPECT_NEAR(*recorded->at(Horizon::ONE_DAY).return_pct, -3.0, 1e-9);
    EXPECT_EQ(recorded->at(Horizon::ONE_DAY).direction, core::Direction::DOWN);
    // Exit timestamps default to the horizon end
    EXPECT_EQ(*recorded->at(Horizon::ONE_DAY).exit_timestamp, kMorning + 24 * kHour);

    auto stored = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, core::OutcomeStatus::COMPLETE);
}

TEST_F(OutcomeRecorderTest, StoredReturnIsInPercentagePoints) {
    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(30.87, 30.87);
    prices[Horizon::FOUR_HOURS] = price(30.87, 30.10);
    prices[Horizon::ONE_DAY] = price(30.87, 29.55);
    ASSERT_TRUE(recorder_.record(feature_, prices, kMorning + 25 * kHour).has_value());

    auto stored = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_NEAR(*stored->at(Horizon::ONE_DAY).return_pct, -4.2760, 1e-4);
    EXPECT_EQ(stored->at(Horizon::ONE_DAY).direction, core::Direction::DOWN);
    EXPECT_EQ(stored->at(Horizon::ONE_HOUR).direction, core::Direction::FLAT);
}

TEST_F(OutcomeRecorderTest, SecondRecordRejected) {
    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(100.0, 101.0);
    ASSERT_TRUE(recorder_.record(feature_, prices, kMorning + 2 * kHour).has_value());
    EXPECT_FALSE(recorder_.record(feature_, prices, kMorning + 2 * kHour).has_value());
    EXPECT_EQ(store_.outcome_count(), 1);
}

TEST_F(OutcomeRecorderTest, UnelapsedHorizonsStayPending) {
    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(100.0, 102.0);
    prices[Horizon::ONE_DAY] = price(100.0, 150.0);  // not elapsed, ignored

    auto recorded = recorder_.record(feature_, prices, kMorning + 4 * kHour - 1);
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(recorded->status, core::OutcomeStatus::PENDING);
    EXPECT_TRUE(recorded->at(Horizon::ONE_HOUR).is_filled());
    EXPECT_FALSE(recorded->at(Horizon::FOUR_HOURS).is_filled());
    EXPECT_FALSE(recorded->at(Horizon::ONE_DAY).is_filled());
}

TEST_F(OutcomeRecorderTest, StalePriceLeavesPendingRow) {
    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(100.0, 101.0);

    try {
        recorder_.record(feature_, prices, kMorning + 6 * kHour);
        FAIL() << "expected StalePriceError";
    } catch (const core::StalePriceError& e) {
        EXPECT_EQ(e.feature_id(), feature_.id);
        ASSERT_EQ(e.missing_horizons().size(), 1u);
        EXPECT_EQ(e.missing_horizons()[0], Horizon::FOUR_HOURS);
        EXPECT_FALSE(e.entry_missing());
    }

    auto pending = store_.pending_outcomes();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].feature_id, feature_.id);
    EXPECT_TRUE(pending[0].at(Horizon::ONE_HOUR).is_filled());
}

TEST_F(OutcomeRecorderTest, MissingEntryIsStale) {
    EXPECT_THROW(recorder_.record(feature_, {}, kMorning + 2 * kHour), core::StalePriceError);
    auto stored = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->entry_price.has_value());
}

TEST_F(OutcomeRecorderTest, EarlyExitIgnored) {
    HorizonPrices prices;
    HorizonPrice early = price(100.0, 105.0);
    early.exit_timestamp = kMorning + 1800;
    prices[Horizon::ONE_HOUR] = early;

    EXPECT_THROW(recorder_.record(feature_, prices, kMorning + 2 * kHour), core::StalePriceError);
    auto stored = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->at(Horizon::ONE_HOUR).is_filled());
}

TEST_F(OutcomeRecorderTest, BackfillCompletesAndRejectsRepeats) {
    HorizonPrices first;
    first[Horizon::ONE_HOUR] = price(100.0, 101.0);
    first[Horizon::FOUR_HOURS] = price(100.0, 102.0);
    auto recorded = recorder_.record(feature_, first, kMorning + 5 * kHour);
    ASSERT_TRUE(recorded.has_value());
    ASSERT_EQ(recorded->status, core::OutcomeStatus::PENDING);

    const utils::Timestamp next_evening = kMorning + 34 * kHour;
    HorizonPrices later;
    later[Horizon::ONE_DAY].exit = 104.0;
    auto result = recorder_.backfill(*recorded, later, next_evening);
    EXPECT_EQ(result.applied, 1);
    EXPECT_EQ(result.rejected, 0);
    EXPECT_TRUE(result.completed);

    auto stored = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, core::OutcomeStatus::COMPLETE);
    EXPECT_NEAR(*stored->at(Horizon::ONE_DAY).return_pct, 4.0, 1e-9);
    EXPECT_EQ(*stored->recorded_timestamp, next_evening);

    // A second backfill of the same field is refused
    HorizonPrices again;
    again[Horizon::ONE_DAY].exit = 90.0;
    auto repeat = recorder_.backfill(*stored, again, next_evening + kHour);
    EXPECT_EQ(repeat.applied, 0);
    EXPECT_EQ(repeat.rejected, 1);
    EXPECT_FALSE(repeat.completed);

    stored = store_.outcome_for_feature(feature_.id);
    EXPECT_NEAR(*stored->at(Horizon::ONE_DAY).return_pct, 4.0, 1e-9);
}

TEST_F(OutcomeRecorderTest, BackfillCompletesAlreadyFilledRow) {
    HorizonPrices first;
    first[Horizon::ONE_HOUR] = price(100.0, 101.0);
    first[Horizon::FOUR_HOURS] = price(100.0, 102.0);
    auto recorded = recorder_.record(feature_, first, kMorning + 5 * kHour);
    ASSERT_TRUE(recorded.has_value());

    // Last field written without the status flip
    core::HorizonOutcome day;
    day.exit_price = 103.0;
    day.exit_timestamp = kMorning + 24 * kHour;
    day.return_pct = core::realized_return_pct(100.0, 103.0);
    day.direction = core::Direction::UP;
    ASSERT_TRUE(store_.backfill_horizon(recorded->id, Horizon::ONE_DAY, day));
    auto filled = store_.outcome_for_feature(feature_.id);
    ASSERT_EQ(filled->status, core::OutcomeStatus::PENDING);

    auto result = recorder_.backfill(*filled, {}, kMorning + 34 * kHour);
    EXPECT_EQ(result.applied, 0);
    EXPECT_TRUE(result.completed);
    EXPECT_EQ(store_.outcome_for_feature(feature_.id)->status, core::OutcomeStatus::COMPLETE);
    EXPECT_TRUE(store_.pending_outcomes().empty());
}

TEST_F(OutcomeRecorderTest, BackfillSuppliesMissingEntry) {
    EXPECT_THROW(recorder_.record(feature_, {}, kMorning + 2 * kHour), core::StalePriceError);
    auto pending = store_.outcome_for_feature(feature_.id);
    ASSERT_TRUE(pending.has_value());

    HorizonPrices prices;
    prices[Horizon::ONE_HOUR] = price(50.0, 51.0);
    auto result = recorder_.backfill(*pending, prices, kMorning + 2 * kHour);
    EXPECT_EQ(result.applied, 2);
    EXPECT_FALSE(result.completed);

    auto stored = store_.outcome_for_feature(feature_.id);
    EXPECT_DOUBLE_EQ(*stored->entry_price, 50.0);
    EXPECT_NEAR(*stored->at(Horizon::ONE_HOUR).return_pct, 2.0, 1e-9);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

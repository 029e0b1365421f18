#include <gtest/gtest.h>
#include <augur/core/errors.hpp>
#include <augur/guard/temporal_integrity_guard.hpp>
#include <augur/store/feature_store.hpp>

#include <sqlite3.h>

#include <cstdio>
#include <string>

using namespace augur;

namespace {

// 2026-10-19T10:00:00Z
constexpr utils::Timestamp kMorning = 1792404000;

core::FeatureRecord make_feature(const std::string& symbol, utils::Timestamp ts) {
    core::FeatureRecord record;
    record.symbol = symbol;
    record.timestamp = ts;
    record.technical_timestamp = ts - 600;
    return record;
}

core::Prediction make_prediction(int64_t feature_id, const std::string& symbol, utils::Timestamp ts) {
    core::Prediction p;
    p.feature_id = feature_id;
    p.symbol = symbol;
    p.created_timestamp = ts;
    p.model_version = "v1";
    return p;
}

bool has_check(const std::vector<core::Violation>& found, const std::string& check) {
    for (const auto& v : found) {
        if (v.check == check) {
            return true;
        }
    }
    return false;
}

} // namespace

class TemporalIntegrityGuardTest : public ::testing::Test {
protected:
    store::FeatureStore store_{":memory:"};
    guard::TemporalIntegrityGuard guard_{store_};
};

TEST_F(TemporalIntegrityGuardTest, EmptyStorePassesMorning) {
    auto report = guard_.before_morning(kMorning);
    EXPECT_TRUE(report.passed()) << report.to_string();
    EXPECT_FALSE(report.checks_run.empty());
    EXPECT_NO_THROW(guard::TemporalIntegrityGuard::enforce(report));
}

TEST_F(TemporalIntegrityGuardTest, SchemaAndIndexesPresent) {
    EXPECT_TRUE(guard_.check_schema().empty());
    EXPECT_TRUE(guard_.check_unique_indexes().empty());
    EXPECT_TRUE(guard_.check_no_duplicate_predictions().empty());
}

TEST_F(TemporalIntegrityGuardTest, FeatureWithoutOutcomeAfterMaturity) {
    auto id = store_.insert_feature(make_feature("CBA.AX", kMorning));
    ASSERT_TRUE(id);

    // Not mature before the shortest horizon elapses
    EXPECT_TRUE(guard_.check_feature_outcome_match(kMorning + 3599).empty());
    auto found = guard_.check_feature_outcome_match(kMorning + 3600);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].check, "feature_outcome_match");
    EXPECT_EQ(found[0].affected_rows, 1);

    core::Outcome outcome;
    outcome.feature_id = *id;
    outcome.symbol = "CBA.AX";
    outcome.feature_timestamp = kMorning;
    ASSERT_TRUE(store_.insert_outcome(outcome));
    EXPECT_TRUE(guard_.check_feature_outcome_match(kMorning + 3600).empty());
}

TEST_F(TemporalIntegrityGuardTest, OrphanOutcomeDetected) {
    store_.execute("PRAGMA foreign_keys = OFF;");
    store_.execute("INSERT INTO enhanced_outcomes (feature_id, symbol, prediction_timestamp, status)"
                   " VALUES (4242, 'NAB.AX', 1792404000, 'PENDING');");

    auto found = guard_.check_feature_outcome_match(std::nullopt);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].affected_rows, 1);

    auto report = guard_.before_morning(kMorning);
    EXPECT_FALSE(report.passed());
    EXPECT_THROW(guard::TemporalIntegrityGuard::enforce(report), core::TemporalIntegrityViolation);
}

TEST_F(TemporalIntegrityGuardTest, FutureSignalInStoredFeature) {
    auto feature = make_feature("WBC.AX", kMorning);
    feature.sentiment_timestamp = kMorning + 60;
    ASSERT_TRUE(store_.insert_feature(feature));

    auto found = guard_.check_no_future_leakage();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].check, "no_future_leakage");
}

TEST_F(TemporalIntegrityGuardTest, ShiftedPredictionTimestamp) {
    auto id = store_.insert_feature(make_feature("ANZ.AX", kMorning));
    ASSERT_TRUE(id);
    ASSERT_TRUE(store_.insert_prediction(make_prediction(*id, "ANZ.AX", kMorning + 120)));

    EXPECT_TRUE(has_check(guard_.check_no_future_leakage(), "no_future_leakage"));
}

TEST_F(TemporalIntegrityGuardTest, EarlyExitIsLeakage) {
    auto id = store_.insert_feature(make_feature("MQG.AX", kMorning));
    ASSERT_TRUE(id);

    core::Outcome outcome;
    outcome.feature_id = *id;
    outcome.symbol = "MQG.AX";
    outcome.feature_timestamp = kMorning;
    outcome.entry_price = 100.0;
    outcome.at(core::Horizon::ONE_HOUR).exit_price = 101.0;
    outcome.at(core::Horizon::ONE_HOUR).exit_timestamp = kMorning + 1800;
    outcome.at(core::Horizon::ONE_HOUR).return_pct = 1.0;
    outcome.at(core::Horizon::ONE_HOUR).direction = core::Direction::UP;
    ASSERT_TRUE(store_.insert_outcome(outcome));

    auto found = guard_.check_no_future_leakage();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].affected_rows, 1);
}

TEST_F(TemporalIntegrityGuardTest, PhaseOrder) {
    const int64_t day = store_.trade_day_of(kMorning);

    auto found = guard_.check_phase_order(day);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].check, "phase_order");

    store_.record_phase_completion({core::Phase::MORNING, day, kMorning});
    EXPECT_TRUE(guard_.check_phase_order(day).empty());
    EXPECT_FALSE(guard_.check_phase_order(day + 1).empty());

    store_.record_phase_completion({core::Phase::EVENING, day, kMorning + 36000});
    EXPECT_FALSE(guard_.check_phase_order(day).empty());
}

TEST_F(TemporalIntegrityGuardTest, MorningAfterSameDayEveningBlocked) {
    const int64_t day = store_.trade_day_of(kMorning);
    EXPECT_TRUE(guard_.check_morning_order(day).empty());

    store_.record_phase_completion({core::Phase::MORNING, day, kMorning});
    EXPECT_TRUE(guard_.before_morning(kMorning + 600).passed());

    store_.record_phase_completion({core::Phase::EVENING, day, kMorning + 36000});
    auto report = guard_.before_morning(kMorning + 1200);
    EXPECT_FALSE(report.passed());
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].check, "phase_order");

    EXPECT_FALSE(guard_.check_morning_order(day - 1).empty());
    EXPECT_TRUE(guard_.check_morning_order(day + 1).empty());
}

TEST_F(TemporalIntegrityGuardTest, EveningWithoutMorningBlocked) {
    auto report = guard_.before_outcome_commit(kMorning + 36000);
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.phase, "EVENING");
}

TEST_F(TemporalIntegrityGuardTest, AfterCommitUsesNowAsCutoff) {
    ASSERT_TRUE(store_.insert_feature(make_feature("QBE.AX", kMorning)));
    auto report = guard_.after_outcome_commit(kMorning + 7200);
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.total_affected_rows(), 1);
}

TEST(TemporalIntegrityGuardLegacyTest, MissingUniqueIndexAndDuplicates) {
    const std::string path = ::testing::TempDir() + "augur_legacy_guard.db";
    std::remove(path.c_str());

    // A predictions table created before the uniqueness constraint existed
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    const char* legacy =
        "CREATE TABLE predictions (id INTEGER PRIMARY KEY AUTOINCREMENT, feature_id INTEGER NOT NULL,"
        " symbol TEXT NOT NULL, trade_day INTEGER NOT NULL, created_timestamp INTEGER NOT NULL,"
        " optimal_action TEXT NOT NULL);"
        "INSERT INTO predictions (feature_id, symbol, trade_day, created_timestamp, optimal_action)"
        " VALUES (1, 'CBA.AX', 20745, 1792404000, 'BUY');"
        "INSERT INTO predictions (feature_id, symbol, trade_day, created_timestamp, optimal_action)"
        " VALUES (2, 'CBA.AX', 20745, 1792407600, 'SELL');";
    ASSERT_EQ(sqlite3_exec(db, legacy, nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    {
        store::FeatureStore store(path);
        guard::TemporalIntegrityGuard guard(store);

        auto indexes = guard.check_unique_indexes();
        EXPECT_TRUE(has_check(indexes, "referential_integrity"));

        auto duplicates = guard.check_no_duplicate_predictions();
        ASSERT_EQ(duplicates.size(), 1u);
        EXPECT_EQ(duplicates[0].affected_rows, 2);

        EXPECT_FALSE(guard.before_morning(kMorning).passed());
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include <augur/core/errors.hpp>
#include <augur/model/action_policy.hpp>
#include <augur/model/multi_output_predictor.hpp>
#include <augur/model/nearest_neighbour_model.hpp>
#include <augur/model/softmax_linear_model.hpp>
#include <augur/model/training_set.hpp>
#include <augur/model/tree_ensemble_model.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

using namespace augur;
using model::FeatureScaler;
using model::TrainingSet;
using core::Direction;
using core::FeatureField;
using core::Horizon;

namespace {

constexpr utils::Timestamp kStart = 1792404000;

// Sign of the move for sample i; features lean the same way
double side_of(size_t i) {
    return (i * 7 + i / 3) % 2 == 0 ? 1.0 : -1.0;
}

store::FeatureOutcomePair make_pair(size_t i) {
    const double s = side_of(i);
    const utils::Timestamp ts = kStart + static_cast<utils::Timestamp>(i) * 3600;

    store::FeatureOutcomePair pair;
    pair.feature.id = static_cast<int64_t>(i + 1);
    pair.feature.symbol = "SYM" + std::to_string(i % 5);
    pair.feature.timestamp = ts;
    pair.feature.set(FeatureField::SENTIMENT_SCORE, 0.4 * s);
    pair.feature.set(FeatureField::RSI, 50.0 + 15.0 * s);
    pair.feature.set(FeatureField::MACD_HISTOGRAM, 0.2 * s);
    pair.feature.set(FeatureField::PRICE_CHANGE_1D, 0.8 * s);
    pair.feature.set(FeatureField::VIX_LEVEL, 15.0 + static_cast<double>(i % 4));
    pair.feature.set(FeatureField::HOUR_OF_DAY, static_cast<double>(i % 6));

    pair.outcome.feature_id = pair.feature.id;
    pair.outcome.symbol = pair.feature.symbol;
    pair.outcome.feature_timestamp = ts;
    pair.outcome.entry_price = 100.0;
    const double moves[] = {0.5, 0.8, 1.0};
    for (Horizon h : core::kAllHorizons) {
        auto& out = pair.outcome.at(h);
        const double ret = moves[core::horizon_index(h)] * s;
        out.exit_price = 100.0 * (1.0 + ret / 100.0);
        out.exit_timestamp = ts + core::horizon_seconds(h);
        out.return_pct = ret;
        out.direction = s > 0 ? Direction::UP : Direction::DOWN;
    }
    pair.outcome.status = core::OutcomeStatus::COMPLETE;
    pair.outcome.recorded_timestamp = ts + core::horizon_seconds(core::kLongestHorizon);
    return pair;
}

std::vector<store::FeatureOutcomePair> make_pairs(size_t n) {
    std::vector<store::FeatureOutcomePair> pairs;
    for (size_t i = 0; i < n; ++i) {
        pairs.push_back(make_pair(i));
    }
    return pairs;
}

TrainingSet scaled_set(const std::vector<store::FeatureOutcomePair>& pairs, FeatureScaler& scaler) {
    TrainingSet raw = model::make_training_set(pairs);
    scaler.fit(raw);
    for (auto& sample : raw.samples) {
        sample.x = scaler.transform(sample.x);
    }
    return raw;
}

double probability_sum(const model::DirectionProbabilities& p) {
    return std::accumulate(p.begin(), p.end(), 0.0);
}

} // namespace

TEST(ActionPolicyTest, DecisionTable) {
    model::ActionThresholds thresholds;
    core::HorizonForecast f;

    f.direction = Direction::UP;
    f.confidence = 0.85;
    f.magnitude_pct = 2.5;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::STRONG_BUY);

    f.magnitude_pct = 1.0;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::BUY);

    f.confidence = 0.65;
    f.magnitude_pct = 3.0;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::BUY);

    f.confidence = 0.55;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::HOLD);

    f.confidence = 0.7;
    f.magnitude_pct = 0.4;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::HOLD);

    f.direction = Direction::DOWN;
    f.confidence = 0.9;
    f.magnitude_pct = -2.0;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::STRONG_SELL);

    f.magnitude_pct = -0.5;
    f.confidence = 0.6;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::SELL);

    f.direction = Direction::FLAT;
    f.confidence = 0.99;
    f.magnitude_pct = 5.0;
    EXPECT_EQ(model::decide_action(f, thresholds), core::Action::HOLD);
}

TEST(TrainingSetTest, SkipsIncompleteOutcomes) {
    auto pairs = make_pairs(4);
    pairs[2].outcome.at(Horizon::ONE_DAY).exit_price.reset();
    pairs[2].outcome.status = core::OutcomeStatus::PENDING;

    TrainingSet set = model::make_training_set(pairs);
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set.samples[0].direction[core::horizon_index(Horizon::ONE_DAY)], Direction::UP);
    EXPECT_DOUBLE_EQ(set.samples[0].return_pct[core::horizon_index(Horizon::ONE_HOUR)], 0.5);
}

TEST(TrainingSetTest, ScalerStandardizes) {
    FeatureScaler scaler;
    TrainingSet set = scaled_set(make_pairs(40), scaler);
    ASSERT_TRUE(scaler.is_fitted());

    const size_t rsi = core::field_index(FeatureField::RSI);
    double mean = 0.0;
    for (const auto& s : set.samples) {
        mean += s.x[rsi];
    }
    EXPECT_NEAR(mean / set.size(), 0.0, 1e-9);

    // Constant columns end up at zero
    const size_t breadth = core::field_index(FeatureField::MARKET_BREADTH);
    EXPECT_DOUBLE_EQ(set.samples[5].x[breadth], 0.0);
}

TEST(ModelFamilyTest, EachFamilySeparatesCleanData) {
    FeatureScaler scaler;
    TrainingSet train = scaled_set(make_pairs(60), scaler);

    std::vector<std::unique_ptr<model::ModelFamily>> families;
    families.push_back(std::make_unique<model::TreeEnsembleModel>());
    families.push_back(std::make_unique<model::SoftmaxLinearModel>());
    families.push_back(std::make_unique<model::NearestNeighbourModel>(5));

    const auto up = scaler.transform(make_pair(0).feature.values);
    ASSERT_GT(side_of(0), 0.0);

    for (auto& family : families) {
        EXPECT_FALSE(family->is_fitted());
        family->fit(train, 11);
        ASSERT_TRUE(family->is_fitted()) << family->name();

        auto out = family->predict(up);
        for (const auto& p : out.probabilities) {
            EXPECT_NEAR(probability_sum(p), 1.0, 1e-9) << family->name();
        }
        const auto& day = out.probabilities[core::horizon_index(Horizon::ONE_DAY)];
        EXPECT_GT(day[core::direction_index(Direction::UP)], day[core::direction_index(Direction::DOWN)])
            << family->name();
        EXPECT_GT(out.magnitude_pct[core::horizon_index(Horizon::ONE_DAY)], 0.0) << family->name();
    }
}

TEST(MultiOutputPredictorTest, InsufficientData) {
    model::MultiOutputPredictor predictor;
    try {
        predictor.fit(make_pairs(49), 42);
        FAIL() << "expected InsufficientDataError";
    } catch (const core::InsufficientDataError& e) {
        EXPECT_EQ(e.available(), 49);
        EXPECT_EQ(e.required(), 50);
    }
    EXPECT_FALSE(predictor.is_fitted());
}

TEST(MultiOutputPredictorTest, ChronologicalHoldout) {
    auto pairs = make_pairs(60);
    std::reverse(pairs.begin(), pairs.end());

    model::MultiOutputPredictor predictor;
    predictor.fit(pairs, 42);
    EXPECT_EQ(predictor.training_sample_count(), 48u);
    ASSERT_EQ(predictor.holdout().size(), 12u);
    // The holdout is the newest slice
    for (const auto& pair : predictor.holdout()) {
        EXPECT_GE(pair.feature.timestamp, kStart + 48 * 3600);
    }
    for (double t : predictor.temperatures()) {
        EXPECT_GT(t, 0.0);
    }
}

TEST(MultiOutputPredictorTest, PredictionShape) {
    model::MultiOutputPredictor predictor;
    predictor.fit(make_pairs(60), 42);
    predictor.set_version("v1_test");

    auto feature = make_pair(61).feature;
    auto prediction = predictor.predict(feature);

    EXPECT_EQ(prediction.created_timestamp, feature.timestamp);
    EXPECT_EQ(prediction.symbol, feature.symbol);
    EXPECT_EQ(prediction.model_version, "v1_test");

    double confidence_sum = 0.0;
    for (const auto& h : prediction.horizons) {
        EXPECT_NEAR(probability_sum(h.probabilities), 1.0, 1e-9);
        EXPECT_DOUBLE_EQ(h.confidence, h.probabilities[core::direction_index(h.direction)]);
        EXPECT_GE(h.confidence, 1.0 / 3.0);
        confidence_sum += h.confidence;
    }
    EXPECT_NEAR(prediction.average_confidence, confidence_sum / 3.0, 1e-12);
    EXPECT_EQ(prediction.optimal_action,
              model::decide_action(prediction.at(Horizon::ONE_DAY), predictor.config().thresholds));

    const Direction expected = side_of(61) > 0 ? Direction::UP : Direction::DOWN;
    EXPECT_EQ(prediction.at(Horizon::ONE_DAY).direction, expected);
}

TEST(MultiOutputPredictorTest, DeterministicForSeed) {
    const auto pairs = make_pairs(70);
    model::MultiOutputPredictor a;
    model::MultiOutputPredictor b;
    a.fit(pairs, 7);
    b.fit(pairs, 7);

    for (size_t i = 70; i < 80; ++i) {
        auto feature = make_pair(i).feature;
        auto pa = a.predict(feature);
        auto pb = b.predict(feature);
        EXPECT_EQ(pa.optimal_action, pb.optimal_action);
        for (size_t h = 0; h < core::kHorizonCount; ++h) {
            EXPECT_EQ(pa.horizons[h].probabilities, pb.horizons[h].probabilities);
            EXPECT_EQ(pa.horizons[h].magnitude_pct, pb.horizons[h].magnitude_pct);
        }
    }
}

TEST(MultiOutputPredictorTest, PredictBeforeFitThrows) {
    model::MultiOutputPredictor predictor;
    EXPECT_THROW(predictor.predict(make_pair(0).feature), std::logic_error);
}

TEST(TemperatureTest, ScalesSharpness) {
    model::DirectionProbabilities p{{0.6, 0.3, 0.1}};

    auto same = model::apply_temperature(p, 1.0);
    for (size_t i = 0; i < p.size(); ++i) {
        EXPECT_NEAR(same[i], p[i], 1e-12);
    }

    auto sharper = model::apply_temperature(p, 0.5);
    auto flatter = model::apply_temperature(p, 3.0);
    EXPECT_GT(sharper[0], p[0]);
    EXPECT_LT(flatter[0], p[0]);
    EXPECT_NEAR(probability_sum(sharper), 1.0, 1e-12);
    EXPECT_NEAR(probability_sum(flatter), 1.0, 1e-12);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

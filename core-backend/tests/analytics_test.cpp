#include <gtest/gtest.h>

#include "analytics/analytics_engine.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

// ============================================================================
// 数值工具
// ============================================================================

TEST(AnalyticsMathTest, ImpliedProbability) {
  EXPECT_DOUBLE_EQ(*analytics::implied_probability(2.0), 0.5);
  EXPECT_NEAR(*analytics::implied_probability(1.3), 0.769230769, 1e-9);
  EXPECT_FALSE(analytics::implied_probability(0.0));
  EXPECT_FALSE(analytics::implied_probability(-1.5));
}

TEST(AnalyticsMathTest, ExpectedValueAndKelly) {
  EXPECT_NEAR(analytics::expected_value(0.62, 2.0), 0.24, 1e-12);
  EXPECT_NEAR(analytics::kelly_fraction(0.62, 2.0), 0.24, 1e-12);
  EXPECT_NEAR(analytics::expected_value(0.3, 3.52), 0.056, 1e-12);
}

TEST(AnalyticsMathTest, KellyIsClamped) {
  EXPECT_DOUBLE_EQ(analytics::kelly_fraction(0.1, 2.0), 0.0);
  EXPECT_DOUBLE_EQ(analytics::kelly_fraction(1.0, 1.5), 1.0);
  EXPECT_DOUBLE_EQ(analytics::kelly_fraction(0.9, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(analytics::kelly_fraction(0.9, 0.5), 0.0);
}

TEST(AnalyticsMathTest, ParsesScorelineKeys) {
  auto s = analytics::parse_scoreline("(2, 1)");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->first, 2);
  EXPECT_EQ(s->second, 1);
  EXPECT_TRUE(analytics::parse_scoreline("(0,2)"));
  EXPECT_FALSE(analytics::parse_scoreline("2-1"));
  EXPECT_FALSE(analytics::parse_scoreline("(2, 1"));
  EXPECT_FALSE(analytics::parse_scoreline("(a, 1)"));
  EXPECT_FALSE(analytics::parse_scoreline("(99999999999999999999, 1)"));
  EXPECT_EQ(analytics::parse_scoreline("(999999999, 0)")->first, 999999999);
}

TEST(AnalyticsMathTest, EstimatesProbabilities) {
  auto explicit_est = analytics::estimate_probabilities(
      {{"team1_win_probability", 0.62}, {"team2_win_probability", 0.38}});
  EXPECT_DOUBLE_EQ(*explicit_est.team1, 0.62);
  EXPECT_DOUBLE_EQ(*explicit_est.team2, 0.38);

  auto proximity = analytics::estimate_probabilities(prediction_payload());
  EXPECT_NEAR(*proximity.team1, 0.7, 1e-12);
  EXPECT_NEAR(*proximity.team2, 0.3, 1e-12);

  EXPECT_TRUE(analytics::estimate_probabilities({{"id", 1}}).empty());
  EXPECT_TRUE(analytics::estimate_probabilities(json("x")).empty());
}

// ============================================================================
// Engine
// ============================================================================

class AnalyticsEngineTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    engine = std::make_unique<analytics::Engine>(*store);
  }

  json explicit_prediction(double team1, double team2) {
    json p = prediction_payload();
    p["team1_win_probability"] = team1;
    p["team2_win_probability"] = team2;
    return p;
  }

  std::unique_ptr<analytics::Engine> engine;
};

TEST_F(AnalyticsEngineTest, CorrectPredictionOnFinishedMatch) {
  json payload = finished_match(103084, 2, 0);
  payload["ai_predictions"] = prediction_payload();
  std::string id = coordinator->ingest_match(payload, "bo3");

  auto r = engine->compare_outcome(id);
  ASSERT_TRUE(r.applicable) << r.reason;
  EXPECT_TRUE(r.correct);
  EXPECT_EQ(r.predicted_winner_team_id, store->find_team_by_source("bo3", 736)->id);
  EXPECT_EQ(r.actual_winner_team_id, r.predicted_winner_team_id);
  EXPECT_NEAR(*r.confidence, 0.510284162196592, 1e-12);
  EXPECT_EQ(r.score_correct, true);
  EXPECT_EQ(r.to_json()["correct"], true);
}

TEST_F(AnalyticsEngineTest, WrongPredictionOnFinishedMatch) {
  json payload = finished_match(103084, 1, 2);
  payload["ai_predictions"] = prediction_payload();
  std::string id = coordinator->ingest_match(payload, "bo3");

  auto r = engine->compare_outcome(id);
  ASSERT_TRUE(r.applicable);
  EXPECT_FALSE(r.correct);
  EXPECT_EQ(r.score_correct, false);
}

TEST_F(AnalyticsEngineTest, ComparisonNotApplicable) {
  json upcoming = upcoming_match(1);
  upcoming["ai_predictions"] = prediction_payload();
  std::string pending = coordinator->ingest_match(upcoming, "bo3");
  std::string unpredicted = coordinator->ingest_match(finished_match(2), "bo3");

  auto r1 = engine->compare_outcome(pending);
  EXPECT_FALSE(r1.applicable);
  EXPECT_FALSE(r1.reason.empty());
  EXPECT_FALSE(engine->compare_outcome(unpredicted).applicable);
  EXPECT_EQ(r1.to_json()["applicable"], false);
}

TEST_F(AnalyticsEngineTest, PrefersPredictionFromMatchSource) {
  json payload = finished_match(103084, 2, 0);
  payload["ai_predictions"] = prediction_payload();
  std::string id = coordinator->ingest_match(payload, "bo3");

  {
    Database::Transaction txn(*db);
    json other = prediction_payload();
    other["prediction_winner_team_id"] = 7631;
    store->upsert_prediction(txn, {{"match_id", id}, {"source_type", "aaa"}, {"prediction_payload", other}});
    txn.commit();
  }

  auto r = engine->compare_outcome(id);
  ASSERT_TRUE(r.applicable);
  EXPECT_EQ(r.prediction_source_type, "bo3");
  EXPECT_TRUE(r.correct);
}

TEST_F(AnalyticsEngineTest, UnknownMatchIsNotFound) {
  EXPECT_THROW(engine->compare_outcome("missing"), NotFoundError);
  EXPECT_THROW(engine->evaluate_value_bets("missing", 0.0), NotFoundError);
}

TEST_F(AnalyticsEngineTest, ValueBetThresholdFiltersCandidates) {
  json payload = upcoming_match();
  payload["ai_predictions"] = explicit_prediction(0.62, 0.38);
  payload["bet_updates"] = json::array({odds_payload("evenbook", 2.0, 2.0), odds_payload("shortbook", 1.7, 2.2)});
  std::string id = coordinator->ingest_match(payload, "bo3");

  auto bets = engine->evaluate_value_bets(id, 0.1);
  ASSERT_EQ(bets.size(), 1u);
  EXPECT_EQ(bets[0].provider, "evenbook");
  EXPECT_EQ(bets[0].side, 1);
  EXPECT_EQ(bets[0].team_id, store->find_team_by_source("bo3", 736)->id);
  EXPECT_NEAR(bets[0].expected_value, 0.24, 1e-9);
  EXPECT_NEAR(bets[0].kelly_fraction, 0.24, 1e-9);
  EXPECT_DOUBLE_EQ(bets[0].implied_probability, 0.5);
  EXPECT_DOUBLE_EQ(bets[0].estimated_probability, 0.62);

  // EV 0.054 的 shortbook 只有阈值放低时才出现, 且排在后面
  auto loose = engine->evaluate_value_bets(id, 0.0);
  ASSERT_EQ(loose.size(), 2u);
  EXPECT_EQ(loose[0].provider, "evenbook");
  EXPECT_EQ(loose[1].provider, "shortbook");
  EXPECT_NEAR(loose[1].expected_value, 0.054, 1e-9);
}

TEST_F(AnalyticsEngineTest, ValueBetsFromProximityFactors) {
  json payload = upcoming_match();
  payload["ai_predictions"] = prediction_payload();
  payload["bet_updates"] = odds_payload("1xbit", 1.3, 3.52);
  std::string id = coordinator->ingest_match(payload, "bo3");

  auto bets = engine->evaluate_value_bets(id, 0.0);
  ASSERT_EQ(bets.size(), 1u);
  EXPECT_EQ(bets[0].side, 2);
  EXPECT_NEAR(bets[0].estimated_probability, 0.3, 1e-12);
  EXPECT_NEAR(bets[0].expected_value, 0.056, 1e-9);
  EXPECT_NEAR(bets[0].kelly_fraction, 0.056 / 2.52, 1e-9);
  EXPECT_EQ(bets[0].to_json()["side"], "team2");
}

TEST_F(AnalyticsEngineTest, OddsAtOrBelowOneAreSkipped) {
  json payload = upcoming_match();
  payload["ai_predictions"] = explicit_prediction(0.99, 0.99);
  payload["bet_updates"] = odds_payload("broken", 1.0, 0.0);
  std::string id = coordinator->ingest_match(payload, "bo3");
  EXPECT_TRUE(engine->evaluate_value_bets(id, -1.0).empty());
}

TEST_F(AnalyticsEngineTest, NoOddsOrNoEstimateGivesEmptyResult) {
  json no_odds = upcoming_match(1);
  no_odds["ai_predictions"] = prediction_payload();
  EXPECT_TRUE(engine->evaluate_value_bets(coordinator->ingest_match(no_odds, "bo3"), 0.0).empty());

  json no_estimate = upcoming_match(2);
  no_estimate["ai_predictions"] = {{"id", 5}, {"prediction_winner_team_id", 736}};
  no_estimate["bet_updates"] = odds_payload("1xbit", 2.0, 2.0);
  EXPECT_TRUE(engine->evaluate_value_bets(coordinator->ingest_match(no_estimate, "bo3"), 0.0).empty());

  json no_prediction = upcoming_match(3);
  no_prediction["bet_updates"] = odds_payload("1xbit", 2.0, 2.0);
  EXPECT_TRUE(engine->evaluate_value_bets(coordinator->ingest_match(no_prediction, "bo3"), 0.0).empty());
}

} // namespace

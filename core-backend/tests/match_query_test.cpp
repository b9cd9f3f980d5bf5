#include <gtest/gtest.h>

#include "query/match_query.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

class MatchQueryTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    query = std::make_unique<MatchQuery>(*store);

    json early = upcoming_match(1);
    early["start_date"] = "2025-01-10T10:00:00Z";
    json mid = finished_match(2);
    mid["start_date"] = "2025-01-20T10:00:00Z";
    mid["ai_predictions"] = prediction_payload();
    mid["bet_updates"] = odds_payload("1xbit", 1.3, 3.52);
    json late = upcoming_match(3);
    late["start_date"] = "2025-01-30T10:00:00Z";
    json undated = upcoming_match(4);
    undated.erase("start_date");

    early_id = coordinator->ingest_match(early, "bo3");
    mid_id = coordinator->ingest_match(mid, "bo3");
    late_id = coordinator->ingest_match(late, "bo3");
    undated_id = coordinator->ingest_match(undated, "bo3");
  }

  std::unique_ptr<MatchQuery> query;
  std::string early_id, mid_id, late_id, undated_id;
};

TEST_F(MatchQueryTest, ListsNewestFirstWithUndatedLast) {
  auto all = query->list_matches({});
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].id, late_id);
  EXPECT_EQ(all[1].id, mid_id);
  EXPECT_EQ(all[2].id, early_id);
  EXPECT_EQ(all[3].id, undated_id);
  EXPECT_TRUE(all[1].predictions.empty());
}

TEST_F(MatchQueryTest, FiltersByStatusDateRangeAndLimit) {
  MatchFilter finished;
  finished.status = "finished";
  auto f = query->list_matches(finished);
  ASSERT_EQ(f.size(), 1u);
  EXPECT_EQ(f[0].id, mid_id);

  MatchFilter range;
  range.start_from = "2025-01-10 10:00:00";
  range.start_to = "2025-01-20 10:00:00";
  auto r = query->list_matches(range);
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0].id, mid_id);
  EXPECT_EQ(r[1].id, early_id);

  MatchFilter limited;
  limited.limit = 1;
  ASSERT_EQ(query->list_matches(limited).size(), 1u);

  MatchFilter other_source;
  other_source.source_type = "hltv";
  EXPECT_TRUE(query->list_matches(other_source).empty());
}

TEST_F(MatchQueryTest, IncludesPredictionsAndOddsOnRequest) {
  auto m = query->get_match(mid_id, {.predictions = true, .odds = true});
  ASSERT_EQ(m.predictions.size(), 1u);
  ASSERT_EQ(m.odds.size(), 1u);
  EXPECT_EQ(m.odds[0].provider, "1xbit");

  json j = m.to_json();
  EXPECT_EQ(j["predictions"].size(), 1u);
  EXPECT_EQ(j["odds"][0]["provider"], "1xbit");
  EXPECT_EQ(j["status"], "finished");

  auto listed = query->list_matches_json({}, {.predictions = true, .odds = false});
  ASSERT_EQ(listed.size(), 4u);
  EXPECT_TRUE(listed[1].contains("predictions"));
  EXPECT_FALSE(listed[1].contains("odds"));
}

TEST_F(MatchQueryTest, UnknownMatchIsNotFound) {
  EXPECT_THROW(query->get_match("no-such-id"), NotFoundError);
  EXPECT_TRUE(query->get_predictions("no-such-id").empty());
  EXPECT_TRUE(query->get_odds("no-such-id").empty());
}

TEST_F(MatchQueryTest, FindsTeamBySource) {
  auto team = query->find_team_by_source("bo3", 7631);
  ASSERT_TRUE(team);
  EXPECT_EQ(team->name, "Passion UA");
  EXPECT_FALSE(query->find_team_by_source("bo3", 1));
}

} // namespace

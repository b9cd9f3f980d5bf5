#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "ingest/batch_ingestor.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

class BatchIngestorTest : public StoreTest {};

TEST_F(BatchIngestorTest, IngestsIndependentMatchesInParallel) {
  std::vector<json> payloads;
  for (int64_t i = 1; i <= 20; ++i)
    payloads.push_back(upcoming_match(1000 + i));

  BatchIngestor batch(*coordinator, 4);
  auto outcomes = batch.ingest_all(payloads, "bo3");

  ASSERT_EQ(outcomes.size(), payloads.size());
  for (size_t i = 0; i < outcomes.size(); ++i) {
    EXPECT_TRUE(outcomes[i].ok()) << outcomes[i].message;
    EXPECT_EQ(outcomes[i].index, i);
  }
  EXPECT_EQ(count("matches"), 20);
  EXPECT_EQ(count("teams"), 2);
  EXPECT_EQ(count("tournaments"), 1);
  EXPECT_EQ(store->count_dangling_references(), 0);
}

TEST_F(BatchIngestorTest, OneFailureDoesNotAffectOthers) {
  json bad = upcoming_match(2);
  bad.erase("id");
  json tied = finished_match(3, 1, 1);
  std::vector<json> payloads = {upcoming_match(1), bad, tied, upcoming_match(4)};

  BatchIngestor batch(*coordinator, 3);
  auto outcomes = batch.ingest_all(payloads, "bo3");

  ASSERT_EQ(outcomes.size(), 4u);
  EXPECT_TRUE(outcomes[0].ok());
  EXPECT_FALSE(outcomes[1].ok());
  EXPECT_EQ(outcomes[1].error, ErrorKind::VALIDATION);
  EXPECT_FALSE(outcomes[2].ok());
  EXPECT_EQ(outcomes[2].error, ErrorKind::VALIDATION);
  EXPECT_TRUE(outcomes[3].ok());
  EXPECT_EQ(count("matches"), 2);

  json j = outcomes[1].to_json();
  EXPECT_EQ(j["ok"], false);
  EXPECT_EQ(j["error"], "validation");
}

TEST_F(BatchIngestorTest, SameMatchFromManyWorkersStaysSingleRow) {
  std::vector<json> payloads(12, upcoming_match());
  BatchIngestor batch(*coordinator, 6);
  auto outcomes = batch.ingest_all(payloads, "bo3");

  for (const auto &o : outcomes) {
    ASSERT_TRUE(o.ok());
    EXPECT_EQ(*o.match_id, *outcomes[0].match_id);
  }
  EXPECT_EQ(count("matches"), 1);
}

TEST_F(BatchIngestorTest, ConcurrentBatchesWithFlush) {
  auto &stats = StatsManager::instance();
  stats.set_database(db.get());

  std::vector<json> first, second;
  for (int64_t i = 1; i <= 15; ++i) {
    first.push_back(upcoming_match(2000 + i));
    second.push_back(upcoming_match(3000 + i));
  }

  std::atomic<bool> done{false};
  std::thread flusher([&] {
    while (!done.load())
      stats.flush();
  });
  std::thread a([&] { BatchIngestor(*coordinator, 3).ingest_all(first, "bo3"); });
  std::thread b([&] { BatchIngestor(*coordinator, 3).ingest_all(second, "bo3"); });
  a.join();
  b.join();
  done = true;
  flusher.join();
  stats.flush();

  EXPECT_EQ(count("matches"), 30);
  EXPECT_EQ(db->query_single_int("SELECT ingested FROM ingest_stats_meta WHERE source = 'bo3' AND entity = 'Match'"),
            30);
}

TEST_F(BatchIngestorTest, UnclassifiedExceptionIsStorageOutcome) {
  IngestCoordinator broken(*store, *resolver, IngestOptions{sources::load_active_names(*store)},
                           []() -> std::chrono::system_clock::time_point {
                             throw std::runtime_error("clock failure");
                           });
  BatchIngestor batch(broken, 2);
  std::vector<json> payloads = {upcoming_match(1), upcoming_match(2)};
  auto outcomes = batch.ingest_all(payloads, "bo3");

  ASSERT_EQ(outcomes.size(), 2u);
  for (const auto &o : outcomes) {
    EXPECT_FALSE(o.ok());
    EXPECT_EQ(o.error, ErrorKind::STORAGE);
    EXPECT_EQ(o.message, "clock failure");
  }
  EXPECT_EQ(count("matches"), 0);
}

TEST_F(BatchIngestorTest, EmptyBatch) {
  BatchIngestor batch(*coordinator, 2);
  EXPECT_TRUE(batch.ingest_all({}, "bo3").empty());
}

} // namespace

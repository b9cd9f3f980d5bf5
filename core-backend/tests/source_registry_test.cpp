#include <gtest/gtest.h>

#include "store/source_registry.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

class SourceRegistryTest : public StoreTest {};

TEST_F(SourceRegistryTest, SyncRegistersConfiguredSources) {
  auto list = store->list_data_sources();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].name, "bo3");
  EXPECT_EQ(list[0].display_name, "BO3.gg");
  EXPECT_EQ(list[0].base_url, "https://api.bo3.gg/api/v1");
  EXPECT_TRUE(list[0].is_active);
  EXPECT_EQ(list[1].name, "hltv");
  EXPECT_FALSE(list[1].is_active);
  EXPECT_EQ(sources::load_active_names(*store), std::set<std::string>{"bo3"});
}

TEST_F(SourceRegistryTest, ResyncOnlyUpdatesActivation) {
  Config changed = Config::from_json(json::parse(R"({
    "db_path": ":memory:",
    "data_sources": {"bo3": {"display_name": "Renamed", "is_active": false}}
  })"));
  sources::sync_from_config(*store, changed);

  auto list = store->list_data_sources();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].display_name, "BO3.gg");
  EXPECT_FALSE(list[0].is_active);
  EXPECT_TRUE(sources::load_active_names(*store).empty());
}

TEST_F(SourceRegistryTest, SetActiveTogglesFlag) {
  store->set_data_source_active("hltv", true);
  EXPECT_EQ(sources::load_active_names(*store), (std::set<std::string>{"bo3", "hltv"}));
  EXPECT_THROW(store->set_data_source_active("nope", true), NotFoundError);
}

TEST_F(SourceRegistryTest, ActivationSnapshotIsExplicit) {
  // coordinator 持有构造时的快照; 重新激活后需要新的 coordinator
  store->set_data_source_active("hltv", true);
  EXPECT_THROW(coordinator->ingest_match(upcoming_match(), "hltv"), ValidationError);

  IngestCoordinator refreshed(*store, *resolver, IngestOptions{sources::load_active_names(*store)},
                              [this] { return now; });
  EXPECT_NO_THROW(refreshed.ingest_match(upcoming_match(), "hltv"));
}

} // namespace

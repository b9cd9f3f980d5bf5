#include <gtest/gtest.h>

#include "core/database.hpp"
#include "core/entity_definition.hpp"
#include "core/errors.hpp"

namespace {

class DatabaseTest : public ::testing::Test {
protected:
  void SetUp() override { db.init_schema(); }

  json team_row(const std::string &id, int64_t source_id, const std::string &name) {
    return {{"id", id}, {"source_type", "bo3"}, {"source_id", source_id}, {"name", name},
            {"metadata", {{"name", name}}}};
  }

  Database db{":memory:"};
};

TEST_F(DatabaseTest, SchemaCreatesEveryTable) {
  for (const auto *e : entities::ALL_ENTITIES)
    EXPECT_EQ(db.get_table_count(e->table), 0) << e->table;
  EXPECT_EQ(db.get_table_count("ingest_stats_meta"), 0);
}

TEST_F(DatabaseTest, UpsertKeepsOriginalIdAndOverwritesAttributes) {
  {
    Database::Transaction txn(db);
    db.upsert(txn, entities::Team, team_row("id-1", 736, "The MongolZ"));
    txn.commit();
  }
  {
    Database::Transaction txn(db);
    db.upsert(txn, entities::Team, team_row("id-2", 736, "MongolZ"));
    txn.commit();
  }

  auto rows = db.query_json("SELECT id, name, metadata FROM teams");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0]["id"], "id-1");
  EXPECT_EQ(rows[0]["name"], "MongolZ");
  EXPECT_EQ(json::parse(rows[0]["metadata"].get<std::string>())["name"], "MongolZ");
}

TEST_F(DatabaseTest, UncommittedTransactionRollsBack) {
  {
    Database::Transaction txn(db);
    db.upsert(txn, entities::Team, team_row("id-1", 736, "The MongolZ"));
    EXPECT_EQ(txn.query_json("SELECT id FROM teams").size(), 1u);
  }
  EXPECT_EQ(db.get_table_count("teams"), 0);
}

TEST_F(DatabaseTest, ReadConnectionSeesOnlyCommittedRows) {
  Database::Transaction txn(db);
  db.upsert(txn, entities::Team, team_row("id-1", 736, "The MongolZ"));
  EXPECT_EQ(db.get_table_count("teams"), 0);
  txn.commit();
  EXPECT_EQ(db.get_table_count("teams"), 1);
}

TEST_F(DatabaseTest, DuplicateUniqueKeyIsConflict) {
  db.execute("INSERT INTO data_sources (id, name, display_name) VALUES ('a', 'bo3', 'BO3')");
  EXPECT_THROW(db.execute("INSERT INTO data_sources (id, name, display_name) VALUES ('b', 'bo3', 'BO3')"),
               ConflictError);
}

TEST_F(DatabaseTest, InvalidSqlIsStorageError) {
  EXPECT_THROW(db.query_json("SELECT * FROM no_such_table"), StorageError);
  EXPECT_THROW(db.execute("NOT SQL"), StorageError);
}

TEST_F(DatabaseTest, DataSourceUpsertOnlyTouchesActivationFlag) {
  {
    Database::Transaction txn(db);
    db.upsert(txn, entities::DataSource,
              {{"id", "a"}, {"name", "bo3"}, {"display_name", "BO3.gg"}, {"is_active", true}});
    db.upsert(txn, entities::DataSource,
              {{"id", "b"}, {"name", "bo3"}, {"display_name", "Renamed"}, {"is_active", false}});
    txn.commit();
  }
  auto rows = db.query_json("SELECT id, display_name, is_active FROM data_sources");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0]["id"], "a");
  EXPECT_EQ(rows[0]["display_name"], "BO3.gg");
  EXPECT_EQ(rows[0]["is_active"], false);
}

TEST(EntityDefinitionTest, EscapesAndFormatsValues) {
  EXPECT_EQ(entities::escape_sql("O'Brien"), "'O''Brien'");
  json j = {{"s", "x"}, {"n", 5}, {"b", true}, {"d", 0.25}, {"o", {{"k", 1}}}, {"t", "2025-01-28 10:00:00"}};
  EXPECT_EQ(entities::json_str(j, "s"), "'x'");
  EXPECT_EQ(entities::json_str(j, "missing"), "NULL");
  EXPECT_EQ(entities::json_int(j, "n"), "5");
  EXPECT_EQ(entities::json_int(json{{"x", 1e300}}, "x"), "NULL");
  EXPECT_EQ(entities::json_int(json{{"x", 18446744073709551615ULL}}, "x"), "NULL");
  EXPECT_EQ(entities::json_int(json{{"x", 3.9}}, "x"), "3");
  EXPECT_EQ(entities::json_bool(j, "b"), "TRUE");
  EXPECT_EQ(entities::json_decimal(j, "d"), "0.25");
  EXPECT_EQ(entities::json_blob(j, "o"), "'{\"k\":1}'");
  EXPECT_EQ(entities::json_ts(j, "t"), "CAST('2025-01-28 10:00:00' AS TIMESTAMP)");
  EXPECT_EQ(entities::find_entity_by_table("matches"), &entities::Match);
  EXPECT_EQ(entities::find_entity_by_name("OddsQuote"), &entities::OddsQuote);
  EXPECT_EQ(entities::find_entity_by_name("Nope"), nullptr);
}

} // namespace

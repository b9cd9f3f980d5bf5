#pragma once

// ============================================================================
// CanonicalStore - canonical 表的 get / upsert / delete
// 所有写入都在调用方的 Database::Transaction 内完成
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "../core/database.hpp"
#include "../core/entity_definition.hpp"
#include "../core/errors.hpp"
#include "../core/records.hpp"

using json = nlohmann::json;

// 新行 id: 随机 UUID
inline std::string generate_id() {
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

struct MatchFilter {
  std::optional<std::string> status;
  std::optional<std::string> source_type;
  std::optional<std::string> start_from; // 规范化时间戳, 含边界
  std::optional<std::string> start_to;   // 规范化时间戳, 含边界
  std::optional<int64_t> limit;
};

class CanonicalStore {
public:
  using Transaction = Database::Transaction;

  explicit CanonicalStore(Database &db) : db_(db) {}

  Database &database() { return db_; }

  // ==========================================================================
  // 写入 (事务内)
  // ==========================================================================

  std::string upsert_team(Transaction &txn, json row) {
    return upsert_by_source(txn, entities::Team, std::move(row));
  }

  std::string upsert_tournament(Transaction &txn, json row) {
    return upsert_by_source(txn, entities::Tournament, std::move(row));
  }

  std::string upsert_match(Transaction &txn, json row) {
    return upsert_by_source(txn, entities::Match, std::move(row));
  }

  std::string upsert_prediction(Transaction &txn, json row) {
    std::string where = "match_id = " + entities::escape_sql(row.at("match_id").get<std::string>()) +
                        " AND source_type = " + entities::escape_sql(row.at("source_type").get<std::string>());
    return upsert_and_get_id(txn, entities::Prediction, std::move(row), where);
  }

  std::string upsert_odds_quote(Transaction &txn, json row) {
    std::string where = "match_id = " + entities::escape_sql(row.at("match_id").get<std::string>()) +
                        " AND source_type = " + entities::escape_sql(row.at("source_type").get<std::string>()) +
                        " AND provider = " + entities::escape_sql(row.at("provider").get<std::string>());
    return upsert_and_get_id(txn, entities::OddsQuote, std::move(row), where);
  }

  std::string upsert_data_source(Transaction &txn, json row) {
    std::string where = "name = " + entities::escape_sql(row.at("name").get<std::string>());
    return upsert_and_get_id(txn, entities::DataSource, std::move(row), where);
  }

  std::optional<std::string> find_id_by_source(Transaction &txn, const entities::EntityDef &entity,
                                               const std::string &source_type, int64_t source_id) {
    auto rows = txn.query_json(std::string("SELECT id FROM ") + entity.table + " WHERE " +
                               source_where(source_type, source_id));
    if (rows.empty())
      return std::nullopt;
    return rows[0]["id"].get<std::string>();
  }

  std::optional<records::MatchRecord> find_match_by_source(Transaction &txn, const std::string &source_type,
                                                           int64_t source_id) {
    auto rows = txn.query_json("SELECT * FROM matches WHERE " + source_where(source_type, source_id));
    if (rows.empty())
      return std::nullopt;
    return records::MatchRecord::from_row(rows[0]);
  }

  bool match_exists(Transaction &txn, const std::string &match_id) {
    auto rows = txn.query_json("SELECT id FROM matches WHERE id = " + entities::escape_sql(match_id));
    return !rows.empty();
  }

  // 只刷新抓取时间 (已结束比赛收到过期 payload 时)
  void touch_match(Transaction &txn, const std::string &match_id, const std::string &fetched_at) {
    txn.execute("UPDATE matches SET last_fetched_at = CAST(" + entities::escape_sql(fetched_at) +
                " AS TIMESTAMP) WHERE id = " + entities::escape_sql(match_id));
  }

  // 级联删除: predictions / odds_quotes 没有独立生命周期
  bool delete_match(Transaction &txn, const std::string &match_id) {
    if (!match_exists(txn, match_id))
      return false;
    std::string id = entities::escape_sql(match_id);
    txn.execute("DELETE FROM predictions WHERE match_id = " + id);
    txn.execute("DELETE FROM odds_quotes WHERE match_id = " + id);
    txn.execute("DELETE FROM matches WHERE id = " + id);
    return true;
  }

  void set_data_source_active(const std::string &name, bool active) {
    Transaction txn(db_);
    auto rows = txn.query_json("SELECT id FROM data_sources WHERE name = " + entities::escape_sql(name));
    if (rows.empty())
      throw NotFoundError("data source 不存在: " + name);
    txn.execute(std::string("UPDATE data_sources SET is_active = ") + (active ? "TRUE" : "FALSE") +
                ", updated_at = CURRENT_TIMESTAMP WHERE name = " + entities::escape_sql(name));
    txn.commit();
  }

  // ==========================================================================
  // 读取 (只读连接, 已提交数据)
  // ==========================================================================

  std::optional<records::MatchRecord> get_match(const std::string &match_id) {
    auto rows = db_.query_json("SELECT * FROM matches WHERE id = " + entities::escape_sql(match_id));
    if (rows.empty())
      return std::nullopt;
    return records::MatchRecord::from_row(rows[0]);
  }

  std::vector<records::MatchRecord> list_matches(const MatchFilter &filter) {
    std::string sql = "SELECT * FROM matches WHERE 1=1";
    if (filter.status)
      sql += " AND status = " + entities::escape_sql(*filter.status);
    if (filter.source_type)
      sql += " AND source_type = " + entities::escape_sql(*filter.source_type);
    if (filter.start_from)
      sql += " AND start_date >= CAST(" + entities::escape_sql(*filter.start_from) + " AS TIMESTAMP)";
    if (filter.start_to)
      sql += " AND start_date <= CAST(" + entities::escape_sql(*filter.start_to) + " AS TIMESTAMP)";
    sql += " ORDER BY start_date DESC NULLS LAST, source_id DESC";
    if (filter.limit)
      sql += " LIMIT " + std::to_string(*filter.limit);

    std::vector<records::MatchRecord> out;
    for (const auto &row : db_.query_json(sql))
      out.push_back(records::MatchRecord::from_row(row));
    return out;
  }

  std::vector<records::PredictionRecord> get_predictions(const std::string &match_id) {
    auto rows = db_.query_json("SELECT * FROM predictions WHERE match_id = " +
                               entities::escape_sql(match_id) + " ORDER BY created_at, source_type");
    std::vector<records::PredictionRecord> out;
    for (const auto &row : rows)
      out.push_back(records::PredictionRecord::from_row(row));
    return out;
  }

  std::vector<records::OddsQuoteRecord> get_odds(const std::string &match_id,
                                                 const std::optional<std::string> &provider = std::nullopt) {
    std::string sql = "SELECT * FROM odds_quotes WHERE match_id = " + entities::escape_sql(match_id);
    if (provider)
      sql += " AND provider = " + entities::escape_sql(*provider);
    sql += " ORDER BY source_type, provider";
    std::vector<records::OddsQuoteRecord> out;
    for (const auto &row : db_.query_json(sql))
      out.push_back(records::OddsQuoteRecord::from_row(row));
    return out;
  }

  std::optional<records::TeamRecord> get_team(const std::string &team_id) {
    auto rows = db_.query_json("SELECT * FROM teams WHERE id = " + entities::escape_sql(team_id));
    if (rows.empty())
      return std::nullopt;
    return records::TeamRecord::from_row(rows[0]);
  }

  std::optional<records::TeamRecord> find_team_by_source(const std::string &source_type, int64_t source_id) {
    auto rows = db_.query_json("SELECT * FROM teams WHERE " + source_where(source_type, source_id));
    if (rows.empty())
      return std::nullopt;
    return records::TeamRecord::from_row(rows[0]);
  }

  std::optional<records::TournamentRecord> get_tournament(const std::string &tournament_id) {
    auto rows = db_.query_json("SELECT * FROM tournaments WHERE id = " + entities::escape_sql(tournament_id));
    if (rows.empty())
      return std::nullopt;
    return records::TournamentRecord::from_row(rows[0]);
  }

  std::vector<records::DataSourceRecord> list_data_sources() {
    std::vector<records::DataSourceRecord> out;
    for (const auto &row : db_.query_json("SELECT * FROM data_sources ORDER BY name"))
      out.push_back(records::DataSourceRecord::from_row(row));
    return out;
  }

  // 悬空引用计数 (match -> team/tournament, prediction/odds -> match), 正常应为 0
  int64_t count_dangling_references() {
    return db_.query_single_int(R"(
      SELECT
        (SELECT COUNT(*) FROM matches m WHERE m.team1_id IS NOT NULL
            AND NOT EXISTS (SELECT 1 FROM teams t WHERE t.id = m.team1_id)) +
        (SELECT COUNT(*) FROM matches m WHERE m.team2_id IS NOT NULL
            AND NOT EXISTS (SELECT 1 FROM teams t WHERE t.id = m.team2_id)) +
        (SELECT COUNT(*) FROM matches m WHERE m.tournament_id IS NOT NULL
            AND NOT EXISTS (SELECT 1 FROM tournaments t WHERE t.id = m.tournament_id)) +
        (SELECT COUNT(*) FROM predictions p
            WHERE NOT EXISTS (SELECT 1 FROM matches m WHERE m.id = p.match_id)) +
        (SELECT COUNT(*) FROM odds_quotes o
            WHERE NOT EXISTS (SELECT 1 FROM matches m WHERE m.id = o.match_id))
    )");
  }

private:
  static std::string source_where(const std::string &source_type, int64_t source_id) {
    return "source_type = " + entities::escape_sql(source_type) +
           " AND source_id = " + std::to_string(source_id);
  }

  std::string upsert_by_source(Transaction &txn, const entities::EntityDef &entity, json row) {
    std::string where = source_where(row.at("source_type").get<std::string>(),
                                     row.at("source_id").get<int64_t>());
    return upsert_and_get_id(txn, entity, std::move(row), where);
  }

  // 候选 id 只在插入时生效; 冲突更新保留原 id
  std::string upsert_and_get_id(Transaction &txn, const entities::EntityDef &entity, json row,
                                const std::string &identity_where) {
    row["id"] = generate_id();
    db_.upsert(txn, entity, row);
    auto rows = txn.query_json(std::string("SELECT id FROM ") + entity.table + " WHERE " + identity_where);
    if (rows.empty())
      throw ReferenceError(std::string(entity.name) + " upsert 后未找到行: " + identity_where);
    return rows[0]["id"].get<std::string>();
  }

  Database &db_;
};

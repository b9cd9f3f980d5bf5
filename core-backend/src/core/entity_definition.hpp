#pragma once

// ============================================================================
// Entity 定义
// 每个 entity 包含：DDL、列名、身份键、转换函数
// ============================================================================

#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace entities {

// ============================================================================
// 工具函数
// ============================================================================

// SQL 字符串转义(不带引号)
inline std::string escape_sql_raw(const std::string &s) {
  std::string r;
  r.reserve(s.size());
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  return r;
}

// SQL 字符串转义(带引号)
inline std::string escape_sql(const std::string &s) {
  return "'" + escape_sql_raw(s) + "'";
}

// JSON 提取：字符串
inline std::string json_str(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return "NULL";
  if (j[key].is_string())
    return escape_sql(j[key].get<std::string>());
  return escape_sql(j[key].dump());
}

// JSON 提取：整数
inline std::string json_int(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return "NULL";
  if (j[key].is_number_unsigned()) {
    uint64_t u = j[key].get<uint64_t>();
    return u > static_cast<uint64_t>(INT64_MAX) ? "NULL" : std::to_string(u);
  }
  if (j[key].is_number_integer())
    return std::to_string(j[key].get<int64_t>());
  if (j[key].is_number_float()) {
    // 超出 int64 的浮点数按缺失处理
    double d = j[key].get<double>();
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
      return "NULL";
    return std::to_string(static_cast<int64_t>(d));
  }
  return "NULL";
}

// JSON 提取：布尔
inline std::string json_bool(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return "NULL";
  if (j[key].is_boolean())
    return j[key].get<bool>() ? "TRUE" : "FALSE";
  return "NULL";
}

// JSON 提取：浮点(保留完整精度)
inline std::string json_decimal(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return "NULL";
  if (j[key].is_number())
    return json(j[key].get<double>()).dump();
  return "NULL";
}

// JSON 提取：对象/数组原样序列化为 JSON 文本
inline std::string json_blob(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return "NULL";
  return escape_sql(j[key].dump());
}

// JSON 提取：时间戳(已规范化为 'YYYY-MM-DD HH:MM:SS[.ffffff]')
inline std::string json_ts(const json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_string())
    return "NULL";
  return "CAST(" + escape_sql(j[key].get<std::string>()) + " AS TIMESTAMP)";
}

// ============================================================================
// 基础设施：ingest 统计表
// ============================================================================

inline const char *INGEST_STATS_META_DDL = R"(
CREATE TABLE IF NOT EXISTS ingest_stats_meta (
    source VARCHAR NOT NULL,
    entity VARCHAR NOT NULL,
    ingested BIGINT DEFAULT 0,
    fail_validation BIGINT DEFAULT 0,
    fail_conflict BIGINT DEFAULT 0,
    fail_reference BIGINT DEFAULT 0,
    fail_storage BIGINT DEFAULT 0,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    PRIMARY KEY (source, entity)
))";

// ============================================================================
// Entity 定义结构
// ============================================================================

struct EntityDef {
  const char *name;                       // Entity 名称
  const char *table;                      // 数据库表名
  const char *ddl;                        // CREATE TABLE 语句
  const char *columns;                    // INSERT 列名
  const char *identity;                   // 身份键(ON CONFLICT 目标)
  const char *update_columns;             // 冲突时更新的列; nullptr = columns - id - identity
  std::string (*to_values)(const json &); // 规范化行 JSON 转 SQL values
};

// ============================================================================
// DataSource - provider 注册表
// 创建后只允许修改 is_active
// ============================================================================

inline std::string data_source_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "name") + "," +
         json_str(j, "display_name") + "," +
         json_str(j, "description") + "," +
         json_str(j, "base_url") + "," +
         json_bool(j, "is_active") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef DataSource = {
    .name = "DataSource",
    .table = "data_sources",
    .ddl = R"(CREATE TABLE IF NOT EXISTS data_sources (
        id VARCHAR PRIMARY KEY,
        name VARCHAR NOT NULL UNIQUE,
        display_name VARCHAR NOT NULL,
        description VARCHAR,
        base_url VARCHAR,
        is_active BOOLEAN DEFAULT TRUE,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
    ))",
    .columns = "id, name, display_name, description, base_url, is_active, updated_at",
    .identity = "name",
    .update_columns = "is_active, updated_at",
    .to_values = data_source_to_values};

// ============================================================================
// Team - 按 (source_type, source_id) 唯一，不做跨 source 合并
// ============================================================================

inline std::string team_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "source_type") + "," +
         json_int(j, "source_id") + "," +
         json_str(j, "name") + "," +
         json_str(j, "slug") + "," +
         json_str(j, "country_code") + "," +
         json_str(j, "logo_url") + "," +
         json_blob(j, "metadata") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef Team = {
    .name = "Team",
    .table = "teams",
    .ddl = R"(CREATE TABLE IF NOT EXISTS teams (
        id VARCHAR PRIMARY KEY,
        source_type VARCHAR NOT NULL,
        source_id BIGINT NOT NULL,
        name VARCHAR NOT NULL,
        slug VARCHAR,
        country_code VARCHAR,
        logo_url VARCHAR,
        metadata VARCHAR,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        UNIQUE (source_type, source_id)
    ))",
    .columns = "id, source_type, source_id, name, slug, country_code, logo_url, metadata, updated_at",
    .identity = "source_type, source_id",
    .update_columns = nullptr,
    .to_values = team_to_values};

// ============================================================================
// Tournament
// ============================================================================

inline std::string tournament_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "source_type") + "," +
         json_int(j, "source_id") + "," +
         json_str(j, "name") + "," +
         json_str(j, "slug") + "," +
         json_str(j, "tier") + "," +
         json_int(j, "tier_rank") + "," +
         json_int(j, "prize_pool") + "," +
         json_int(j, "discipline_id") + "," +
         json_str(j, "status") + "," +
         json_ts(j, "start_date") + "," +
         json_ts(j, "end_date") + "," +
         json_blob(j, "metadata") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef Tournament = {
    .name = "Tournament",
    .table = "tournaments",
    .ddl = R"(CREATE TABLE IF NOT EXISTS tournaments (
        id VARCHAR PRIMARY KEY,
        source_type VARCHAR NOT NULL,
        source_id BIGINT NOT NULL,
        name VARCHAR NOT NULL,
        slug VARCHAR,
        tier VARCHAR,
        tier_rank INTEGER,
        prize_pool BIGINT,
        discipline_id INTEGER,
        status VARCHAR,
        start_date TIMESTAMP,
        end_date TIMESTAMP,
        metadata VARCHAR,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        UNIQUE (source_type, source_id)
    ))",
    .columns = "id, source_type, source_id, name, slug, tier, tier_rank, prize_pool, discipline_id, "
               "status, start_date, end_date, metadata, updated_at",
    .identity = "source_type, source_id",
    .update_columns = nullptr,
    .to_values = tournament_to_values};

// ============================================================================
// Match - 比赛主表
// raw_payload 保存 provider 原始响应(后续重新推导的唯一真相)
// team/tournament 引用由存储层在写事务内保证完整性:
// DuckDB 不支持 ON DELETE CASCADE, 且被引用行的 upsert 会触发过早的 FK 检查
// 会被 upsert 改写的列不建二级索引(同样的原因)
// ============================================================================

inline std::string match_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "source_type") + "," +
         json_int(j, "source_id") + "," +
         json_str(j, "slug") + "," +
         json_str(j, "team1_id") + "," +
         json_str(j, "team2_id") + "," +
         json_str(j, "tournament_id") + "," +
         json_str(j, "status") + "," +
         json_ts(j, "start_date") + "," +
         json_int(j, "bo_type") + "," +
         json_str(j, "tier") + "," +
         json_int(j, "team1_score") + "," +
         json_int(j, "team2_score") + "," +
         json_str(j, "winner_team_id") + "," +
         json_str(j, "loser_team_id") + "," +
         json_blob(j, "raw_payload") + "," +
         json_ts(j, "last_fetched_at") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef Match = {
    .name = "Match",
    .table = "matches",
    .ddl = R"(CREATE TABLE IF NOT EXISTS matches (
        id VARCHAR PRIMARY KEY,
        source_type VARCHAR NOT NULL,
        source_id BIGINT NOT NULL,
        slug VARCHAR,
        team1_id VARCHAR,
        team2_id VARCHAR,
        tournament_id VARCHAR,
        status VARCHAR NOT NULL,
        start_date TIMESTAMP,
        bo_type INTEGER,
        tier VARCHAR,
        team1_score INTEGER,
        team2_score INTEGER,
        winner_team_id VARCHAR,
        loser_team_id VARCHAR,
        raw_payload VARCHAR,
        last_fetched_at TIMESTAMP,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        UNIQUE (source_type, source_id)
    ))",
    .columns = "id, source_type, source_id, slug, team1_id, team2_id, tournament_id, status, start_date, "
               "bo_type, tier, team1_score, team2_score, winner_team_id, loser_team_id, raw_payload, "
               "last_fetched_at, updated_at",
    .identity = "source_type, source_id",
    .update_columns = nullptr,
    .to_values = match_to_values};

// ============================================================================
// Prediction - 每个 match 每个 provider 最多一条
// ============================================================================

inline std::string prediction_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "match_id") + "," +
         json_str(j, "source_type") + "," +
         json_int(j, "source_id") + "," +
         json_blob(j, "prediction_payload") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef Prediction = {
    .name = "Prediction",
    .table = "predictions",
    .ddl = R"(CREATE TABLE IF NOT EXISTS predictions (
        id VARCHAR PRIMARY KEY,
        match_id VARCHAR NOT NULL,
        source_type VARCHAR NOT NULL,
        source_id BIGINT,
        prediction_payload VARCHAR NOT NULL,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        UNIQUE (match_id, source_type)
    ))",
    .columns = "id, match_id, source_type, source_id, prediction_payload, updated_at",
    .identity = "match_id, source_type",
    .update_columns = nullptr,
    .to_values = prediction_to_values};

// ============================================================================
// OddsQuote - 每个 match / feed / 博彩公司 一条实时报价(覆盖，不保留历史)
// ============================================================================

inline std::string odds_quote_to_values(const json &j) {
  return json_str(j, "id") + "," +
         json_str(j, "match_id") + "," +
         json_str(j, "source_type") + "," +
         json_str(j, "provider") + "," +
         json_decimal(j, "team1_odds") + "," +
         json_decimal(j, "team2_odds") + "," +
         json_decimal(j, "team1_implied_prob") + "," +
         json_decimal(j, "team2_implied_prob") + "," +
         json_blob(j, "odds_payload") + "," +
         json_ts(j, "fetched_at") + "," +
         "CURRENT_TIMESTAMP";
}

inline const EntityDef OddsQuote = {
    .name = "OddsQuote",
    .table = "odds_quotes",
    .ddl = R"(CREATE TABLE IF NOT EXISTS odds_quotes (
        id VARCHAR PRIMARY KEY,
        match_id VARCHAR NOT NULL,
        source_type VARCHAR NOT NULL,
        provider VARCHAR NOT NULL,
        team1_odds DOUBLE,
        team2_odds DOUBLE,
        team1_implied_prob DOUBLE,
        team2_implied_prob DOUBLE,
        odds_payload VARCHAR NOT NULL,
        fetched_at TIMESTAMP,
        created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
        UNIQUE (match_id, source_type, provider)
    ))",
    .columns = "id, match_id, source_type, provider, team1_odds, team2_odds, team1_implied_prob, "
               "team2_implied_prob, odds_payload, fetched_at, updated_at",
    .identity = "match_id, source_type, provider",
    .update_columns = nullptr,
    .to_values = odds_quote_to_values};

// ============================================================================
// Entity 注册表 (按依赖顺序: 被引用的在前)
// ============================================================================

inline const EntityDef *ALL_ENTITIES[] = {
    &DataSource, &Team, &Tournament, &Match, &Prediction, &OddsQuote};

inline const EntityDef *find_entity_by_name(const char *name) {
  for (const auto *e : ALL_ENTITIES) {
    if (std::string(e->name) == name)
      return e;
  }
  return nullptr;
}

inline const EntityDef *find_entity_by_table(const char *table) {
  for (const auto *e : ALL_ENTITIES) {
    if (std::string(e->table) == table)
      return e;
  }
  return nullptr;
}

} // namespace entities

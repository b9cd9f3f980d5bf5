#pragma once

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "../core/errors.hpp"

using json = nlohmann::json;

// 前向声明
class Database;

// ============================================================================
// 单个 (source, entity) 的 ingest 统计
// ============================================================================
struct EntityStat {
  std::string source;
  std::string entity;

  int64_t ingested = 0; // 成功写入(提交)的行数
  int64_t fail_validation = 0;
  int64_t fail_conflict = 0;
  int64_t fail_reference = 0;
  int64_t fail_storage = 0;

  bool loaded = false; // 是否已从 DB 加载历史
};

// ============================================================================
// 全局 Stats 管理器
// ============================================================================
class StatsManager {
public:
  static StatsManager &instance() {
    static StatsManager inst;
    return inst;
  }

  // 设置数据库连接(在启动时调用一次); nullptr = 只在内存统计
  void set_database(Database *db) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_ = db;
  }

  void record_success(const std::string &source, const std::string &entity, int64_t rows = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    stat_unsafe(source, entity).ingested += rows;
  }

  void record_failure(const std::string &source, const std::string &entity, ErrorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &stat = stat_unsafe(source, entity);
    switch (kind) {
    case ErrorKind::VALIDATION: ++stat.fail_validation; break;
    case ErrorKind::CONFLICT:   ++stat.fail_conflict;   break;
    case ErrorKind::REFERENCE:  ++stat.fail_reference;  break;
    case ErrorKind::NOT_FOUND:  ++stat.fail_reference;  break;
    case ErrorKind::STORAGE:    ++stat.fail_storage;    break;
    }
  }

  EntityStat get(const std::string &source, const std::string &entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return stat_unsafe(source, entity);
  }

  json get_all_json() {
    std::lock_guard<std::mutex> lock(mutex_);
    json result = json::object();
    for (auto &[key, stat] : stats_) {
      result[key] = {
          {"source", stat.source},
          {"entity", stat.entity},
          {"ingested", stat.ingested},
          {"fail_validation", stat.fail_validation},
          {"fail_conflict", stat.fail_conflict},
          {"fail_reference", stat.fail_reference},
          {"fail_storage", stat.fail_storage},
      };
    }
    return result;
  }

  // 全部落盘 (ingest 批次结束时调用)
  void flush();

  // 丢弃内存统计 (不影响已落盘数据)
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.clear();
  }

private:
  StatsManager() = default;

  static std::string make_key(const std::string &source, const std::string &entity) {
    return source + "/" + entity;
  }

  EntityStat &stat_unsafe(const std::string &source, const std::string &entity) {
    auto &stat = stats_[make_key(source, entity)];
    if (!stat.loaded) {
      stat.source = source;
      stat.entity = entity;
      if (db_)
        load_from_db_unsafe(stat);
      stat.loaded = true;
    }
    return stat;
  }

  // 从数据库加载历史统计
  void load_from_db_unsafe(EntityStat &stat);

  std::mutex mutex_;
  std::unordered_map<std::string, EntityStat> stats_;
  Database *db_ = nullptr;
};

// ============================================================================
// StatsManager 数据库操作实现
// ============================================================================

#include "../core/database.hpp"
#include "../core/entity_definition.hpp"

inline void StatsManager::load_from_db_unsafe(EntityStat &stat) {
  std::string sql =
      "SELECT ingested, fail_validation, fail_conflict, fail_reference, fail_storage "
      "FROM ingest_stats_meta "
      "WHERE source = " +
      entities::escape_sql(stat.source) +
      " AND entity = " + entities::escape_sql(stat.entity);
  auto result = db_->query_json(sql);

  if (!result.empty()) {
    auto &row = result[0];
    stat.ingested = row.value("ingested", int64_t{0});
    stat.fail_validation = row.value("fail_validation", int64_t{0});
    stat.fail_conflict = row.value("fail_conflict", int64_t{0});
    stat.fail_reference = row.value("fail_reference", int64_t{0});
    stat.fail_storage = row.value("fail_storage", int64_t{0});
  }
}

inline void StatsManager::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_)
    return;

  for (auto &[key, stat] : stats_) {
    (void)key;
    std::string sql =
        "INSERT OR REPLACE INTO ingest_stats_meta "
        "(source, entity, ingested, fail_validation, fail_conflict, fail_reference, fail_storage, updated_at) "
        "VALUES (" +
        entities::escape_sql(stat.source) + ", " +
        entities::escape_sql(stat.entity) + ", " +
        std::to_string(stat.ingested) + ", " +
        std::to_string(stat.fail_validation) + ", " +
        std::to_string(stat.fail_conflict) + ", " +
        std::to_string(stat.fail_reference) + ", " +
        std::to_string(stat.fail_storage) + ", CURRENT_TIMESTAMP)";
    db_->execute(sql);
  }
}

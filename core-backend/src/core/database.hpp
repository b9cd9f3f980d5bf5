#pragma once

#include <algorithm>
#include <duckdb.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "entity_definition.hpp"
#include "errors.hpp"

using json = nlohmann::json;

// ============================================================================
// Database - DuckDB 封装
// 写: 单连接 + write_mutex_ 串行化, 显式事务
// 读: 独立连接, 只看已提交数据
// ============================================================================
class Database {
public:
  explicit Database(const std::string &path) {
    try {
      db_ = std::make_unique<duckdb::DuckDB>(path);
      conn_ = std::make_unique<duckdb::Connection>(*db_);
      read_conn_ = std::make_unique<duckdb::Connection>(*db_);
    } catch (const std::exception &e) {
      throw StorageError("无法打开数据库 " + path + ": " + e.what());
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  // ==========================================================================
  // Transaction - RAII 写事务
  // 构造时持有写锁并 BEGIN; 未 commit 的事务在析构时 ROLLBACK
  // ==========================================================================
  class Transaction {
  public:
    explicit Transaction(Database &db) : db_(db), lock_(db.write_mutex_) {
      db_.run_write("BEGIN TRANSACTION");
    }

    ~Transaction() {
      if (done_)
        return;
      auto result = db_.conn_->Query("ROLLBACK");
      if (result->HasError())
        std::cerr << "[DB] ROLLBACK 失败: " << result->GetError() << std::endl;
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void execute(const std::string &sql) { db_.run_write(sql); }

    // 事务内读(能看到本事务未提交的写入)
    json query_json(const std::string &sql) {
      auto result = db_.conn_->Query(sql);
      check(*result, sql);
      return to_json(*result);
    }

    void commit() {
      db_.run_write("COMMIT");
      done_ = true;
    }

  private:
    Database &db_;
    std::unique_lock<std::mutex> lock_;
    bool done_ = false;
  };

  // 表初始化
  void init_schema() {
    for (const auto *e : entities::ALL_ENTITIES) {
      execute(e->ddl);
    }
    execute(entities::INGEST_STATS_META_DDL);
  }

  // 原子 upsert: INSERT ... ON CONFLICT (identity) DO UPDATE
  // 冲突时 id / 身份键 / created_at 保持不变
  void upsert(Transaction &txn, const entities::EntityDef &entity, const json &row) {
    std::string sql = std::string("INSERT INTO ") + entity.table + " (" + entity.columns +
                      ") VALUES (" + entity.to_values(row) + ")" + build_on_conflict_clause(entity);
    txn.execute(sql);
  }

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    run_write(sql);
  }

  // 只读查询
  json query_json(const std::string &sql) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(sql);
    check(*result, sql);
    return to_json(*result);
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(sql);
    check(*result, sql);
    if (result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }


private:
  // 调用方需持有 write_mutex_
  void run_write(const std::string &sql) {
    auto result = conn_->Query(sql);
    check(*result, sql);
  }

  // DuckDB 错误 -> 错误分类(唯一键冲突 = ConflictError, 其余 = StorageError)
  static void check(duckdb::MaterializedQueryResult &result, const std::string &sql) {
    if (!result.HasError())
      return;
    std::string msg = result.GetError();
    if (result.GetErrorType() == duckdb::ExceptionType::CONSTRAINT) {
      std::cerr << "[DB] 约束冲突: " << msg << std::endl;
      throw ConflictError(msg);
    }
    std::cerr << "[DB] 查询失败: " << msg << "\n[DB]   SQL: " << sql.substr(0, 200) << std::endl;
    throw StorageError(msg);
  }

  static json to_json(duckdb::MaterializedQueryResult &result) {
    json rows = json::array();
    auto &types = result.types;
    auto &names = result.names;

    for (size_t row = 0; row < result.RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result.ColumnCount(); ++col) {
        auto value = result.GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::TINYINT:
          case duckdb::LogicalTypeId::SMALLINT:
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          case duckdb::LogicalTypeId::FLOAT:
          case duckdb::LogicalTypeId::DOUBLE:
            obj[names[col]] = value.GetValue<double>();
            break;
          default:
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  static std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(" \n");
    size_t e = s.find_last_not_of(" \n");
    return (b != std::string::npos) ? s.substr(b, e - b + 1) : "";
  }

  static std::vector<std::string> split_columns(const std::string &columns) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < columns.size()) {
      size_t comma = columns.find(',', pos);
      std::string col = trim((comma == std::string::npos)
                                 ? columns.substr(pos) : columns.substr(pos, comma - pos));
      pos = (comma == std::string::npos) ? columns.size() : comma + 1;
      if (!col.empty())
        out.push_back(col);
    }
    return out;
  }

  static std::string build_on_conflict_clause(const entities::EntityDef &entity) {
    auto identity = split_columns(entity.identity);
    std::vector<std::string> updates;
    if (entity.update_columns) {
      updates = split_columns(entity.update_columns);
    } else {
      for (const auto &col : split_columns(entity.columns)) {
        if (col == "id" || col == "created_at")
          continue;
        if (std::find(identity.begin(), identity.end(), col) != identity.end())
          continue;
        updates.push_back(col);
      }
    }

    std::string clause = std::string(" ON CONFLICT (") + entity.identity + ") DO UPDATE SET ";
    for (size_t i = 0; i < updates.size(); ++i) {
      if (i > 0)
        clause += ", ";
      clause += updates[i] + "=excluded." + updates[i];
    }
    return clause;
  }

  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::mutex write_mutex_;
  std::mutex read_mutex_;
};

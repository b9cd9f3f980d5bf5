#pragma once

// ============================================================================
// EntityResolver - provider 记录 -> canonical 行 id
// resolve = 单条 INSERT ... ON CONFLICT DO UPDATE (不是先读后写)
// 同一 (source_type, source_id) 重复/并发 resolve 只会有一行, 属性以最后写入为准
// ============================================================================

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/database.hpp"
#include "../core/entity_definition.hpp"
#include "../core/errors.hpp"
#include "../ingest/payload.hpp"
#include "../store/canonical_store.hpp"

using json = nlohmann::json;

class EntityResolver {
public:
  using Transaction = Database::Transaction;

  explicit EntityResolver(CanonicalStore &store) : store_(store) {}

  // ==========================================================================
  // 事务内 resolve (ingest 使用)
  // ==========================================================================

  std::string resolve_team(Transaction &txn, const std::string &source_type, const json &source_id,
                           const json &attributes) {
    int64_t sid = validate_identity("team", source_type, source_id);
    const json &attrs = validate_attributes("team", attributes);

    json row = {{"source_type", source_type}, {"source_id", sid}, {"name", attrs["name"]}};
    copy_string(attrs, row, "slug");
    copy_string(attrs, row, "country_code");
    copy_string(attrs, row, "logo_url");
    row["metadata"] = attrs;
    return store_.upsert_team(txn, std::move(row));
  }

  std::string resolve_tournament(Transaction &txn, const std::string &source_type, const json &source_id,
                                 const json &attributes) {
    int64_t sid = validate_identity("tournament", source_type, source_id);
    const json &attrs = validate_attributes("tournament", attributes);

    json row = {{"source_type", source_type}, {"source_id", sid}, {"name", attrs["name"]}};
    copy_string(attrs, row, "slug");
    copy_string(attrs, row, "tier");
    copy_string(attrs, row, "status");
    if (auto v = payload::opt_int(attrs, "tier_rank"))
      row["tier_rank"] = *v;
    if (auto v = payload::opt_int(attrs, "prize_pool"))
      row["prize_pool"] = *v;
    else if (auto p = payload::opt_int(attrs, "prize"))
      row["prize_pool"] = *p;
    if (auto v = payload::opt_int(attrs, "discipline_id"))
      row["discipline_id"] = *v;
    if (auto v = payload::normalize_timestamp(attrs, "start_date"))
      row["start_date"] = *v;
    if (auto v = payload::normalize_timestamp(attrs, "end_date"))
      row["end_date"] = *v;
    row["metadata"] = attrs;
    return store_.upsert_tournament(txn, std::move(row));
  }

  // 只有 provider id 没有属性对象: 只查不建, 不存在即 ReferenceError
  std::string resolve_reference(Transaction &txn, const entities::EntityDef &entity,
                                const std::string &source_type, const json &source_id) {
    int64_t sid = validate_identity(entity.name, source_type, source_id);
    auto id = store_.find_id_by_source(txn, entity, source_type, sid);
    if (!id)
      throw ReferenceError(std::string(entity.name) + " 未找到: " + source_type + "/" + std::to_string(sid));
    return *id;
  }

  // ==========================================================================
  // 独立事务 resolve
  // ==========================================================================

  std::string resolve_team(const std::string &source_type, const json &source_id, const json &attributes) {
    Transaction txn(store_.database());
    std::string id = resolve_team(txn, source_type, source_id, attributes);
    txn.commit();
    return id;
  }

  std::string resolve_tournament(const std::string &source_type, const json &source_id,
                                 const json &attributes) {
    Transaction txn(store_.database());
    std::string id = resolve_tournament(txn, source_type, source_id, attributes);
    txn.commit();
    return id;
  }

private:
  static int64_t validate_identity(const std::string &what, const std::string &source_type,
                                   const json &source_id) {
    if (source_type.empty())
      throw ValidationError(what + ": source_type 为空");
    auto sid = payload::parse_source_id(source_id);
    if (!sid)
      throw ValidationError(what + ": source_id 不合法: " + source_id.dump());
    return *sid;
  }

  static const json &validate_attributes(const std::string &what, const json &attributes) {
    if (!attributes.is_object())
      throw ValidationError(what + ": 属性必须是 object");
    if (!attributes.contains("name") || !attributes["name"].is_string() ||
        attributes["name"].get_ref<const std::string &>().empty())
      throw ValidationError(what + ": 缺少 name");
    return attributes;
  }

  static void copy_string(const json &from, json &to, const char *key) {
    if (from.contains(key) && from[key].is_string())
      to[key] = from[key];
  }

  CanonicalStore &store_;
};

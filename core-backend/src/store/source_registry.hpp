#pragma once

// ============================================================================
// DataSource 注册表: 配置 -> data_sources 表
// ============================================================================

#include <iostream>
#include <set>
#include <string>

#include "../core/config.hpp"
#include "canonical_store.hpp"

namespace sources {

// 启动时同步; 已存在的 source 只更新 is_active
inline void sync_from_config(CanonicalStore &store, const Config &config) {
  Database::Transaction txn(store.database());
  for (const auto &src : config.data_sources) {
    if (src.name.empty())
      throw ValidationError("data source name 不能为空");
    json row = {{"name", src.name},
                {"display_name", src.display_name.empty() ? src.name : src.display_name},
                {"is_active", src.is_active}};
    if (!src.description.empty())
      row["description"] = src.description;
    if (!src.base_url.empty())
      row["base_url"] = src.base_url;
    store.upsert_data_source(txn, row);
  }
  txn.commit();
  std::cout << "[Sources] 同步 " << config.data_sources.size() << " 个 data source" << std::endl;
}

// 当前启用的 source 名称 (作为 ingest 配置值显式传入)
inline std::set<std::string> load_active_names(CanonicalStore &store) {
  std::set<std::string> names;
  for (const auto &src : store.list_data_sources()) {
    if (src.is_active)
      names.insert(src.name);
  }
  return names;
}

} // namespace sources

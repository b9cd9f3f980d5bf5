#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

#include "errors.hpp"

using json = nlohmann::json;

// ============================================================================
// 配置结构
// ============================================================================

struct DataSourceConfig {
  std::string name; // 'bo3', 'hltv', ...
  std::string display_name;
  std::string description;
  std::string base_url;
  bool is_active = true;
};

struct Config {
  std::string db_path;
  int ingest_workers = 4;
  std::string default_source = "bo3";
  double min_expected_value = 0.0;
  std::vector<DataSourceConfig> data_sources;

  // 当前启用的 source(ingest 时显式传入，不做全局状态)
  std::set<std::string> active_source_names() const {
    std::set<std::string> names;
    for (const auto &src : data_sources) {
      if (src.is_active)
        names.insert(src.name);
    }
    return names;
  }

  static Config from_json(const json &j) {
    if (!j.is_object())
      throw ValidationError("配置文件根节点必须是 object");
    if (!j.contains("db_path") || !j["db_path"].is_string())
      throw ValidationError("配置文件缺少必填字段 db_path");

    Config config;
    try {
      parse_fields(j, config);
    } catch (const json::type_error &e) {
      throw ValidationError(std::string("配置字段类型错误: ") + e.what());
    }
    if (config.ingest_workers < 1)
      throw ValidationError("ingest_workers 必须 >= 1");
    return config;
  }

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw ValidationError("无法打开配置文件: " + path);

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw ValidationError(std::string("配置文件 JSON 解析失败: ") + e.what());
    }
    return from_json(j);
  }

private:
  static void parse_fields(const json &j, Config &config) {
    config.db_path = j["db_path"].get<std::string>();
    config.ingest_workers = j.value("ingest_workers", 4);
    config.default_source = j.value("default_source", std::string("bo3"));
    config.min_expected_value = j.value("min_expected_value", 0.0);

    if (j.contains("data_sources")) {
      if (!j["data_sources"].is_object())
        throw ValidationError("data_sources 必须是 object");
      for (auto &[name, source] : j["data_sources"].items()) {
        DataSourceConfig sc;
        sc.name = name;
        sc.display_name = source.value("display_name", name);
        sc.description = source.value("description", std::string());
        sc.base_url = source.value("base_url", std::string());
        sc.is_active = source.value("is_active", true);
        config.data_sources.push_back(sc);
      }
    }
  }
};

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "analytics/analytics_engine.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "ingest/batch_ingestor.hpp"
#include "ingest/ingest_coordinator.hpp"
#include "ingest/payload.hpp"
#include "query/match_query.hpp"
#include "resolve/entity_resolver.hpp"
#include "stats/stats_manager.hpp"
#include "store/canonical_store.hpp"
#include "store/source_registry.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json> <command> [args]\n"
            << "  ingest <file.json> [--source s]    ingest 单个 match 或 match 数组\n"
            << "  match <id>                         查看 match (含预测和赔率)\n"
            << "  matches [--status s] [--from d] [--to d] [--limit n] [--details]\n"
            << "  compare <id>                       预测 vs 实际结果\n"
            << "  value-bets <id> [--min-ev x]       value bet 候选\n"
            << "  delete <id>                        删除 match (级联)\n"
            << "  sources                            data source 列表\n"
            << "  stats                              ingest 统计" << std::endl;
}

// --flag value 形式的可选参数
static std::optional<std::string> option(const std::vector<std::string> &args, const char *flag) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag)
      return args[i + 1];
  }
  return std::nullopt;
}

static bool has_flag(const std::vector<std::string> &args, const char *flag) {
  for (const auto &a : args) {
    if (a == flag)
      return true;
  }
  return false;
}

static std::string required_arg(const std::vector<std::string> &args, const char *what) {
  if (args.empty() || args[0].starts_with("--"))
    throw ValidationError(std::string("缺少参数 ") + what);
  return args[0];
}

static double parse_double(const std::string &text, const char *what) {
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size())
    throw ValidationError(std::string(what) + " 不是数字: " + text);
  return v;
}

static std::string parse_date(const std::string &text, const char *what) {
  auto ts = payload::normalize_timestamp(text);
  if (!ts)
    throw ValidationError(std::string(what) + " 不是合法日期: " + text);
  return *ts;
}

static std::vector<json> read_payloads(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open())
    throw ValidationError("无法打开文件: " + path);
  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw ValidationError(std::string("JSON 解析失败: ") + e.what());
  }
  std::vector<json> payloads;
  if (j.is_array()) {
    for (auto &item : j)
      payloads.push_back(std::move(item));
  } else {
    payloads.push_back(std::move(j));
  }
  return payloads;
}

static int run(const Config &config, const std::string &command, const std::vector<std::string> &args) {
  Database db(config.db_path);
  db.init_schema();
  StatsManager::instance().set_database(&db);

  CanonicalStore store(db);
  sources::sync_from_config(store, config);

  EntityResolver resolver(store);
  IngestCoordinator coordinator(store, resolver, IngestOptions{sources::load_active_names(store)});
  MatchQuery query(store);
  analytics::Engine engine(store);

  if (command == "ingest") {
    auto payloads = read_payloads(required_arg(args, "<file.json>"));
    std::string source = option(args, "--source").value_or(config.default_source);
    BatchIngestor batch(coordinator, config.ingest_workers);
    json out = json::array();
    bool all_ok = true;
    for (const auto &o : batch.ingest_all(payloads, source)) {
      out.push_back(o.to_json());
      all_ok = all_ok && o.ok();
    }
    std::cout << out.dump(2) << std::endl;
    return all_ok ? 0 : 1;
  }

  if (command == "match") {
    auto m = query.get_match(required_arg(args, "<id>"), {.predictions = true, .odds = true});
    std::cout << m.to_json().dump(2) << std::endl;
    return 0;
  }

  if (command == "matches") {
    MatchFilter filter;
    filter.status = option(args, "--status");
    filter.source_type = option(args, "--source");
    if (auto v = option(args, "--from"))
      filter.start_from = parse_date(*v, "--from");
    if (auto v = option(args, "--to"))
      filter.start_to = parse_date(*v, "--to");
    if (auto v = option(args, "--limit")) {
      int64_t n = 0;
      auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
      if (ec != std::errc() || ptr != v->data() + v->size())
        throw ValidationError("--limit 不是整数: " + *v);
      if (n < 1)
        throw ValidationError("--limit 必须 >= 1");
      filter.limit = n;
    }
    bool details = has_flag(args, "--details");
    std::cout << query.list_matches_json(filter, {.predictions = details, .odds = details}).dump(2)
              << std::endl;
    return 0;
  }

  if (command == "compare") {
    std::cout << engine.compare_outcome(required_arg(args, "<id>")).to_json().dump(2) << std::endl;
    return 0;
  }

  if (command == "value-bets") {
    double min_ev = config.min_expected_value;
    if (auto v = option(args, "--min-ev"))
      min_ev = parse_double(*v, "--min-ev");
    json out = json::array();
    for (const auto &c : engine.evaluate_value_bets(required_arg(args, "<id>"), min_ev))
      out.push_back(c.to_json());
    std::cout << out.dump(2) << std::endl;
    return 0;
  }

  if (command == "delete") {
    coordinator.delete_match(required_arg(args, "<id>"));
    return 0;
  }

  if (command == "sources") {
    json out = json::array();
    for (const auto &s : store.list_data_sources())
      out.push_back(s.to_json());
    std::cout << out.dump(2) << std::endl;
    return 0;
  }

  if (command == "stats") {
    json out = {{"tables", json::object()}, {"ingest", StatsManager::instance().get_all_json()}};
    for (const auto *e : entities::ALL_ENTITIES)
      out["tables"][e->table] = db.get_table_count(e->table);
    std::cout << out.dump(2) << std::endl;
    return 0;
  }

  throw ValidationError("未知命令: " + command);
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = argv[i];
    } else {
      args.emplace_back(argv[i]);
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Esports Match Data Backend" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    Config config = Config::load(config_path);
    std::cout << "[Main] DB Path: " << config.db_path << std::endl;
    std::cout << "[Main] Data Sources: " << config.data_sources.size() << std::endl;
    return run(config, command, args);
  } catch (const EsportsError &e) {
    std::cerr << "[Main] " << error_kind_name(e.kind()) << ": " << e.what() << std::endl;
    return 1;
  }
}

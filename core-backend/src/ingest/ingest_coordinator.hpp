#pragma once

// ============================================================================
// IngestCoordinator - provider payload -> canonical 行
// 一个 match payload = 一个写事务: teams -> tournament -> match -> predictions / odds
// 任一步失败整体回滚
// ============================================================================

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/database.hpp"
#include "../core/entity_definition.hpp"
#include "../core/errors.hpp"
#include "../core/records.hpp"
#include "../resolve/entity_resolver.hpp"
#include "../stats/stats_manager.hpp"
#include "../store/canonical_store.hpp"
#include "payload.hpp"

using json = nlohmann::json;

struct IngestOptions {
  std::set<std::string> active_sources; // 启用的 data source 快照
};

class IngestCoordinator {
public:
  using Transaction = Database::Transaction;
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  IngestCoordinator(CanonicalStore &store, EntityResolver &resolver, IngestOptions options,
                    Clock clock = [] { return std::chrono::system_clock::now(); })
      : store_(store), resolver_(resolver), options_(std::move(options)), clock_(std::move(clock)) {}

  // ==========================================================================
  // Match
  // ==========================================================================

  std::string ingest_match(const json &raw, const std::string &source_type) {
    Counts counts;
    try {
      check_source(source_type);
      int64_t sid = validate_match_payload(raw);

      // 写锁在事务结束时释放, stats 调用必须在其后 (flush 的加锁顺序是 stats -> 写锁)
      std::string match_id;
      {
        Transaction txn(store_.database());
        match_id = ingest_match(txn, raw, source_type, sid, counts);
        txn.commit();
      }

      auto &stats = StatsManager::instance();
      stats.record_success(source_type, entities::Match.name);
      if (counts.predictions > 0)
        stats.record_success(source_type, entities::Prediction.name, counts.predictions);
      if (counts.odds > 0)
        stats.record_success(source_type, entities::OddsQuote.name, counts.odds);

      std::cout << "[Ingest] match " << source_type << "/" << sid << " -> " << match_id
                << (counts.stale ? " (已结束, 仅刷新 last_fetched_at)" : "") << std::endl;
      return match_id;
    } catch (const EsportsError &e) {
      fail(source_type, entities::Match.name, e);
      throw;
    }
  }

  // ==========================================================================
  // Prediction
  // ==========================================================================

  std::string ingest_prediction(const std::string &match_id, const json &raw, const std::string &source_type) {
    try {
      check_source(source_type);
      std::string id;
      {
        Transaction txn(store_.database());
        id = ingest_prediction(txn, match_id, raw, source_type);
        txn.commit();
      }
      StatsManager::instance().record_success(source_type, entities::Prediction.name);
      std::cout << "[Ingest] prediction " << source_type << " match=" << match_id << " -> " << id << std::endl;
      return id;
    } catch (const EsportsError &e) {
      fail(source_type, entities::Prediction.name, e);
      throw;
    }
  }

  std::string ingest_prediction(Transaction &txn, const std::string &match_id, const json &raw,
                                const std::string &source_type) {
    if (!raw.is_object())
      throw ValidationError("prediction payload 必须是 object");
    require_match(txn, match_id);

    json row = {{"match_id", match_id}, {"source_type", source_type}, {"prediction_payload", raw}};
    if (raw.contains("id")) {
      if (auto sid = payload::parse_source_id(raw["id"]))
        row["source_id"] = *sid;
    }
    return store_.upsert_prediction(txn, std::move(row));
  }

  // ==========================================================================
  // OddsQuote
  // ==========================================================================

  std::string ingest_odds_quote(const std::string &match_id, const json &raw, const std::string &source_type) {
    try {
      check_source(source_type);
      std::string id;
      {
        Transaction txn(store_.database());
        id = ingest_odds_quote(txn, match_id, raw, source_type);
        txn.commit();
      }
      StatsManager::instance().record_success(source_type, entities::OddsQuote.name);
      std::cout << "[Ingest] odds " << source_type << " match=" << match_id << " -> " << id << std::endl;
      return id;
    } catch (const EsportsError &e) {
      fail(source_type, entities::OddsQuote.name, e);
      throw;
    }
  }

  std::string ingest_odds_quote(Transaction &txn, const std::string &match_id, const json &raw,
                                const std::string &source_type) {
    if (!raw.is_object())
      throw ValidationError("odds payload 必须是 object");
    auto provider = payload::opt_str(raw, "provider");
    if (!provider || provider->empty())
      throw ValidationError("odds payload 缺少 provider");
    require_match(txn, match_id);

    json row = {{"match_id", match_id},
                {"source_type", source_type},
                {"provider", *provider},
                {"odds_payload", raw},
                {"fetched_at", payload::format_time_point(clock_())}};
    if (auto odds = side_odds(raw, "team_1")) {
      row["team1_odds"] = *odds;
      if (*odds > 0)
        row["team1_implied_prob"] = 1.0 / *odds;
    }
    if (auto odds = side_odds(raw, "team_2")) {
      row["team2_odds"] = *odds;
      if (*odds > 0)
        row["team2_implied_prob"] = 1.0 / *odds;
    }
    return store_.upsert_odds_quote(txn, std::move(row));
  }

  // ==========================================================================
  // 删除 (级联 predictions / odds_quotes)
  // ==========================================================================

  void delete_match(const std::string &match_id) {
    Transaction txn(store_.database());
    if (!store_.delete_match(txn, match_id))
      throw NotFoundError("match 不存在: " + match_id);
    txn.commit();
    std::cout << "[Ingest] 删除 match " << match_id << std::endl;
  }

private:
  struct Counts {
    int64_t predictions = 0;
    int64_t odds = 0;
    bool stale = false;
  };

  std::string ingest_match(Transaction &txn, const json &raw, const std::string &source_type, int64_t sid,
                           Counts &counts) {
    std::string status = payload::opt_str(raw, "status").value_or(records::STATUS_UPCOMING);
    std::string now = payload::format_time_point(clock_());

    // 已结束的比赛只接受 finished payload (最终对账), 其余只刷新抓取时间
    auto existing = store_.find_match_by_source(txn, source_type, sid);
    if (existing && existing->is_finished() && status != records::STATUS_FINISHED) {
      store_.touch_match(txn, existing->id, now);
      counts.stale = true;
      return existing->id;
    }

    auto team1 = resolve_side(txn, raw, "team1", source_type);
    auto team2 = resolve_side(txn, raw, "team2", source_type);
    if (team1.id == team2.id)
      throw ValidationError("team1 与 team2 是同一支队伍: " + source_type + "/" + std::to_string(team1.source_id));
    std::optional<std::string> tournament_id = resolve_tournament(txn, raw, source_type);

    json row = {{"source_type", source_type},
                {"source_id", sid},
                {"status", status},
                {"team1_id", team1.id},
                {"team2_id", team2.id},
                {"raw_payload", raw},
                {"last_fetched_at", now}};
    if (tournament_id)
      row["tournament_id"] = *tournament_id;
    if (auto v = payload::opt_str(raw, "slug"))
      row["slug"] = *v;
    if (auto v = payload::normalize_timestamp(raw, "start_date"))
      row["start_date"] = *v;
    if (auto v = payload::opt_int(raw, "bo_type"))
      row["bo_type"] = *v;
    if (auto v = payload::opt_str(raw, "tier"))
      row["tier"] = *v;

    if (status == records::STATUS_FINISHED)
      apply_result(raw, team1, team2, row);

    std::string match_id = store_.upsert_match(txn, std::move(row));

    // 内嵌块不完整时按缺失处理, 不影响 match 本身
    if (raw.contains("ai_predictions") && !raw["ai_predictions"].is_null()) {
      const json &prediction = raw["ai_predictions"];
      if (embedded_prediction_complete(prediction)) {
        ingest_prediction(txn, match_id, prediction, source_type);
        ++counts.predictions;
      } else {
        skip_embedded("ai_predictions", source_type, sid, prediction);
      }
    }
    if (raw.contains("bet_updates") && !raw["bet_updates"].is_null()) {
      const json &bets = raw["bet_updates"];
      auto take = [&](const json &quote) {
        if (embedded_odds_complete(quote)) {
          ingest_odds_quote(txn, match_id, quote, source_type);
          ++counts.odds;
        } else {
          skip_embedded("bet_updates", source_type, sid, quote);
        }
      };
      if (bets.is_array()) {
        for (const auto &quote : bets)
          take(quote);
      } else {
        take(bets);
      }
    }
    return match_id;
  }

  struct ResolvedSide {
    std::string id;
    int64_t source_id = 0;
  };

  // 内嵌预测至少要有 provider 侧 id
  static bool embedded_prediction_complete(const json &p) {
    return p.is_object() && p.contains("id") && payload::parse_source_id(p["id"]).has_value();
  }

  // 内嵌报价要有 provider 和双方报价
  static bool embedded_odds_complete(const json &q) {
    if (!q.is_object())
      return false;
    auto provider = payload::opt_str(q, "provider");
    return provider && !provider->empty() && q.contains("team_1") && q["team_1"].is_object() &&
           q.contains("team_2") && q["team_2"].is_object();
  }

  static void skip_embedded(const char *block, const std::string &source_type, int64_t sid, const json &value) {
    std::cout << "[Ingest] match " << source_type << "/" << sid << " 跳过不完整的 " << block << ": "
              << value.dump().substr(0, 120) << std::endl;
  }

  // teamN 对象优先; 否则只有 teamN_id 时按身份引用
  ResolvedSide resolve_side(Transaction &txn, const json &raw, const std::string &side,
                            const std::string &source_type) {
    std::string id_key = side + "_id";
    if (raw.contains(side) && raw[side].is_object()) {
      const json &attrs = raw[side];
      json source_id = attrs.contains("id") ? attrs["id"] : raw.value(id_key, json());
      auto sid = payload::parse_source_id(source_id);
      if (!sid)
        throw ValidationError(side + ": 缺少合法 id");
      return {resolver_.resolve_team(txn, source_type, *sid, attrs), *sid};
    }
    auto sid = payload::parse_source_id(raw.value(id_key, json()));
    if (!sid)
      throw ValidationError("缺少 " + side);
    return {resolver_.resolve_reference(txn, entities::Team, source_type, *sid), *sid};
  }

  std::optional<std::string> resolve_tournament(Transaction &txn, const json &raw,
                                                const std::string &source_type) {
    if (raw.contains("tournament") && raw["tournament"].is_object()) {
      const json &attrs = raw["tournament"];
      json source_id = attrs.contains("id") ? attrs["id"] : raw.value("tournament_id", json());
      return resolver_.resolve_tournament(txn, source_type, source_id, attrs);
    }
    if (raw.contains("tournament_id") && !raw["tournament_id"].is_null())
      return resolver_.resolve_reference(txn, entities::Tournament, source_type, raw["tournament_id"]);
    return std::nullopt;
  }

  // finished: 比分必填且不能平局, 胜负由比分推出
  static void apply_result(const json &raw, const ResolvedSide &team1, const ResolvedSide &team2, json &row) {
    auto s1 = payload::opt_int(raw, "team1_score");
    auto s2 = payload::opt_int(raw, "team2_score");
    if (!s1 || !s2)
      throw ValidationError("finished match 缺少比分");
    if (*s1 < 0 || *s2 < 0)
      throw ValidationError("比分不能为负");
    if (*s1 == *s2)
      throw ValidationError("finished match 比分相同: " + std::to_string(*s1) + ":" + std::to_string(*s2));

    const ResolvedSide &winner = *s1 > *s2 ? team1 : team2;
    const ResolvedSide &loser = *s1 > *s2 ? team2 : team1;

    if (raw.contains("winner_team_id") && !raw["winner_team_id"].is_null()) {
      auto claimed = payload::parse_source_id(raw["winner_team_id"]);
      if (!claimed || *claimed != winner.source_id)
        throw ValidationError("winner_team_id " + raw["winner_team_id"].dump() + " 与比分 " +
                              std::to_string(*s1) + ":" + std::to_string(*s2) + " 不一致");
    }

    row["team1_score"] = *s1;
    row["team2_score"] = *s2;
    row["winner_team_id"] = winner.id;
    row["loser_team_id"] = loser.id;
  }

  static int64_t validate_match_payload(const json &raw) {
    if (!raw.is_object())
      throw ValidationError("match payload 必须是 object");
    auto sid = payload::parse_source_id(raw.value("id", json()));
    if (!sid)
      throw ValidationError("match payload 缺少合法 id");
    if (raw.contains("status") && !raw["status"].is_null() &&
        (!raw["status"].is_string() || raw["status"].get_ref<const std::string &>().empty()))
      throw ValidationError("match status 不合法: " + raw["status"].dump());
    for (const char *side : {"team1", "team2"}) {
      std::string id_key = std::string(side) + "_id";
      bool has_object = raw.contains(side) && raw[side].is_object();
      bool has_id = raw.contains(id_key) && !raw[id_key].is_null();
      if (!has_object && !has_id)
        throw ValidationError(std::string("match payload 缺少 ") + side);
    }
    return *sid;
  }

  // team_N.coeff: 数字或数字字符串
  static std::optional<double> side_odds(const json &raw, const char *side) {
    if (!raw.contains(side) || !raw[side].is_object())
      return std::nullopt;
    const json &s = raw[side];
    if (!s.contains("coeff"))
      return std::nullopt;
    if (s["coeff"].is_number())
      return s["coeff"].get<double>();
    if (s["coeff"].is_string()) {
      const std::string &text = s["coeff"].get_ref<const std::string &>();
      char *end = nullptr;
      double v = std::strtod(text.c_str(), &end);
      if (!text.empty() && end == text.c_str() + text.size())
        return v;
      throw ValidationError(std::string(side) + ".coeff 不合法: " + text);
    }
    return std::nullopt;
  }

  void check_source(const std::string &source_type) const {
    if (source_type.empty())
      throw ValidationError("source_type 为空");
    if (!options_.active_sources.count(source_type))
      throw ValidationError("data source 未注册或未启用: " + source_type);
  }

  void require_match(Transaction &txn, const std::string &match_id) {
    if (!store_.match_exists(txn, match_id))
      throw ReferenceError("match 不存在: " + match_id);
  }

  static void fail(const std::string &source_type, const char *entity, const EsportsError &e) {
    StatsManager::instance().record_failure(source_type, entity, e.kind());
    std::cerr << "[Ingest] " << entity << " 失败 (" << error_kind_name(e.kind()) << "): " << e.what()
              << std::endl;
  }

  CanonicalStore &store_;
  EntityResolver &resolver_;
  IngestOptions options_;
  Clock clock_;
};

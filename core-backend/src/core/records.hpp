#pragma once

// ============================================================================
// Canonical 行结构 (从 query_json 的行对象解析)
// ============================================================================

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace records {

inline constexpr const char *STATUS_UPCOMING = "upcoming";
inline constexpr const char *STATUS_FINISHED = "finished";

// ============================================================================
// 行字段提取
// ============================================================================

inline std::optional<std::string> opt_str(const json &row, const char *key) {
  if (!row.contains(key) || row[key].is_null())
    return std::nullopt;
  if (row[key].is_string())
    return row[key].get<std::string>();
  return row[key].dump();
}

inline std::optional<int64_t> opt_int(const json &row, const char *key) {
  if (!row.contains(key) || !row[key].is_number())
    return std::nullopt;
  return row[key].get<int64_t>();
}

inline std::optional<double> opt_double(const json &row, const char *key) {
  if (!row.contains(key) || !row[key].is_number())
    return std::nullopt;
  return row[key].get<double>();
}

// VARCHAR 中的 JSON 文本 -> json (写入时总是 dump 出来的, 解析失败按原文保留)
inline json parse_blob(const json &row, const char *key) {
  if (!row.contains(key) || !row[key].is_string())
    return nullptr;
  json parsed = json::parse(row[key].get<std::string>(), nullptr, false);
  if (parsed.is_discarded())
    return row[key];
  return parsed;
}

template <typename T>
inline json or_null(const std::optional<T> &v) {
  if (!v)
    return nullptr;
  return json(*v);
}

// ============================================================================
// DataSource
// ============================================================================
struct DataSourceRecord {
  std::string id;
  std::string name;
  std::string display_name;
  std::optional<std::string> description;
  std::optional<std::string> base_url;
  bool is_active = true;

  static DataSourceRecord from_row(const json &row) {
    DataSourceRecord r;
    r.id = row.at("id").get<std::string>();
    r.name = row.at("name").get<std::string>();
    r.display_name = row.at("display_name").get<std::string>();
    r.description = opt_str(row, "description");
    r.base_url = opt_str(row, "base_url");
    r.is_active = row.value("is_active", true);
    return r;
  }

  json to_json() const {
    return {{"id", id}, {"name", name}, {"display_name", display_name},
            {"description", or_null(description)}, {"base_url", or_null(base_url)},
            {"is_active", is_active}};
  }
};

// ============================================================================
// Team
// ============================================================================
struct TeamRecord {
  std::string id;
  std::string source_type;
  int64_t source_id = 0;
  std::string name;
  std::optional<std::string> slug;
  std::optional<std::string> country_code;
  std::optional<std::string> logo_url;
  json metadata;

  static TeamRecord from_row(const json &row) {
    TeamRecord r;
    r.id = row.at("id").get<std::string>();
    r.source_type = row.at("source_type").get<std::string>();
    r.source_id = row.at("source_id").get<int64_t>();
    r.name = row.at("name").get<std::string>();
    r.slug = opt_str(row, "slug");
    r.country_code = opt_str(row, "country_code");
    r.logo_url = opt_str(row, "logo_url");
    r.metadata = parse_blob(row, "metadata");
    return r;
  }

  json to_json() const {
    return {{"id", id}, {"source_type", source_type}, {"source_id", source_id},
            {"name", name}, {"slug", or_null(slug)}, {"country_code", or_null(country_code)},
            {"logo_url", or_null(logo_url)}, {"metadata", metadata}};
  }
};

// ============================================================================
// Tournament
// ============================================================================
struct TournamentRecord {
  std::string id;
  std::string source_type;
  int64_t source_id = 0;
  std::string name;
  std::optional<std::string> slug;
  std::optional<std::string> tier;
  std::optional<int64_t> tier_rank;
  std::optional<int64_t> prize_pool;
  std::optional<std::string> status;
  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  json metadata;

  static TournamentRecord from_row(const json &row) {
    TournamentRecord r;
    r.id = row.at("id").get<std::string>();
    r.source_type = row.at("source_type").get<std::string>();
    r.source_id = row.at("source_id").get<int64_t>();
    r.name = row.at("name").get<std::string>();
    r.slug = opt_str(row, "slug");
    r.tier = opt_str(row, "tier");
    r.tier_rank = opt_int(row, "tier_rank");
    r.prize_pool = opt_int(row, "prize_pool");
    r.status = opt_str(row, "status");
    r.start_date = opt_str(row, "start_date");
    r.end_date = opt_str(row, "end_date");
    r.metadata = parse_blob(row, "metadata");
    return r;
  }

  json to_json() const {
    return {{"id", id}, {"source_type", source_type}, {"source_id", source_id},
            {"name", name}, {"slug", or_null(slug)}, {"tier", or_null(tier)},
            {"tier_rank", or_null(tier_rank)}, {"prize_pool", or_null(prize_pool)},
            {"status", or_null(status)}, {"start_date", or_null(start_date)},
            {"end_date", or_null(end_date)}, {"metadata", metadata}};
  }
};

// ============================================================================
// Prediction
// ============================================================================
struct PredictionRecord {
  std::string id;
  std::string match_id;
  std::string source_type;
  std::optional<int64_t> source_id;
  json payload;
  std::string created_at;

  static PredictionRecord from_row(const json &row) {
    PredictionRecord r;
    r.id = row.at("id").get<std::string>();
    r.match_id = row.at("match_id").get<std::string>();
    r.source_type = row.at("source_type").get<std::string>();
    r.source_id = opt_int(row, "source_id");
    r.payload = parse_blob(row, "prediction_payload");
    r.created_at = opt_str(row, "created_at").value_or("");
    return r;
  }

  json to_json() const {
    return {{"id", id}, {"match_id", match_id}, {"source_type", source_type},
            {"source_id", or_null(source_id)}, {"prediction_payload", payload},
            {"created_at", created_at}};
  }
};

// ============================================================================
// OddsQuote
// ============================================================================
struct OddsQuoteRecord {
  std::string id;
  std::string match_id;
  std::string source_type;
  std::string provider;
  std::optional<double> team1_odds;
  std::optional<double> team2_odds;
  std::optional<double> team1_implied_prob;
  std::optional<double> team2_implied_prob;
  json payload;
  std::optional<std::string> fetched_at;

  static OddsQuoteRecord from_row(const json &row) {
    OddsQuoteRecord r;
    r.id = row.at("id").get<std::string>();
    r.match_id = row.at("match_id").get<std::string>();
    r.source_type = row.at("source_type").get<std::string>();
    r.provider = row.at("provider").get<std::string>();
    r.team1_odds = opt_double(row, "team1_odds");
    r.team2_odds = opt_double(row, "team2_odds");
    r.team1_implied_prob = opt_double(row, "team1_implied_prob");
    r.team2_implied_prob = opt_double(row, "team2_implied_prob");
    r.payload = parse_blob(row, "odds_payload");
    r.fetched_at = opt_str(row, "fetched_at");
    return r;
  }

  json to_json() const {
    return {{"id", id}, {"match_id", match_id}, {"source_type", source_type},
            {"provider", provider}, {"team1_odds", or_null(team1_odds)},
            {"team2_odds", or_null(team2_odds)},
            {"team1_implied_prob", or_null(team1_implied_prob)},
            {"team2_implied_prob", or_null(team2_implied_prob)},
            {"odds_payload", payload}, {"fetched_at", or_null(fetched_at)}};
  }
};

// ============================================================================
// Match
// ============================================================================
struct MatchRecord {
  std::string id;
  std::string source_type;
  int64_t source_id = 0;
  std::optional<std::string> slug;
  std::optional<std::string> team1_id;
  std::optional<std::string> team2_id;
  std::optional<std::string> tournament_id;
  std::string status;
  std::optional<std::string> start_date;
  std::optional<int64_t> bo_type;
  std::optional<std::string> tier;
  std::optional<int64_t> team1_score;
  std::optional<int64_t> team2_score;
  std::optional<std::string> winner_team_id;
  std::optional<std::string> loser_team_id;
  json raw_payload;
  std::optional<std::string> last_fetched_at;

  // 按需附带
  std::vector<PredictionRecord> predictions;
  std::vector<OddsQuoteRecord> odds;

  bool is_finished() const { return status == STATUS_FINISHED; }

  static MatchRecord from_row(const json &row) {
    MatchRecord r;
    r.id = row.at("id").get<std::string>();
    r.source_type = row.at("source_type").get<std::string>();
    r.source_id = row.at("source_id").get<int64_t>();
    r.slug = opt_str(row, "slug");
    r.team1_id = opt_str(row, "team1_id");
    r.team2_id = opt_str(row, "team2_id");
    r.tournament_id = opt_str(row, "tournament_id");
    r.status = row.at("status").get<std::string>();
    r.start_date = opt_str(row, "start_date");
    r.bo_type = opt_int(row, "bo_type");
    r.tier = opt_str(row, "tier");
    r.team1_score = opt_int(row, "team1_score");
    r.team2_score = opt_int(row, "team2_score");
    r.winner_team_id = opt_str(row, "winner_team_id");
    r.loser_team_id = opt_str(row, "loser_team_id");
    r.raw_payload = parse_blob(row, "raw_payload");
    r.last_fetched_at = opt_str(row, "last_fetched_at");
    return r;
  }

  json to_json() const {
    json j = {{"id", id}, {"source_type", source_type}, {"source_id", source_id},
              {"slug", or_null(slug)}, {"team1_id", or_null(team1_id)},
              {"team2_id", or_null(team2_id)}, {"tournament_id", or_null(tournament_id)},
              {"status", status}, {"start_date", or_null(start_date)},
              {"bo_type", or_null(bo_type)}, {"tier", or_null(tier)},
              {"team1_score", or_null(team1_score)}, {"team2_score", or_null(team2_score)},
              {"winner_team_id", or_null(winner_team_id)},
              {"loser_team_id", or_null(loser_team_id)},
              {"raw_payload", raw_payload}, {"last_fetched_at", or_null(last_fetched_at)}};
    if (!predictions.empty()) {
      j["predictions"] = json::array();
      for (const auto &p : predictions)
        j["predictions"].push_back(p.to_json());
    }
    if (!odds.empty()) {
      j["odds"] = json::array();
      for (const auto &o : odds)
        j["odds"].push_back(o.to_json());
    }
    return j;
  }
};

} // namespace records

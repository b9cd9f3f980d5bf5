#pragma once

// ============================================================================
// MatchQuery - 查询入口 (只读连接)
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../core/records.hpp"
#include "../store/canonical_store.hpp"

using json = nlohmann::json;

struct MatchInclude {
  bool predictions = false;
  bool odds = false;
};

class MatchQuery {
public:
  explicit MatchQuery(CanonicalStore &store) : store_(store) {}

  std::vector<records::MatchRecord> list_matches(const MatchFilter &filter, MatchInclude include = {}) {
    auto matches = store_.list_matches(filter);
    for (auto &m : matches)
      attach(m, include);
    return matches;
  }

  records::MatchRecord get_match(const std::string &match_id, MatchInclude include = {}) {
    auto match = store_.get_match(match_id);
    if (!match)
      throw NotFoundError("match 不存在: " + match_id);
    attach(*match, include);
    return *match;
  }

  std::vector<records::PredictionRecord> get_predictions(const std::string &match_id) {
    return store_.get_predictions(match_id);
  }

  std::vector<records::OddsQuoteRecord> get_odds(const std::string &match_id,
                                                 const std::optional<std::string> &provider = std::nullopt) {
    return store_.get_odds(match_id, provider);
  }

  std::optional<records::TeamRecord> find_team_by_source(const std::string &source_type, int64_t source_id) {
    return store_.find_team_by_source(source_type, source_id);
  }

  json list_matches_json(const MatchFilter &filter, MatchInclude include = {}) {
    json rows = json::array();
    for (const auto &m : list_matches(filter, include))
      rows.push_back(m.to_json());
    return rows;
  }

private:
  void attach(records::MatchRecord &match, MatchInclude include) {
    if (include.predictions)
      match.predictions = store_.get_predictions(match.id);
    if (include.odds)
      match.odds = store_.get_odds(match.id);
  }

  CanonicalStore &store_;
};

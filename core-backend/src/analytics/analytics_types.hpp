#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/records.hpp"

using json = nlohmann::json;

namespace analytics {

// ============================================================================
// 预测 vs 实际结果
// applicable = false 时只有 reason 有意义 (不是错误)
// ============================================================================
struct ComparisonResult {
  std::string match_id;
  bool applicable = false;
  std::string reason;

  std::string prediction_source_type;
  std::optional<std::string> predicted_winner_team_id; // canonical team id
  std::optional<std::string> actual_winner_team_id;
  bool correct = false;
  std::optional<double> confidence;  // overall_proximity_factor
  std::optional<bool> score_correct; // 预测比分完全一致

  static ComparisonResult not_applicable(const std::string &match_id, const std::string &reason) {
    ComparisonResult r;
    r.match_id = match_id;
    r.reason = reason;
    return r;
  }

  json to_json() const {
    json j = {{"match_id", match_id}, {"applicable", applicable}};
    if (!applicable) {
      j["reason"] = reason;
      return j;
    }
    j["prediction_source_type"] = prediction_source_type;
    j["predicted_winner_team_id"] = records::or_null(predicted_winner_team_id);
    j["actual_winner_team_id"] = records::or_null(actual_winner_team_id);
    j["correct"] = correct;
    j["confidence"] = records::or_null(confidence);
    j["score_correct"] = records::or_null(score_correct);
    return j;
  }
};

// ============================================================================
// Value bet 候选 (每个报价的每一边)
// ============================================================================
struct ValueBetCandidate {
  std::string match_id;
  std::string source_type;
  std::string provider;
  int side = 1; // 1 = team1, 2 = team2
  std::optional<std::string> team_id;
  double odds = 0.0;
  double implied_probability = 0.0;
  double estimated_probability = 0.0;
  double expected_value = 0.0;
  double kelly_fraction = 0.0;

  json to_json() const {
    return {{"match_id", match_id},
            {"source_type", source_type},
            {"provider", provider},
            {"side", side == 1 ? "team1" : "team2"},
            {"team_id", records::or_null(team_id)},
            {"odds", odds},
            {"implied_probability", implied_probability},
            {"estimated_probability", estimated_probability},
            {"expected_value", expected_value},
            {"kelly_fraction", kelly_fraction}};
  }
};

// 预测给出的双方胜率估计; 缺失的一边为 nullopt
struct ProbabilityEstimate {
  std::optional<double> team1;
  std::optional<double> team2;

  bool empty() const { return !team1 && !team2; }
};

} // namespace analytics

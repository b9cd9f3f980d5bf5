#pragma once

// ============================================================================
// Analytics Engine - 预测 / 赔率 / 结果 对比
//
// compare_outcome()     : 预测胜者 vs 实际胜者
// evaluate_value_bets() : 预测胜率 vs 赔率隐含概率, 输出 EV / Kelly
// ============================================================================

#include "analytics_types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../core/records.hpp"
#include "../ingest/payload.hpp"
#include "../store/canonical_store.hpp"

using json = nlohmann::json;

namespace analytics {

// ============================================================================
// 数值工具
// ============================================================================

// decimal odds -> 隐含概率; odds <= 0 无意义
inline std::optional<double> implied_probability(double odds) {
  if (odds <= 0.0)
    return std::nullopt;
  return 1.0 / odds;
}

// 单位注额期望收益
inline double expected_value(double probability, double odds) {
  return probability * odds - 1.0;
}

// Kelly 注额比例, 截断到 [0, 1]; 要求 odds > 1
inline double kelly_fraction(double probability, double odds) {
  if (odds <= 1.0)
    return 0.0;
  double f = (odds * probability - 1.0) / (odds - 1.0);
  return std::clamp(f, 0.0, 1.0);
}

// "(2, 1)" -> {2, 1}
inline std::optional<std::pair<int64_t, int64_t>> parse_scoreline(const std::string &key) {
  int64_t a = 0, b = 0;
  size_t i = 0;
  auto skip_ws = [&]() {
    while (i < key.size() && key[i] == ' ')
      ++i;
  };
  // 比分最多 9 位, 避免溢出
  auto read_num = [&](int64_t &out) -> bool {
    size_t start = i;
    out = 0;
    while (i < key.size() && key[i] >= '0' && key[i] <= '9') {
      if (i - start >= 9)
        return false;
      out = out * 10 + (key[i++] - '0');
    }
    return i > start;
  };

  skip_ws();
  if (i >= key.size() || key[i++] != '(')
    return std::nullopt;
  skip_ws();
  if (!read_num(a))
    return std::nullopt;
  skip_ws();
  if (i >= key.size() || key[i++] != ',')
    return std::nullopt;
  skip_ws();
  if (!read_num(b))
    return std::nullopt;
  skip_ws();
  if (i >= key.size() || key[i++] != ')')
    return std::nullopt;
  skip_ws();
  if (i != key.size())
    return std::nullopt;
  return std::make_pair(a, b);
}

// 胜率估计: 显式 teamN_win_probability 优先,
// 否则 proximity_factors 按 "赢下的比分因子之和 / 全部因子之和" 归一化
inline ProbabilityEstimate estimate_probabilities(const json &prediction) {
  ProbabilityEstimate est;
  if (!prediction.is_object())
    return est;

  auto explicit_prob = [&](const char *key) -> std::optional<double> {
    auto v = payload::opt_double(prediction, key);
    if (v && *v >= 0.0 && *v <= 1.0)
      return v;
    return std::nullopt;
  };
  est.team1 = explicit_prob("team1_win_probability");
  est.team2 = explicit_prob("team2_win_probability");
  if (!est.empty())
    return est;

  if (!prediction.contains("prediction_scores_data") || !prediction["prediction_scores_data"].is_object())
    return est;
  const json &scores = prediction["prediction_scores_data"];
  if (!scores.contains("proximity_factors") || !scores["proximity_factors"].is_object())
    return est;

  double total = 0.0, team1 = 0.0, team2 = 0.0;
  for (auto &[key, value] : scores["proximity_factors"].items()) {
    auto scoreline = parse_scoreline(key);
    if (!scoreline || !value.is_number())
      continue;
    double factor = value.get<double>();
    if (factor < 0.0)
      continue;
    total += factor;
    if (scoreline->first > scoreline->second)
      team1 += factor;
    else if (scoreline->second > scoreline->first)
      team2 += factor;
  }
  if (total <= 0.0)
    return est;
  est.team1 = team1 / total;
  est.team2 = team2 / total;
  return est;
}

// ============================================================================
// Engine
// ============================================================================
class Engine {
public:
  explicit Engine(CanonicalStore &store) : store_(store) {}

  ComparisonResult compare_outcome(const std::string &match_id) {
    auto match = load_match(match_id);

    if (!match.is_finished())
      return ComparisonResult::not_applicable(match_id, "match 未结束 (status=" + match.status + ")");
    auto prediction = pick_prediction(match);
    if (!prediction)
      return ComparisonResult::not_applicable(match_id, "没有预测");

    const json &p = prediction->payload;
    auto predicted_sid = p.is_object() && p.contains("prediction_winner_team_id")
                             ? payload::parse_source_id(p["prediction_winner_team_id"])
                             : std::nullopt;
    if (!predicted_sid)
      return ComparisonResult::not_applicable(match_id, "预测缺少 prediction_winner_team_id");
    auto predicted_team = store_.find_team_by_source(prediction->source_type, *predicted_sid);
    if (!predicted_team)
      return ComparisonResult::not_applicable(
          match_id, "预测胜者无法解析: " + prediction->source_type + "/" + std::to_string(*predicted_sid));

    ComparisonResult r;
    r.match_id = match_id;
    r.applicable = true;
    r.prediction_source_type = prediction->source_type;
    r.predicted_winner_team_id = predicted_team->id;
    r.actual_winner_team_id = match.winner_team_id;
    r.correct = match.winner_team_id && *match.winner_team_id == predicted_team->id;

    if (p.contains("prediction_scores_data") && p["prediction_scores_data"].is_object())
      r.confidence = payload::opt_double(p["prediction_scores_data"], "overall_proximity_factor");

    auto ps1 = payload::opt_int(p, "prediction_team1_score");
    auto ps2 = payload::opt_int(p, "prediction_team2_score");
    if (ps1 && ps2 && match.team1_score && match.team2_score)
      r.score_correct = *ps1 == *match.team1_score && *ps2 == *match.team2_score;
    return r;
  }

  // EV 严格大于 min_expected_value 的候选, 按 EV 降序
  std::vector<ValueBetCandidate> evaluate_value_bets(const std::string &match_id, double min_expected_value) {
    auto match = load_match(match_id);

    std::vector<ValueBetCandidate> out;
    auto prediction = pick_prediction(match);
    if (!prediction)
      return out;
    ProbabilityEstimate est = estimate_probabilities(prediction->payload);
    if (est.empty())
      return out;

    for (const auto &quote : store_.get_odds(match_id)) {
      add_candidate(out, match, quote, 1, quote.team1_odds, est.team1, min_expected_value);
      add_candidate(out, match, quote, 2, quote.team2_odds, est.team2, min_expected_value);
    }
    std::stable_sort(out.begin(), out.end(), [](const ValueBetCandidate &a, const ValueBetCandidate &b) {
      return a.expected_value > b.expected_value;
    });
    return out;
  }

private:
  records::MatchRecord load_match(const std::string &match_id) {
    auto match = store_.get_match(match_id);
    if (!match)
      throw NotFoundError("match 不存在: " + match_id);
    return *match;
  }

  // 同 source 的预测优先, 否则取最早的一条
  std::optional<records::PredictionRecord> pick_prediction(const records::MatchRecord &match) {
    auto predictions = store_.get_predictions(match.id);
    if (predictions.empty())
      return std::nullopt;
    for (const auto &p : predictions) {
      if (p.source_type == match.source_type)
        return p;
    }
    return predictions.front();
  }

  static void add_candidate(std::vector<ValueBetCandidate> &out, const records::MatchRecord &match,
                            const records::OddsQuoteRecord &quote, int side, std::optional<double> odds,
                            std::optional<double> probability, double min_expected_value) {
    if (!odds || !probability || *odds <= 1.0)
      return;
    double ev = expected_value(*probability, *odds);
    if (!(ev > min_expected_value))
      return;

    ValueBetCandidate c;
    c.match_id = match.id;
    c.source_type = quote.source_type;
    c.provider = quote.provider;
    c.side = side;
    c.team_id = side == 1 ? match.team1_id : match.team2_id;
    c.odds = *odds;
    c.implied_probability = 1.0 / *odds;
    c.estimated_probability = *probability;
    c.expected_value = ev;
    c.kelly_fraction = kelly_fraction(*probability, *odds);
    out.push_back(std::move(c));
  }

  CanonicalStore &store_;
};

} // namespace analytics

#pragma once

// ============================================================================
// BatchIngestor - 多个独立 match payload 并行 ingest
// 每个 payload 各自一个事务; 写入由 Database 写锁串行化
// ============================================================================

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../stats/stats_manager.hpp"
#include "ingest_coordinator.hpp"

namespace asio = boost::asio;
using json = nlohmann::json;

struct IngestOutcome {
  size_t index = 0;                      // 输入中的位置
  std::optional<std::string> match_id;   // 成功时
  std::optional<ErrorKind> error;        // 失败时
  std::string message;

  bool ok() const { return match_id.has_value(); }

  json to_json() const {
    json j = {{"index", index}, {"ok", ok()}};
    if (match_id)
      j["match_id"] = *match_id;
    if (error) {
      j["error"] = error_kind_name(*error);
      j["message"] = message;
    }
    return j;
  }
};

class BatchIngestor {
public:
  BatchIngestor(IngestCoordinator &coordinator, int workers)
      : coordinator_(coordinator), workers_(workers < 1 ? 1 : workers) {}

  // 结果与输入一一对应; 单个失败不影响其他 payload
  std::vector<IngestOutcome> ingest_all(const std::vector<json> &payloads, const std::string &source_type) {
    std::vector<IngestOutcome> outcomes(payloads.size());
    asio::thread_pool pool(static_cast<size_t>(workers_));

    for (size_t i = 0; i < payloads.size(); ++i) {
      asio::post(pool, [this, &payloads, &outcomes, &source_type, i]() {
        IngestOutcome &out = outcomes[i];
        out.index = i;
        try {
          out.match_id = coordinator_.ingest_match(payloads[i], source_type);
        } catch (const EsportsError &e) {
          out.error = e.kind();
          out.message = e.what();
        } catch (const std::exception &e) {
          // 非分类异常 (DuckDB / 时钟等) 归为 STORAGE, 不能逃出 worker
          out.error = ErrorKind::STORAGE;
          out.message = e.what();
          std::cerr << "[Batch] " << source_type << " #" << i << " 未分类异常: " << e.what() << std::endl;
        }
      });
    }
    pool.join();

    size_t ok = 0;
    for (const auto &o : outcomes)
      ok += o.ok() ? 1 : 0;
    std::cout << "[Batch] " << source_type << ": " << ok << "/" << payloads.size() << " 成功" << std::endl;

    StatsManager::instance().flush();
    return outcomes;
  }

private:
  IngestCoordinator &coordinator_;
  int workers_;
};

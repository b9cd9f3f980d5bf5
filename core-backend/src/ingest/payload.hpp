#pragma once

// ============================================================================
// Provider payload 规范化工具
// source id 校验 / ISO-8601 时间戳 -> UTC 'YYYY-MM-DD HH:MM:SS[.ffffff]'
// ============================================================================

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace payload {

// source 本地 id: 正整数, 或十进制数字字符串
inline std::optional<int64_t> parse_source_id(const json &v) {
  if (v.is_number_integer()) {
    int64_t id = v.get<int64_t>();
    if (id > 0)
      return id;
    return std::nullopt;
  }
  if (v.is_string()) {
    const auto &s = v.get_ref<const std::string &>();
    if (s.empty() || s.size() > 18)
      return std::nullopt;
    int64_t id = 0;
    for (char c : s) {
      if (c < '0' || c > '9')
        return std::nullopt;
      id = id * 10 + (c - '0');
    }
    if (id > 0)
      return id;
  }
  return std::nullopt;
}

// JSON 数字 -> int64; 非有限值或超出 int64 范围按缺失处理
inline std::optional<int64_t> to_int64(const json &v) {
  if (v.is_number_unsigned()) {
    uint64_t u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(INT64_MAX))
      return std::nullopt;
    return static_cast<int64_t>(u);
  }
  if (v.is_number_integer())
    return v.get<int64_t>();
  if (v.is_number_float()) {
    double d = v.get<double>();
    // 2^63 本身不可表示, 上界取开区间
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
      return std::nullopt;
    return static_cast<int64_t>(d);
  }
  return std::nullopt;
}

inline std::optional<int64_t> opt_int(const json &j, const char *key) {
  if (!j.contains(key))
    return std::nullopt;
  return to_int64(j[key]);
}

inline std::optional<double> opt_double(const json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_number())
    return std::nullopt;
  return j[key].get<double>();
}

inline std::optional<std::string> opt_str(const json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_string())
    return std::nullopt;
  return j[key].get<std::string>();
}

// epoch 微秒 -> 'YYYY-MM-DD HH:MM:SS[.ffffff]'
inline std::string format_epoch_micros(int64_t micros) {
  using std::chrono::microseconds;
  std::chrono::sys_time<microseconds> tp{microseconds(micros)};
  auto day = std::chrono::floor<std::chrono::days>(tp);
  std::chrono::year_month_day ymd{day};
  std::chrono::hh_mm_ss<microseconds> tod{tp - day};

  char buf[40];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02lld:%02lld:%02lld",
                        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                        static_cast<unsigned>(ymd.day()), static_cast<long long>(tod.hours().count()),
                        static_cast<long long>(tod.minutes().count()),
                        static_cast<long long>(tod.seconds().count()));
  if (tod.subseconds().count() != 0 && n > 0)
    std::snprintf(buf + n, sizeof(buf) - n, ".%06lld", static_cast<long long>(tod.subseconds().count()));
  return buf;
}

inline std::string format_time_point(std::chrono::system_clock::time_point tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
  return format_epoch_micros(micros);
}

// ISO-8601: YYYY-MM-DD[(T| )HH:MM[:SS[.f+]]][Z|(+|-)HH[:]MM]
// 解析失败返回 nullopt (与上游解析器一致: 坏日期按缺失处理)
inline std::optional<std::string> normalize_timestamp(const std::string &s) {
  size_t i = 0;
  auto read_num = [&](size_t width, int64_t &out) -> bool {
    if (i + width > s.size())
      return false;
    int64_t v = 0;
    for (size_t k = 0; k < width; ++k) {
      char c = s[i + k];
      if (c < '0' || c > '9')
        return false;
      v = v * 10 + (c - '0');
    }
    out = v;
    i += width;
    return true;
  };
  auto expect = [&](char c) -> bool {
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  };

  int64_t y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, micros = 0, offset_min = 0;
  if (!read_num(4, y) || !expect('-') || !read_num(2, mo) || !expect('-') || !read_num(2, d))
    return std::nullopt;

  if (i < s.size() && (s[i] == 'T' || s[i] == ' ')) {
    ++i;
    if (!read_num(2, h) || !expect(':') || !read_num(2, mi))
      return std::nullopt;
    if (expect(':') && !read_num(2, sec))
      return std::nullopt;
    if (expect('.')) {
      int digits = 0;
      while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        if (digits < 6) {
          micros = micros * 10 + (s[i] - '0');
          ++digits;
        }
        ++i;
      }
      if (digits == 0)
        return std::nullopt;
      for (; digits < 6; ++digits)
        micros *= 10;
    }
    if (expect('Z')) {
      // UTC
    } else if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
      int sign = s[i] == '-' ? -1 : 1;
      ++i;
      int64_t oh = 0, om = 0;
      if (!read_num(2, oh))
        return std::nullopt;
      expect(':');
      if (i < s.size() && !read_num(2, om))
        return std::nullopt;
      if (oh > 23 || om > 59)
        return std::nullopt;
      offset_min = sign * (oh * 60 + om);
    }
  }
  if (i != s.size())
    return std::nullopt;

  if (h > 23 || mi > 59 || sec > 59)
    return std::nullopt;
  std::chrono::year_month_day ymd{std::chrono::year(static_cast<int>(y)),
                                  std::chrono::month(static_cast<unsigned>(mo)),
                                  std::chrono::day(static_cast<unsigned>(d))};
  if (!ymd.ok())
    return std::nullopt;

  auto tp = std::chrono::sys_days(ymd) + std::chrono::hours(h) + std::chrono::minutes(mi) +
            std::chrono::seconds(sec) - std::chrono::minutes(offset_min);
  auto epoch_micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
  return format_epoch_micros(epoch_micros + micros);
}

inline std::optional<std::string> normalize_timestamp(const json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_string())
    return std::nullopt;
  return normalize_timestamp(j[key].get<std::string>());
}

} // namespace payload

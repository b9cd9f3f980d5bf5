#pragma once

// ============================================================================
// 错误分类
// ValidationError / ConflictError / ReferenceError / NotFoundError / StorageError
// ============================================================================

#include <cstdint>
#include <stdexcept>
#include <string>

enum class ErrorKind : uint8_t {
  VALIDATION = 0, // 输入 payload 不合法(不重试)
  CONFLICT = 1,   // 唯一键冲突(绕过 resolver 的写入)
  REFERENCE = 2,  // 外部实体无法解析
  NOT_FOUND = 3,  // 查询的 id 不存在
  STORAGE = 4,    // DuckDB 连接/事务失败(调用方可重试)
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::VALIDATION: return "validation";
  case ErrorKind::CONFLICT:   return "conflict";
  case ErrorKind::REFERENCE:  return "reference";
  case ErrorKind::NOT_FOUND:  return "not_found";
  case ErrorKind::STORAGE:    return "storage";
  }
  return "unknown";
}

class EsportsError : public std::runtime_error {
public:
  EsportsError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ValidationError : public EsportsError {
public:
  explicit ValidationError(const std::string &what) : EsportsError(ErrorKind::VALIDATION, what) {}
};

class ConflictError : public EsportsError {
public:
  explicit ConflictError(const std::string &what) : EsportsError(ErrorKind::CONFLICT, what) {}
};

class ReferenceError : public EsportsError {
public:
  explicit ReferenceError(const std::string &what) : EsportsError(ErrorKind::REFERENCE, what) {}
};

class NotFoundError : public EsportsError {
public:
  explicit NotFoundError(const std::string &what) : EsportsError(ErrorKind::NOT_FOUND, what) {}
};

class StorageError : public EsportsError {
public:
  explicit StorageError(const std::string &what) : EsportsError(ErrorKind::STORAGE, what) {}
};

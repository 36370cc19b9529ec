#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace schedstore::util {

/*
  Central error types.

  Every public store operation reports failures through this closed set.
  Native errors (pqxx, sqlite, rocksdb, protobuf json, env, integer parsing)
  are translated at the boundary; most native detail is dropped on purpose.
*/

enum class StoreErrorCode {
  DatabaseError,
  NotFound,
  JsonError,
  EnvVarError,
  IntError,
  MessageExists
};

std::string_view ToString(StoreErrorCode code);

class StoreError : public std::runtime_error {
 public:
  StoreError(StoreErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  StoreErrorCode code() const {
    return code_;
  }

 private:
  StoreErrorCode code_;
};

class DatabaseError : public StoreError {
 public:
  explicit DatabaseError(const std::string& msg) : StoreError(StoreErrorCode::DatabaseError, msg) {
  }
};

class NotFound : public StoreError {
 public:
  explicit NotFound(const std::string& msg) : StoreError(StoreErrorCode::NotFound, msg) {
  }
};

class JsonError : public StoreError {
 public:
  explicit JsonError(const std::string& msg) : StoreError(StoreErrorCode::JsonError, "data store json error: " + msg) {
  }
};

class EnvVarError : public StoreError {
 public:
  explicit EnvVarError(const std::string& msg) : StoreError(StoreErrorCode::EnvVarError, "data store env var error: " + msg) {
  }
};

class IntError : public StoreError {
 public:
  explicit IntError(const std::string& msg) : StoreError(StoreErrorCode::IntError, "data store int error: " + msg) {
  }
};

class MessageExists : public StoreError {
 public:
  explicit MessageExists(const std::string& msg) : StoreError(StoreErrorCode::MessageExists, msg) {
  }
};

} // namespace schedstore::util

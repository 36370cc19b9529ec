#include "internal/util/errors.hpp"

namespace schedstore::util {

std::string_view ToString(StoreErrorCode code) {
  switch (code) {
    case StoreErrorCode::DatabaseError:
      return "DatabaseError";
    case StoreErrorCode::NotFound:
      return "NotFound";
    case StoreErrorCode::JsonError:
      return "JsonError";
    case StoreErrorCode::EnvVarError:
      return "EnvVarError";
    case StoreErrorCode::IntError:
      return "IntError";
    case StoreErrorCode::MessageExists:
      return "MessageExists";
  }
  return "Unknown";
}

} // namespace schedstore::util

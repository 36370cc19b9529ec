#pragma once

#include <cstdint>
#include <string>

namespace schedstore::db::model {

/*
  processes row.

  process_data is JSON text:
    postgres -> jsonb
    sqlite   -> text
*/

struct ProcessRecord {
  int32_t row_id = 0;

  std::string process_id;
  std::string process_data;

  // raw bytes
  std::string bundle;
};

} // namespace schedstore::db::model

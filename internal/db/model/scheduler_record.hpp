#pragma once

#include <cstdint>
#include <string>

namespace schedstore::db::model {

struct SchedulerRecord {
  int32_t     row_id = 0;
  std::string url;
  int32_t     process_count = 0;
};

struct ProcessSchedulerRecord {
  int32_t     row_id = 0;
  std::string process_id;
  int32_t     scheduler_row_id = 0;
};

} // namespace schedstore::db::model

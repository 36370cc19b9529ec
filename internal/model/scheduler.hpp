#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace schedstore::model {

struct Scheduler {
  std::optional<int32_t> row_id;
  std::string            url;
  int32_t                process_count = 0;
};

// Binding of a process to the scheduler that owns it. Written once.
struct ProcessScheduler {
  std::optional<int32_t> row_id;
  std::string            process_id;
  int32_t                scheduler_row_id = 0;
};

} // namespace schedstore::model

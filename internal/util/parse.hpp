#pragma once

#include <cstdint>
#include <string_view>

namespace schedstore::util {

/*
  Strict decimal parsing for cursors, offsets and numeric env vars.

  The whole input must be consumed. Throws util::IntError otherwise.
*/
int64_t  ParseInt64(std::string_view text, std::string_view what);
uint64_t ParseUint64(std::string_view text, std::string_view what);

} // namespace schedstore::util

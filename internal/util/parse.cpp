#include "internal/util/parse.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include "internal/util/errors.hpp"

namespace schedstore::util {

namespace {

template <typename T>
T ParseInteger(std::string_view text, std::string_view what) {
  T value{};
  const auto* first = text.data();
  const auto* last  = text.data() + text.size();

  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec == std::errc::invalid_argument || ptr != last) {
    throw IntError("invalid digit found in " + std::string(what) + ": '" + std::string(text) + "'");
  }
  if (ec == std::errc::result_out_of_range) {
    throw IntError(std::string(what) + " out of range: '" + std::string(text) + "'");
  }
  return value;
}

} // namespace

int64_t ParseInt64(std::string_view text, std::string_view what) {
  return ParseInteger<int64_t>(text, what);
}

uint64_t ParseUint64(std::string_view text, std::string_view what) {
  return ParseInteger<uint64_t>(text, what);
}

} // namespace schedstore::util

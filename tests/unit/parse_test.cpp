#include "internal/util/parse.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/migration/backfill_migrator.hpp"
#include "internal/util/errors.hpp"

namespace {

using schedstore::migration::ParseOffsetRange;
using schedstore::util::IntError;
using schedstore::util::ParseInt64;
using schedstore::util::ParseUint64;

template <typename Fn>
bool ThrowsIntError(Fn&& fn) {
  try {
    fn();
  } catch (const IntError&) {
    return true;
  }
  return false;
}

void TestParseInt64AcceptsWholeDecimalInput() {
  assert(ParseInt64("0", "cursor") == 0);
  assert(ParseInt64("1700000000123", "cursor") == 1700000000123);
  assert(ParseInt64("-15", "cursor") == -15);
  assert(ParseUint64("18446744073709551615", "size") == 18446744073709551615ULL);
}

void TestParseInt64RejectsMalformedInput() {
  assert(ThrowsIntError([] { (void)ParseInt64("", "cursor"); }));
  assert(ThrowsIntError([] { (void)ParseInt64("abc", "cursor"); }));
  assert(ThrowsIntError([] { (void)ParseInt64("12 ", "cursor"); }));
  assert(ThrowsIntError([] { (void)ParseInt64("1.5", "cursor"); }));
  assert(ThrowsIntError([] { (void)ParseInt64("99999999999999999999", "cursor"); }));
  assert(ThrowsIntError([] { (void)ParseUint64("-1", "size"); }));
}

void TestIntErrorMessageNamesTheInput() {
  try {
    (void)ParseInt64("12x", "from");
    assert(false && "expected IntError");
  } catch (const IntError& e) {
    const std::string message = e.what();
    assert(message.find("data store int error") == 0);
    assert(message.find("from") != std::string::npos);
    assert(message.find("12x") != std::string::npos);
  }
}

void TestParseOffsetRangeForms() {
  auto open = ParseOffsetRange("250");
  assert(open.from == 250);
  assert(!open.to.has_value());

  auto closed = ParseOffsetRange("10-20");
  assert(closed.from == 10);
  assert(closed.to.has_value() && *closed.to == 20);

  auto empty = ParseOffsetRange("5-5");
  assert(empty.from == 5 && *empty.to == 5);
}

void TestParseOffsetRangeRejectsBadRanges() {
  assert(ThrowsIntError([] { (void)ParseOffsetRange(""); }));
  assert(ThrowsIntError([] { (void)ParseOffsetRange("-5"); }));
  assert(ThrowsIntError([] { (void)ParseOffsetRange("5-"); }));
  assert(ThrowsIntError([] { (void)ParseOffsetRange("20-10"); }));
  assert(ThrowsIntError([] { (void)ParseOffsetRange("a-b"); }));
  assert(ThrowsIntError([] { (void)ParseOffsetRange("1-2-3"); }));
}

} // namespace

int main() {
  TestParseInt64AcceptsWholeDecimalInput();
  TestParseInt64RejectsMalformedInput();
  TestIntErrorMessageNamesTheInput();
  TestParseOffsetRangeForms();
  TestParseOffsetRangeRejectsBadRanges();

  std::cout << "schedstore_unit_parse: pass\n";
  return 0;
}

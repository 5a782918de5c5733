#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using eventcache::util::FormatIso8601Millis;
using eventcache::util::ParseIso8601Millis;

bool Rejects(const std::string& text) {
  try {
    (void)ParseIso8601Millis(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestParsesUtcAndOffsets() {
  assert(ParseIso8601Millis("2026-02-10T00:00:00Z") == 1770681600000);
  assert(ParseIso8601Millis("2026-02-10T00:00:00+00:00") == 1770681600000);
  assert(ParseIso8601Millis("2026-02-10T01:30:00.250+01:00") == 1770683400250);
  assert(ParseIso8601Millis("1970-01-01T00:00:00.000Z") == 0);
}

void TestRejectsNaiveAndMalformedTimestamps() {
  assert(Rejects("2026-02-10T00:00:00"));
  assert(Rejects("2026-02-10"));
  assert(Rejects("2026-02-30T00:00:00Z"));
  assert(Rejects("2026-02-10T00:00:00Zjunk"));
  assert(Rejects("not-a-timestamp"));
}

void TestFormatsMillis() {
  assert(FormatIso8601Millis(1770681600000) == "2026-02-10T00:00:00.000Z");
  assert(FormatIso8601Millis(1770683400250) == "2026-02-10T00:30:00.250Z");
  assert(ParseIso8601Millis(FormatIso8601Millis(1770683400250)) == 1770683400250);
}

} // namespace

int main() {
  TestParsesUtcAndOffsets();
  TestRejectsNaiveAndMalformedTimestamps();
  TestFormatsMillis();

  std::cout << "eventcache_unit_time: pass\n";
  return 0;
}

#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace eventcache::util {

namespace {

int ParseDigits(std::string_view text, size_t pos, size_t count) {
  if (pos + count > text.size()) {
    throw std::invalid_argument("timestamp truncated: " + std::string(text));
  }
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("timestamp has non-digit where digit expected: " + std::string(text));
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

void Expect(std::string_view text, size_t pos, char c) {
  if (pos >= text.size() || (text[pos] != c && !(c == 'T' && text[pos] == ' '))) {
    throw std::invalid_argument("malformed timestamp: " + std::string(text));
  }
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

std::string FormatIso8601Millis(int64_t millis) {
  const auto tp   = std::chrono::sys_time<std::chrono::milliseconds>{std::chrono::milliseconds(millis)};
  const auto day  = std::chrono::floor<std::chrono::days>(tp);
  const auto ymd  = std::chrono::year_month_day{day};
  const auto time = std::chrono::hh_mm_ss<std::chrono::milliseconds>{tp - day};

  char out[32];
  std::snprintf(out, sizeof(out), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(time.hours().count()), static_cast<int>(time.minutes().count()),
                static_cast<int>(time.seconds().count()), static_cast<int>(time.subseconds().count()));
  return out;
}

int64_t ParseIso8601Millis(std::string_view text) {
  const int year = ParseDigits(text, 0, 4);
  Expect(text, 4, '-');
  const int month = ParseDigits(text, 5, 2);
  Expect(text, 7, '-');
  const int day = ParseDigits(text, 8, 2);
  Expect(text, 10, 'T');
  const int hour = ParseDigits(text, 11, 2);
  Expect(text, 13, ':');
  const int minute = ParseDigits(text, 14, 2);
  Expect(text, 16, ':');
  const int second = ParseDigits(text, 17, 2);

  size_t pos    = 19;
  int    millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      throw std::invalid_argument("malformed fractional seconds: " + std::string(text));
    }
    for (int i = digits; i < 3; ++i) millis *= 10;
  }

  if (pos >= text.size()) {
    throw std::invalid_argument("timestamp must include timezone information: " + std::string(text));
  }

  int offset_minutes = 0;
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    const int sign = text[pos] == '-' ? -1 : 1;
    const int oh   = ParseDigits(text, pos + 1, 2);
    Expect(text, pos + 3, ':');
    const int om   = ParseDigits(text, pos + 4, 2);
    offset_minutes = sign * (oh * 60 + om);
    pos += 6;
  } else {
    throw std::invalid_argument("malformed timezone designator: " + std::string(text));
  }

  if (pos != text.size()) {
    throw std::invalid_argument("trailing characters in timestamp: " + std::string(text));
  }

  const auto ymd = std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} / std::chrono::day{static_cast<unsigned>(day)};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    throw std::invalid_argument("timestamp out of range: " + std::string(text));
  }

  const auto local = std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second) +
                     std::chrono::milliseconds(millis);
  const auto utc   = local - std::chrono::minutes(offset_minutes);
  return std::chrono::duration_cast<std::chrono::milliseconds>(utc.time_since_epoch()).count();
}

} // namespace eventcache::util

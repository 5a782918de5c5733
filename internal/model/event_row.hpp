#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace google::protobuf {
class Struct;
}

namespace eventcache::model {

struct Timestamp {
  int64_t millis = 0;

  bool operator==(const Timestamp&) const = default;
};

// Nested JSON (objects, lists) kept verbatim as text.
struct RawJson {
  std::string text;

  bool operator==(const RawJson&) const = default;
};

using Value = std::variant<std::monostate, std::string, int64_t, double, bool, Timestamp, RawJson>;

enum class ValueKind {
  kNull,
  kString,
  kInt64,
  kDouble,
  kBool,
  kTimestamp,
  kRaw,
};

ValueKind KindOf(const Value& value);
std::string_view KindName(ValueKind kind);

// Text form used for keys and log fields ("" for null).
std::string ValueToString(const Value& value);

/*
  One decoded provider event.

  Columns are kept ordered by name so every row renders the same way
  regardless of the order fields arrived in. A row is immutable once built.
*/
class EventRow {
 public:
  using Columns = std::map<std::string, Value, std::less<>>;

  EventRow() = default;
  EventRow(Columns columns, std::string_view timestamp_column);

  /*
    Builds a row from a decoded JSON object.

    Scalars map onto their natural kind (integral numbers become int64),
    nested objects and lists are kept as RawJson, and the timestamp column
    becomes a Timestamp when it holds epoch milliseconds or an ISO-8601
    string with a zone.
  */
  static EventRow FromStruct(const google::protobuf::Struct& object, std::string_view timestamp_column);

  const Columns& columns() const {
    return columns_;
  }

  const Value* Find(std::string_view column) const;

  // Event time in epoch milliseconds, when the timestamp column is present and numeric.
  std::optional<int64_t> TimestampMs() const {
    return timestamp_ms_;
  }

  // "<log_id>:<sequence>" or nullopt when either part is missing.
  std::optional<std::string> DedupeKey() const;

  // Approximate in-memory footprint used by the writer's byte threshold.
  size_t EstimatedBytes() const {
    return estimated_bytes_;
  }

 private:
  Columns                columns_;
  std::optional<int64_t> timestamp_ms_;
  size_t                 estimated_bytes_ = 0;
};

} // namespace eventcache::model

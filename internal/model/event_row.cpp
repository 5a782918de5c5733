#include "event_row.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace eventcache::model {

namespace {

// 2^63 as a double; anything at or beyond it does not fit in int64.
constexpr double kInt64Limit = 9223372036854775808.0;

// Fixed per-cell overhead added to the payload size estimate.
constexpr size_t kCellOverhead = 16;

std::optional<int64_t> IntegralValue(double number) {
  if (!std::isfinite(number) || std::trunc(number) != number) return std::nullopt;
  if (number >= kInt64Limit || number < -kInt64Limit) return std::nullopt;
  return static_cast<int64_t>(number);
}

std::string ToRawJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::invalid_argument("failed to encode nested event value: " + std::string(status.message()));
  }
  return json;
}

Value ConvertValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();

    case google::protobuf::Value::kNumberValue: {
      if (auto integral = IntegralValue(value.number_value())) return *integral;
      return value.number_value();
    }

    case google::protobuf::Value::kBoolValue:
      return value.bool_value();

    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue:
      return RawJson{ToRawJson(value)};

    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      return std::monostate{};
  }
}

Value ConvertTimestamp(Value value) {
  if (const auto* millis = std::get_if<int64_t>(&value)) {
    return Timestamp{*millis};
  }
  if (const auto* number = std::get_if<double>(&value)) {
    if (std::isfinite(*number) && *number < kInt64Limit && *number >= -kInt64Limit) {
      return Timestamp{static_cast<int64_t>(*number)};
    }
    return value;
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    try {
      return Timestamp{util::ParseIso8601Millis(*text)};
    } catch (const std::invalid_argument&) {
      // Not a recognisable instant; keep the provider's text.
      return value;
    }
  }
  return value;
}

size_t EstimateValueBytes(const Value& value) {
  switch (KindOf(value)) {
    case ValueKind::kString:
      return std::get<std::string>(value).size();
    case ValueKind::kRaw:
      return std::get<RawJson>(value).text.size();
    case ValueKind::kBool:
      return 1;
    case ValueKind::kNull:
      return 0;
    default:
      return 8;
  }
}

} // namespace

ValueKind KindOf(const Value& value) {
  return static_cast<ValueKind>(value.index());
}

std::string_view KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kNull:
      return "null";
    case ValueKind::kString:
      return "string";
    case ValueKind::kInt64:
      return "int64";
    case ValueKind::kDouble:
      return "double";
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kTimestamp:
      return "timestamp";
    case ValueKind::kRaw:
      return "raw";
  }
  return "unknown";
}

std::string ValueToString(const Value& value) {
  switch (KindOf(value)) {
    case ValueKind::kNull:
      return {};
    case ValueKind::kString:
      return std::get<std::string>(value);
    case ValueKind::kInt64:
      return std::to_string(std::get<int64_t>(value));
    case ValueKind::kDouble: {
      std::ostringstream out;
      out.precision(17);
      out << std::get<double>(value);
      return out.str();
    }
    case ValueKind::kBool:
      return std::get<bool>(value) ? "true" : "false";
    case ValueKind::kTimestamp:
      return std::to_string(std::get<Timestamp>(value).millis);
    case ValueKind::kRaw:
      return std::get<RawJson>(value).text;
  }
  return {};
}

EventRow::EventRow(Columns columns, std::string_view timestamp_column) : columns_(std::move(columns)) {
  auto it = columns_.find(timestamp_column);
  if (it != columns_.end()) {
    it->second = ConvertTimestamp(std::move(it->second));
    if (const auto* ts = std::get_if<Timestamp>(&it->second)) {
      timestamp_ms_ = ts->millis;
    }
  }

  for (const auto& [name, value] : columns_) {
    estimated_bytes_ += name.size() + EstimateValueBytes(value) + kCellOverhead;
  }
}

EventRow EventRow::FromStruct(const google::protobuf::Struct& object, std::string_view timestamp_column) {
  Columns columns;
  for (const auto& [name, value] : object.fields()) {
    columns.emplace(name, ConvertValue(value));
  }
  return EventRow(std::move(columns), timestamp_column);
}

const Value* EventRow::Find(std::string_view column) const {
  auto it = columns_.find(column);
  return it == columns_.end() ? nullptr : &it->second;
}

std::optional<std::string> EventRow::DedupeKey() const {
  const Value* log_id = Find("log_id");
  if (!log_id || KindOf(*log_id) == ValueKind::kNull) return std::nullopt;

  const Value* sequence = Find("sequence_number_str");
  if (!sequence || KindOf(*sequence) == ValueKind::kNull) {
    sequence = Find("sequence_number");
  }
  if (!sequence || KindOf(*sequence) == ValueKind::kNull) return std::nullopt;

  return ValueToString(*log_id) + ":" + ValueToString(*sequence);
}

} // namespace eventcache::model

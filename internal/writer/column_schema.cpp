#include "column_schema.hpp"

#include <cmath>

#include "internal/observability/logging.hpp"

namespace eventcache::writer {

using model::ValueKind;

namespace {

bool IsText(ValueKind kind) {
  return kind == ValueKind::kString || kind == ValueKind::kRaw;
}

} // namespace

ColumnSchema::ColumnSchema(std::string timestamp_column) : timestamp_column_(std::move(timestamp_column)) {
}

model::EventRow ColumnSchema::Admit(const model::EventRow& row) {
  model::EventRow::Columns admitted;
  for (const auto& [column, value] : row.columns()) {
    admitted.emplace(column, AdmitCell(column, value));
  }
  return model::EventRow(std::move(admitted), timestamp_column_);
}

bool ColumnSchema::Pin(const std::string& column, model::ValueKind kind) {
  if (kind == ValueKind::kNull) return true;

  auto it = kinds_.find(column);
  if (it == kinds_.end()) {
    kinds_.emplace(column, kind);
    return true;
  }

  auto& pinned = it->second;
  if (pinned == kind) return true;
  if (IsText(pinned) && IsText(kind)) return true;
  if (pinned == ValueKind::kInt64 && kind == ValueKind::kDouble) {
    pinned = ValueKind::kDouble;
    return true;
  }
  return pinned == ValueKind::kDouble && kind == ValueKind::kInt64;
}

std::optional<model::ValueKind> ColumnSchema::KindOf(std::string_view column) const {
  auto it = kinds_.find(column);
  if (it == kinds_.end()) return std::nullopt;
  return it->second;
}

model::Value ColumnSchema::AdmitCell(const std::string& column, model::Value value) {
  const auto kind = model::KindOf(value);
  if (kind == ValueKind::kNull) return value;

  auto it = kinds_.find(column);
  if (it == kinds_.end()) {
    kinds_.emplace(column, kind);
    return value;
  }

  const auto pinned = it->second;
  if (pinned == kind) return value;

  if (pinned == ValueKind::kDouble && kind == ValueKind::kInt64) {
    return static_cast<double>(std::get<int64_t>(value));
  }
  if (pinned == ValueKind::kInt64 && kind == ValueKind::kDouble) {
    const double number = std::get<double>(value);
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < 9.2e18) {
      return static_cast<int64_t>(number);
    }
  }
  if (pinned == ValueKind::kString && kind == ValueKind::kRaw) {
    return std::move(std::get<model::RawJson>(value).text);
  }
  if (pinned == ValueKind::kRaw && kind == ValueKind::kString) {
    return model::RawJson{std::move(std::get<std::string>(value))};
  }

  ++type_conflicts_;
  if (warned_columns_.insert(column).second) {
    EVENTCACHE_LOG_WARN("column_type_conflict", {observability::StringField("column", column),
                                                 observability::StringField("pinned", model::KindName(pinned)),
                                                 observability::StringField("observed", model::KindName(kind))});
  }
  return std::monostate{};
}

} // namespace eventcache::writer

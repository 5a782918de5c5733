#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "internal/model/event_row.hpp"

namespace eventcache::writer {

/*
  Run-scoped column registry.

  The first non-null value seen for a column pins its kind for the rest of
  the run, so every part of every segment written by the run agrees on
  column types. Later values are coerced where that is lossless:

      int64  -> double column
      double -> int64 column   (integral values only)
      raw   <-> string column

  Anything else is stored as null and counted as a type conflict, with one
  WARN event per column.
*/
class ColumnSchema {
 public:
  using Kinds = std::map<std::string, model::ValueKind, std::less<>>;

  explicit ColumnSchema(std::string timestamp_column = "timestamp");

  /*
    Pins a column before any row is admitted, e.g. from parts already in the
    cache. An int64 pin widens to double when the other kind is double.
    Returns false, leaving the existing pin, for any other disagreement.
  */
  bool Pin(const std::string& column, model::ValueKind kind);

  // Returns the row with every cell coerced to its column's pinned kind.
  model::EventRow Admit(const model::EventRow& row);

  std::optional<model::ValueKind> KindOf(std::string_view column) const;

  // Pinned columns in name order. Columns only ever seen as null are absent.
  const Kinds& columns() const {
    return kinds_;
  }

  const std::string& timestamp_column() const {
    return timestamp_column_;
  }

  uint64_t type_conflicts() const {
    return type_conflicts_;
  }

 private:
  model::Value AdmitCell(const std::string& column, model::Value value);

  std::string           timestamp_column_;
  Kinds                 kinds_;
  std::set<std::string> warned_columns_;
  uint64_t              type_conflicts_ = 0;
};

} // namespace eventcache::writer

#pragma once

#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eventcache::storage::common {

/*
  Cache layout:

      <root>/<entity_id>/from=<start_ms>/to=<end_ms>/part-<00000>.parquet
*/

inline constexpr std::string_view kFromPrefix   = "from=";
inline constexpr std::string_view kToPrefix     = "to=";
inline constexpr std::string_view kPartPrefix   = "part-";
inline constexpr std::string_view kPartSuffix   = ".parquet";
inline constexpr std::string_view kTempSuffix   = ".tmp";

inline void ValidateEntityId(const std::string& entity_id) {
  if (entity_id.empty()) {
    throw std::invalid_argument("entity id must not be empty");
  }
  for (char c : entity_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("entity id contains invalid character");
    }
  }
  if (entity_id == "." || entity_id == "..") {
    throw std::invalid_argument("entity id must not be a relative path component");
  }
}

inline std::string JoinPath(const std::string& base, std::string_view child) {
  if (base.empty()) return std::string(child);
  if (base.back() == '/') return base + std::string(child);
  return base + "/" + std::string(child);
}

// Everything before the last separator; "" when there is none.
inline std::string ParentPath(const std::string& path) {
  const auto pos = path.find_last_of('/');
  if (pos == std::string::npos) return {};
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

inline std::string EntityPath(const std::string& root, const std::string& entity_id) {
  ValidateEntityId(entity_id);
  return JoinPath(root, entity_id);
}

inline std::string SegmentPath(const std::string& root, const std::string& entity_id, int64_t start_ms, int64_t end_ms) {
  return JoinPath(JoinPath(EntityPath(root, entity_id), std::string(kFromPrefix) + std::to_string(start_ms)),
                  std::string(kToPrefix) + std::to_string(end_ms));
}

inline std::string PartFileName(uint32_t index) {
  std::ostringstream out;
  out << kPartPrefix << std::setw(5) << std::setfill('0') << index << kPartSuffix;
  return out.str();
}

// Returns the index for "part-00012.parquet", nullopt for anything else.
inline std::optional<uint32_t> ParsePartFileName(std::string_view name) {
  if (name.size() <= kPartPrefix.size() + kPartSuffix.size() || name.substr(0, kPartPrefix.size()) != kPartPrefix ||
      name.substr(name.size() - kPartSuffix.size()) != kPartSuffix) {
    return std::nullopt;
  }
  const auto digits = name.substr(kPartPrefix.size(), name.size() - kPartPrefix.size() - kPartSuffix.size());
  uint64_t   value  = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
    if (value > UINT32_MAX) return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

// Parses the signed integer following `prefix`; nullopt when not a clean integer.
inline std::optional<int64_t> ParseBoundary(std::string_view name, std::string_view prefix) {
  if (name.substr(0, prefix.size()) != prefix) return std::nullopt;
  const auto digits = name.substr(prefix.size());
  if (digits.empty()) return std::nullopt;

  size_t pos      = 0;
  bool   negative = false;
  if (digits[0] == '-') {
    negative = true;
    pos      = 1;
    if (digits.size() == 1) return std::nullopt;
  }

  int64_t value = 0;
  for (; pos < digits.size(); ++pos) {
    const char c = digits[pos];
    if (c < '0' || c > '9') return std::nullopt;
    if (value > (INT64_MAX - (c - '0')) / 10) return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return negative ? -value : value;
}

} // namespace eventcache::storage::common

#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "config/config.pb.h"

namespace eventcache::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw.

  The error type is chosen by the caller so that a failed write surfaces as
  util::WriteError and a failed read of the cache as util::CacheCorruptionError.
*/
template <typename Error = std::runtime_error, typename T>
T Unwrap(arrow::Result<T> result, std::string_view context = {}) {
  if (!result.ok()) {
    if (context.empty()) throw Error(result.status().ToString());
    throw Error(std::string(context) + ": " + result.status().ToString());
  }
  return std::move(result).ValueOrDie();
}

template <typename Error = std::runtime_error>
void Unwrap(const arrow::Status& status, std::string_view context = {}) {
  if (!status.ok()) {
    if (context.empty()) throw Error(status.ToString());
    throw Error(std::string(context) + ": " + status.ToString());
  }
}

/*
  Resolve a cache root (local path or URI such as file:///data/cache) into a
  filesystem plus the path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path);

arrow::Result<arrow::Compression::type> ResolveCompression(eventcache::runtime::config::Compression compression);

} // namespace eventcache::storage::common

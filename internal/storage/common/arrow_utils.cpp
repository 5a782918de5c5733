#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>

namespace eventcache::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path) {
  if (path.empty()) {
    return arrow::Status::Invalid("cache root path must not be empty");
  }

  // arrow::fs only accepts absolute local paths; anchor relative ones at the working directory.
  std::string uri_or_path = path;
  if (path.find("://") == std::string::npos && !std::filesystem::path(path).is_absolute()) {
    uri_or_path = std::filesystem::absolute(path).lexically_normal().string();
  }

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path));

  // Strip trailing separators so joined paths never contain "//".
  while (resolved_path.size() > 1 && resolved_path.back() == '/') {
    resolved_path.pop_back();
  }
  return std::make_pair(std::move(fs), resolved_path);
}

arrow::Result<arrow::Compression::type> ResolveCompression(eventcache::runtime::config::Compression compression) {
  using namespace eventcache::runtime::config;

  switch (compression) {
    case COMPRESSION_UNCOMPRESSED:
      return arrow::Compression::UNCOMPRESSED;
    case COMPRESSION_GZIP:
      return arrow::Compression::GZIP;
    case COMPRESSION_BROTLI:
      return arrow::Compression::BROTLI;
    case COMPRESSION_ZSTD:
      return arrow::Compression::ZSTD;
    case COMPRESSION_LZ4:
      return arrow::Compression::LZ4;
    case COMPRESSION_SNAPPY:
    case COMPRESSION_UNSPECIFIED:
      return arrow::Compression::SNAPPY;
    default:
      return arrow::Status::Invalid("unsupported compression: ", static_cast<int>(compression));
  }
}

} // namespace eventcache::storage::common

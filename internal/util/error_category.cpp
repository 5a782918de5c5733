#include "error_category.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace eventcache::util {

ErrorCategory Categorize(const std::exception& e) {
  if (dynamic_cast<const RateLimitExhaustedError*>(&e) || dynamic_cast<const PollTimeoutError*>(&e) ||
      dynamic_cast<const TransportError*>(&e) || dynamic_cast<const CancelledError*>(&e)) {
    return ErrorCategory::kRetryLater;
  }
  if (dynamic_cast<const CacheCorruptionError*>(&e) || dynamic_cast<const ProtocolError*>(&e) ||
      dynamic_cast<const InvalidRangeError*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return ErrorCategory::kDataProblem;
  }
  if (dynamic_cast<const WriteError*>(&e)) {
    return ErrorCategory::kEnvironment;
  }

  return ErrorCategory::kInternal;
}

std::string_view CategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kRetryLater:
      return "retry_later";
    case ErrorCategory::kDataProblem:
      return "data_problem";
    case ErrorCategory::kEnvironment:
      return "environment";
    case ErrorCategory::kInternal:
    default:
      return "internal";
  }
}

std::string_view RemediationHint(const std::exception& e) {
  if (dynamic_cast<const RateLimitExhaustedError*>(&e)) {
    return "provider rate limit persisted; re-run later or lower api.requests_per_minute";
  }
  if (dynamic_cast<const PollTimeoutError*>(&e)) {
    return "query did not complete in time; raise polling.max_attempts/max_wall_seconds or narrow the range";
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return "network failure talking to the provider; check api.endpoint and connectivity";
  }
  if (dynamic_cast<const CancelledError*>(&e)) {
    return "run was cancelled or hit its deadline; re-run to resume from the cache";
  }
  if (dynamic_cast<const CacheCorruptionError*>(&e)) {
    return "delete the corrupt segment directory or set cache.bypass_on_corruption: true";
  }
  if (const auto* protocol = dynamic_cast<const ProtocolError*>(&e)) {
    if (protocol->http_status() == 401 || protocol->http_status() == 403) {
      return "provider rejected the credentials; check the variable named by api.api_key_env";
    }
    return "provider returned an unexpected response; re-run with EVENTCACHE_LOG_LEVEL=debug";
  }
  if (dynamic_cast<const InvalidRangeError*>(&e)) {
    return "the requested end must be after the requested start";
  }
  if (dynamic_cast<const WriteError*>(&e)) {
    return "point cache.root_path at a writable directory";
  }
  return {};
}

int ExitCode(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kRetryLater:
      return 3;
    case ErrorCategory::kDataProblem:
      return 4;
    case ErrorCategory::kEnvironment:
      return 5;
    case ErrorCategory::kInternal:
    default:
      return 2;
  }
}

} // namespace eventcache::util

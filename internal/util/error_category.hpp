#pragma once

#include <exception>
#include <string_view>

namespace eventcache::util {

/*
  Coarse operator-facing classification of ingest failures.
*/
enum class ErrorCategory {
  kRetryLater,
  kDataProblem,
  kEnvironment,
  kInternal,
};

ErrorCategory Categorize(const std::exception& e);

std::string_view CategoryName(ErrorCategory category);

// Short remediation hint for the error, empty when none is known.
std::string_view RemediationHint(const std::exception& e);

// Process exit code used by the CLI for the category.
int ExitCode(ErrorCategory category);

} // namespace eventcache::util

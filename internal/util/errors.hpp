#pragma once

#include <stdexcept>
#include <string>

namespace eventcache::util {

/*
  Central error types.

  Every failure the ingest core can raise maps to exactly one of these so
  callers can tell "retry later" from "data problem" from "environment
  problem". See error_category.hpp for that mapping.
*/

class InvalidRangeError : public std::runtime_error {
 public:
  explicit InvalidRangeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CacheCorruptionError : public std::runtime_error {
 public:
  explicit CacheCorruptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg, long http_status = 0) : std::runtime_error(msg), http_status_(http_status) {
  }

  // 0 when the failure was not tied to an HTTP status.
  long http_status() const {
    return http_status_;
  }

 private:
  long http_status_;
};

class RateLimitExhaustedError : public std::runtime_error {
 public:
  explicit RateLimitExhaustedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PollTimeoutError : public std::runtime_error {
 public:
  explicit PollTimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WriteError : public std::runtime_error {
 public:
  explicit WriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CancelledError : public std::runtime_error {
 public:
  explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace eventcache::util

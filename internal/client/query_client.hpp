#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "http_transport.hpp"
#include "internal/range/time_range.hpp"
#include "internal/util/run_context.hpp"
#include "response_parser.hpp"

namespace eventcache::client {

enum class QueryState {
  kSubmitted,
  kPolling,
  kRateLimited,
  kPageReady,
  kComplete,
};

std::string_view QueryStateName(QueryState state);

struct QueryClientOptions {
  std::string endpoint;
  std::string auth_header = "x-api-key";
  std::string api_key;

  uint32_t                  per_page        = 500;
  std::chrono::milliseconds request_timeout = std::chrono::seconds(30);

  // Transport errors and 5xx responses.
  uint32_t retry_attempts = 3;

  // 0 disables client-side pacing.
  uint32_t requests_per_minute = 0;

  std::chrono::milliseconds poll_initial_delay = std::chrono::milliseconds(500);
  std::chrono::milliseconds poll_max_delay     = std::chrono::seconds(8);
  uint32_t                  poll_max_attempts  = 120;
  std::chrono::seconds      poll_max_wall      = std::chrono::seconds(600);
  uint32_t                  progress_log_every = 10;

  std::chrono::seconds rate_limit_default_wait = std::chrono::seconds(5);
  std::chrono::seconds rate_limit_max_wait     = std::chrono::seconds(60);
  uint32_t             rate_limit_max_retries  = 5;

  std::string timestamp_column    = "timestamp";
  bool        log_response_bodies = false;
};

struct QueryRequest {
  std::string      entity_id;
  range::TimeRange range;
  std::string      filter;
};

struct QueryStats {
  size_t pages             = 0;
  size_t requests          = 0;
  size_t polls             = 0;
  size_t rate_limit_waits  = 0;
  size_t transient_retries = 0;
  size_t malformed_events  = 0;

  std::optional<int64_t> total_matched;
};

// Called once per completed page, in order. page_index starts at 0.
using PageHandler = std::function<void(const QueryPage& page, size_t page_index)>;

/*
  Protocol client for the asynchronous, paginated log query API.

  Flow per query:

      Submitted -> (Polling)* -> PageReady -> Submitted(next) ... -> Complete

  RateLimited is entered from any call answered with 429 and returns to the
  state that issued the call. Page N+1 is requested only after the handler
  returned for page N. Continuation links are requested verbatim.
*/
class QueryClient {
 public:
  QueryClient(QueryClientOptions options, std::shared_ptr<HttpTransport> transport, std::shared_ptr<util::Sleeper> sleeper);

  QueryStats Execute(const QueryRequest& request, const PageHandler& on_page, util::RunContext& ctx);

  const QueryClientOptions& options() const {
    return options_;
  }

 private:
  struct Execution;

  HttpRequest SubmitRequest(const QueryRequest& request) const;
  HttpRequest LinkRequest(const std::string& href) const;

  // Issues one logical call, absorbing 429s, transient failures and pacing.
  HttpResponse Send(const HttpRequest& request, QueryState issuing_state, Execution& execution, util::RunContext& ctx);

  QueryPage Parse(const HttpResponse& response, const Execution& execution) const;

  std::chrono::milliseconds RateLimitWait(const HttpResponse& response) const;

  void Pace(util::RunContext& ctx);

  void Transition(QueryState state, const Execution& execution) const;

  QueryClientOptions             options_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<util::Sleeper> sleeper_;

  std::optional<std::chrono::steady_clock::time_point> last_request_;
};

} // namespace eventcache::client

#include "query_client.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventcache::client {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

// Backoff for transient failures is 2^attempt seconds, capped here.
constexpr int kMaxTransientBackoffSeconds = 60;

int64_t ElapsedMs(Clock::time_point since) {
  return duration_cast<milliseconds>(Clock::now() - since).count();
}

// Parses a non-negative number of seconds; nullopt for anything else (e.g. an HTTP date).
std::optional<double> ParseSeconds(const std::optional<std::string>& header) {
  if (!header || header->empty()) return std::nullopt;

  const char* begin = header->c_str();
  char*       end   = nullptr;
  errno             = 0;
  const double seconds = std::strtod(begin, &end);
  if (end == begin || errno != 0 || !std::isfinite(seconds) || seconds < 0) return std::nullopt;

  while (*end == ' ' || *end == '\t') ++end;
  if (*end != '\0') return std::nullopt;
  return seconds;
}

std::string TrimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

} // namespace

std::string_view QueryStateName(QueryState state) {
  switch (state) {
    case QueryState::kSubmitted:
      return "submitted";
    case QueryState::kPolling:
      return "polling";
    case QueryState::kRateLimited:
      return "rate_limited";
    case QueryState::kPageReady:
      return "page_ready";
    case QueryState::kComplete:
      return "complete";
  }
  return "unknown";
}

struct QueryClient::Execution {
  const QueryRequest& request;
  Clock::time_point   started;
  size_t              page_index = 0;
  QueryStats          stats;
};

QueryClient::QueryClient(QueryClientOptions options, std::shared_ptr<HttpTransport> transport,
                         std::shared_ptr<util::Sleeper> sleeper)
    : options_(std::move(options)), transport_(std::move(transport)), sleeper_(std::move(sleeper)) {
  if (!transport_) throw std::invalid_argument("QueryClient: transport is required");
  if (!sleeper_) throw std::invalid_argument("QueryClient: sleeper is required");
  if (options_.endpoint.empty()) throw std::invalid_argument("QueryClient: endpoint is required");
}

QueryStats QueryClient::Execute(const QueryRequest& request, const PageHandler& on_page, util::RunContext& ctx) {
  range::Validate(request.range);

  Execution execution{request, Clock::now()};

  HttpRequest http_request = SubmitRequest(request);
  QueryState  issuing      = QueryState::kSubmitted;
  Transition(issuing, execution);

  while (true) {
    QueryPage page = Parse(Send(http_request, issuing, execution, ctx), execution);

    // Poll the Self link until the provider reports the page complete.
    auto     delay      = options_.poll_initial_delay;
    uint32_t polls      = 0;
    auto     poll_start = Clock::now();
    while (page.in_progress) {
      if (!page.self_link) {
        throw util::ProtocolError("query reported in progress without a Self link");
      }
      if (polls >= options_.poll_max_attempts) {
        throw util::PollTimeoutError("query still in progress after " + std::to_string(polls) + " polls");
      }
      if (Clock::now() - poll_start >= options_.poll_max_wall) {
        throw util::PollTimeoutError("query still in progress after " + std::to_string(options_.poll_max_wall.count()) +
                                     "s");
      }

      if (polls == 0) Transition(QueryState::kPolling, execution);

      sleeper_->Sleep(delay, ctx);
      delay = std::min(delay * 2, options_.poll_max_delay);
      ++polls;
      ++execution.stats.polls;

      if (options_.progress_log_every > 0 && polls % options_.progress_log_every == 0) {
        EVENTCACHE_LOG_INFO("query_poll_progress",
                            {observability::StringField("entity_id", request.entity_id),
                             observability::IntField("page_index", static_cast<int64_t>(execution.page_index)),
                             observability::IntField("polls", polls),
                             observability::IntField("elapsed_ms", ElapsedMs(execution.started))});
      }

      page = Parse(Send(LinkRequest(*page.self_link), QueryState::kPolling, execution, ctx), execution);
    }

    Transition(QueryState::kPageReady, execution);

    if (page.total_matched) execution.stats.total_matched = page.total_matched;
    execution.stats.malformed_events += page.malformed_events;
    ++execution.stats.pages;

    on_page(page, execution.page_index);

    if (!page.next_link) break;

    ctx.ThrowIfCancelled();
    ++execution.page_index;
    http_request = LinkRequest(*page.next_link);
    issuing      = QueryState::kSubmitted;
    Transition(issuing, execution);
  }

  Transition(QueryState::kComplete, execution);
  return execution.stats;
}

HttpRequest QueryClient::SubmitRequest(const QueryRequest& request) const {
  HttpRequest http_request = LinkRequest(TrimTrailingSlash(options_.endpoint) + "/query/logs/" + request.entity_id);

  http_request.query_params.emplace_back("from", std::to_string(request.range.start_ms));
  http_request.query_params.emplace_back("to", std::to_string(request.range.end_ms));
  if (!request.filter.empty()) {
    http_request.query_params.emplace_back("query", request.filter);
  }
  http_request.query_params.emplace_back("per_page", std::to_string(options_.per_page));
  return http_request;
}

HttpRequest QueryClient::LinkRequest(const std::string& href) const {
  HttpRequest http_request;
  http_request.url     = href;
  http_request.timeout = options_.request_timeout;
  if (!options_.api_key.empty()) {
    http_request.headers.emplace_back(options_.auth_header, options_.api_key);
  }
  http_request.headers.emplace_back("Accept", "application/json");
  return http_request;
}

HttpResponse QueryClient::Send(const HttpRequest& request, QueryState issuing_state, Execution& execution,
                               util::RunContext& ctx) {
  uint32_t consecutive_rate_limits = 0;
  uint32_t transient_attempt       = 0;

  auto retry_transient = [&](const std::string& reason) {
    if (transient_attempt >= options_.retry_attempts) {
      EVENTCACHE_LOG_WARN("retry_exhausted",
                          {observability::StringField("entity_id", execution.request.entity_id),
                           observability::IntField("attempts", transient_attempt + 1),
                           observability::StringField("error", reason)});
      throw util::TransportError(reason + " (after " + std::to_string(transient_attempt + 1) + " attempts)");
    }

    const auto wait = std::chrono::seconds(std::min(1 << std::min<uint32_t>(transient_attempt, 6), kMaxTransientBackoffSeconds));
    EVENTCACHE_LOG_WARN("retry_transient_error",
                        {observability::StringField("entity_id", execution.request.entity_id),
                         observability::IntField("attempt", transient_attempt + 1),
                         observability::IntField("max_retries", options_.retry_attempts),
                         observability::IntField("sleep_ms", duration_cast<milliseconds>(wait).count()),
                         observability::StringField("error", reason)});
    ++transient_attempt;
    ++execution.stats.transient_retries;
    sleeper_->Sleep(wait, ctx);
  };

  while (true) {
    ctx.ThrowIfCancelled();
    Pace(ctx);

    HttpResponse response;
    try {
      ++execution.stats.requests;
      response = transport_->Get(request);
    } catch (const util::TransportError& e) {
      retry_transient(e.what());
      continue;
    }

    if (response.status == 429) {
      if (consecutive_rate_limits >= options_.rate_limit_max_retries) {
        throw util::RateLimitExhaustedError("rate limited " + std::to_string(consecutive_rate_limits + 1) +
                                            " consecutive times");
      }
      ++consecutive_rate_limits;
      ++execution.stats.rate_limit_waits;

      const auto wait = RateLimitWait(response);
      Transition(QueryState::kRateLimited, execution);
      EVENTCACHE_LOG_WARN("rate_limit_hit",
                          {observability::StringField("entity_id", execution.request.entity_id),
                           observability::IntField("retry", consecutive_rate_limits),
                           observability::IntField("sleep_ms", wait.count())});
      sleeper_->Sleep(wait, ctx);
      Transition(issuing_state, execution);
      continue;
    }

    if (response.status >= 500 && response.status < 600) {
      retry_transient("server error " + std::to_string(response.status));
      continue;
    }

    if (response.status < 200 || response.status >= 300) {
      EVENTCACHE_LOG_WARN("http_error", {observability::StringField("entity_id", execution.request.entity_id),
                                         observability::IntField("status", response.status)});
      throw util::ProtocolError("unexpected HTTP status " + std::to_string(response.status), response.status);
    }

    return response;
  }
}

QueryPage QueryClient::Parse(const HttpResponse& response, const Execution& execution) const {
  if (options_.log_response_bodies && observability::ShouldLog(spdlog::level::debug)) {
    EVENTCACHE_LOG_DEBUG("query_response_body",
                         {observability::StringField("entity_id", execution.request.entity_id),
                          observability::IntField("page_index", static_cast<int64_t>(execution.page_index)),
                          observability::StringField("body", response.body)});
  }
  return ParseQueryPage(response.body, options_.timestamp_column);
}

std::chrono::milliseconds QueryClient::RateLimitWait(const HttpResponse& response) const {
  double seconds = static_cast<double>(options_.rate_limit_default_wait.count());
  if (auto retry_after = ParseSeconds(response.Header("retry-after"))) {
    seconds = *retry_after;
  } else if (auto reset = ParseSeconds(response.Header("x-ratelimit-reset"))) {
    seconds = *reset;
  }

  const double upper = std::max<double>(1.0, static_cast<double>(options_.rate_limit_max_wait.count()));
  seconds            = std::clamp(seconds, 1.0, upper);
  return milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

void QueryClient::Pace(util::RunContext& ctx) {
  if (options_.requests_per_minute > 0 && last_request_) {
    const auto interval = milliseconds(60000 / options_.requests_per_minute);
    const auto elapsed  = duration_cast<milliseconds>(Clock::now() - *last_request_);
    if (elapsed < interval) {
      EVENTCACHE_LOG_DEBUG("request_pacing_sleep", {observability::IntField("sleep_ms", (interval - elapsed).count())});
      sleeper_->Sleep(interval - elapsed, ctx);
    }
  }
  last_request_ = Clock::now();
}

void QueryClient::Transition(QueryState state, const Execution& execution) const {
  EVENTCACHE_LOG_INFO("query_state", {observability::StringField("state", QueryStateName(state)),
                                      observability::IntField("elapsed_ms", ElapsedMs(execution.started)),
                                      observability::StringField("entity_id", execution.request.entity_id),
                                      observability::IntField("page_index", static_cast<int64_t>(execution.page_index))});
}

} // namespace eventcache::client

#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/cache/segment_index.hpp"
#include "internal/client/curl_http_transport.hpp"
#include "internal/client/query_client.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/writer/part_writer.hpp"

namespace eventcache::factory {

using namespace eventcache;

namespace {

client::QueryClientOptions BuildClientOptions(const eventcache::runtime::config::RuntimeConfig& config, std::string api_key) {
  client::QueryClientOptions options;
  options.endpoint            = config.api().endpoint();
  options.auth_header         = config.api().auth_header();
  options.api_key             = std::move(api_key);
  options.per_page            = config.api().per_page();
  options.request_timeout     = std::chrono::milliseconds(config.api().request_timeout_ms());
  options.retry_attempts      = config.api().retry_attempts();
  options.requests_per_minute = config.api().requests_per_minute();

  options.poll_initial_delay = std::chrono::milliseconds(config.polling().initial_delay_ms());
  options.poll_max_delay     = std::chrono::milliseconds(config.polling().max_delay_ms());
  options.poll_max_attempts  = config.polling().max_attempts();
  options.poll_max_wall      = std::chrono::seconds(config.polling().max_wall_seconds());
  options.progress_log_every = config.polling().progress_log_every();

  options.rate_limit_default_wait = std::chrono::seconds(config.rate_limit().default_wait_seconds());
  options.rate_limit_max_wait     = std::chrono::seconds(config.rate_limit().max_wait_seconds());
  options.rate_limit_max_retries  = config.rate_limit().max_retries();

  options.timestamp_column    = config.writer().timestamp_column();
  options.log_response_bodies = config.logging().log_response_bodies();
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const eventcache::runtime::config::RuntimeConfig& config, std::string api_key,
                  std::shared_ptr<client::HttpTransport> transport, std::shared_ptr<util::Sleeper> sleeper) {
  Application app;

  // ------------------------------------------------------------------
  // Cache and writer
  // ------------------------------------------------------------------
  auto index = cache::SegmentIndex::Open(config.cache().root_path(), config.cache().bypass_on_corruption());

  auto compression = storage::common::Unwrap<std::invalid_argument>(
      storage::common::ResolveCompression(config.writer().compression()), "writer.compression");
  auto sink = std::make_shared<writer::ParquetPartWriter>(index->filesystem(), compression);

  // ------------------------------------------------------------------
  // Protocol client
  // ------------------------------------------------------------------
  if (!transport) transport = std::make_shared<client::CurlHttpTransport>(config.api().user_agent());
  if (!sleeper) sleeper = std::make_shared<util::ContextSleeper>();

  auto query_client =
      std::make_shared<client::QueryClient>(BuildClientOptions(config, std::move(api_key)), std::move(transport), std::move(sleeper));

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.index  = index;
  ctx.client = query_client;
  ctx.sink   = sink;

  service::IngestOptions options;
  options.timestamp_column     = config.writer().timestamp_column();
  options.divergence_tolerance = config.ingest().divergence_tolerance();

  app.ingest_service = std::make_shared<service::IngestService>(std::move(ctx), std::move(options));

  app.default_entity_id          = config.ingest().entity_id();
  app.default_filter             = config.ingest().query();
  app.writer_options.flush_rows  = config.writer().flush_rows();
  app.writer_options.flush_bytes = config.writer().flush_bytes();
  app.dedupe_enabled             = config.ingest().dedupe_events();

  return app;
}

} // namespace eventcache::factory

#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/client/http_transport.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/util/run_context.hpp"

namespace eventcache::factory {

/*
  Application

  Everything a single ingest run needs, built from one RuntimeConfig.
*/
struct Application {
  std::shared_ptr<service::IngestService> ingest_service;

  // Defaults for requests that do not override them.
  std::string           default_entity_id;
  std::string           default_filter;
  writer::WriterOptions writer_options;
  bool                  dedupe_enabled = true;
};

/*
  Build

  Composition root: the only place that knows the concrete transport,
  sleeper and part sink. The transport and sleeper may be injected for tests.
*/
Application Build(const eventcache::runtime::config::RuntimeConfig& config, std::string api_key,
                  std::shared_ptr<client::HttpTransport> transport = nullptr,
                  std::shared_ptr<util::Sleeper>         sleeper   = nullptr);

} // namespace eventcache::factory

#pragma once

#include <memory>

namespace eventcache::cache { class SegmentIndex; }
namespace eventcache::client { class QueryClient; }
namespace eventcache::writer { class PartSink; }

namespace eventcache::service {

/*
  Dependency container for the ingest service.
*/
struct ServiceContext {
  std::shared_ptr<eventcache::cache::SegmentIndex> index;
  std::shared_ptr<eventcache::client::QueryClient> client;
  std::shared_ptr<eventcache::writer::PartSink>    sink;
};

} // namespace eventcache::service

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/range/time_range.hpp"
#include "internal/util/error_category.hpp"
#include "internal/util/run_context.hpp"
#include "internal/util/time.hpp"

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

struct CliArgs {
  std::string config_path;
  std::string from;
  std::string to;
  std::string entity_id;
  std::optional<std::string> query;
};

static void Usage() {
  std::cerr << "Usage: eventcache --config <config.yaml> --from <ISO-8601> --to <ISO-8601> [--entity <id>] [--query <filter>]\n"
            << "  timestamps need an explicit zone, e.g. 2026-02-10T00:00:00Z\n";
}

static std::optional<CliArgs> ParseArgs(int argc, char** argv) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) return std::nullopt;
    const std::string value = argv[++i];

    if (flag == "--config") {
      args.config_path = value;
    } else if (flag == "--from") {
      args.from = value;
    } else if (flag == "--to") {
      args.to = value;
    } else if (flag == "--entity") {
      args.entity_id = value;
    } else if (flag == "--query") {
      args.query = value;
    } else {
      return std::nullopt;
    }
  }
  if (args.config_path.empty() || args.from.empty() || args.to.empty()) return std::nullopt;
  return args;
}

int main(int argc, char** argv) {
  auto args = ParseArgs(argc, argv);
  if (!args) {
    Usage();
    return 1;
  }

  bool run_failure_logged = false;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = eventcache::config::ConfigLoader::LoadFromYaml(args->config_path);
    eventcache::observability::InitializeLogging(config);

    const auto range = eventcache::range::MakeRange(eventcache::util::ParseIso8601Millis(args->from),
                                                    eventcache::util::ParseIso8601Millis(args->to));

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = eventcache::factory::Build(config, eventcache::config::ConfigLoader::ResolveApiKey(config));

    eventcache::service::IngestRequest request;
    request.entity_id      = args->entity_id.empty() ? app.default_entity_id : args->entity_id;
    request.range          = range;
    request.filter         = args->query.value_or(app.default_filter);
    request.writer         = app.writer_options;
    request.dedupe_enabled = app.dedupe_enabled;

    if (request.entity_id.empty()) {
      throw std::invalid_argument("no entity id: pass --entity or set ingest.entity_id");
    }

    std::unique_ptr<eventcache::util::RunContext> ctx;
    if (config.ingest().deadline_seconds() > 0) {
      ctx = std::make_unique<eventcache::util::RunContext>(std::chrono::seconds(config.ingest().deadline_seconds()));
    } else {
      ctx = std::make_unique<eventcache::util::RunContext>();
    }

    // Signal handlers only set a flag; the watcher turns it into a cancellation.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> done{false};
    std::thread       watcher([&] {
      while (!done.load()) {
        if (g_interrupted) {
          ctx->Cancel("interrupted by signal");
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    std::optional<eventcache::service::RunSummary> run;
    try {
      run = app.ingest_service->Run(request, *ctx);
    } catch (...) {
      // The service has already logged run_failed.
      run_failure_logged = true;
      done = true;
      watcher.join();
      throw;
    }
    done = true;
    watcher.join();

    std::cout << eventcache::service::RunSummaryToJson(*run) << std::endl;
    eventcache::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    const auto category = eventcache::util::Categorize(e);
    if (!run_failure_logged) {
      EVENTCACHE_LOG_ERROR("fatal_error", {eventcache::observability::StringField("error", e.what()),
                                           eventcache::observability::StringField("category", eventcache::util::CategoryName(category)),
                                           eventcache::observability::StringField("remediation", eventcache::util::RemediationHint(e))});
    }
    eventcache::observability::ShutdownLogging();
    return eventcache::util::ExitCode(category);
  }

  return 0;
}

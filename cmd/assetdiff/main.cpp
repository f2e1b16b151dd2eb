#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using assetdiff::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: assetdiff <config.yaml> OR assetdiff --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = assetdiff::config::ConfigLoader::LoadFromYaml(config_path);

    assetdiff::observability::InitializeTracing(config);
    assetdiff::observability::InitializeMetrics(config);
    assetdiff::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (queue recovery, workers, adapters)
    // ------------------------------------------------------------
    auto app = assetdiff::factory::Build(config);

    // ------------------------------------------------------------
    // Start intake server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ASSETDIFF_LOG_INFO("assetdiff started", {assetdiff::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ASSETDIFF_LOG_INFO("shutting down assetdiff");

    // Stop intake first so nothing is accepted after the worker drains.
    server.Stop();
    app.Stop();
    assetdiff::observability::ShutdownLogging();
    assetdiff::observability::ShutdownMetrics();
    assetdiff::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ASSETDIFF_LOG_ERROR("fatal error", {assetdiff::observability::StringField("error", e.what())});
    assetdiff::observability::ShutdownLogging();
    assetdiff::observability::ShutdownMetrics();
    assetdiff::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}

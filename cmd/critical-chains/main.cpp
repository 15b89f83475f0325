#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using chains::runtime::Server;

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
    std::cerr << "Usage: critical-chains <config.yaml> OR critical-chains --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chains::config::ConfigLoader::LoadFromYaml(config_path);

    chains::observability::InitializeLogging(config);
    const bool tracing = chains::observability::StartTracing(config.observability());
    const bool metrics = chains::observability::StartMetrics(config.observability());
    CHAINS_LOG_INFO("telemetry", {chains::observability::BoolField("tracing", tracing), chains::observability::BoolField("metrics", metrics)});

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = chains::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CHAINS_LOG_INFO("critical-chains started", {chains::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CHAINS_LOG_INFO("Shutting down critical-chains");

    server.Stop();
    chains::observability::ShutdownLogging();
    chains::observability::StopMetrics();
    chains::observability::StopTracing();
  } catch (const std::exception& e) {
    CHAINS_LOG_ERROR("Fatal error", {chains::observability::StringField("error", e.what())});
    chains::observability::ShutdownLogging();
    chains::observability::StopMetrics();
    chains::observability::StopTracing();
    return 2;
  }

  return 0;
}

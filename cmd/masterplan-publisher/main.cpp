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

using masterplan::factory::Build;
using masterplan::runtime::Server;

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
    std::cerr << "Usage: masterplan-publisher <config.yaml> OR masterplan-publisher --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = masterplan::config::ConfigLoader::LoadFromYaml(config_path);

    masterplan::observability::InitializeTracing(config);
    masterplan::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    MASTERPLAN_LOG_INFO("masterplan publisher started", {masterplan::observability::StringField("bind_address", config.server().bind_address()),
                                                          masterplan::observability::StringField("storage", config.storage().root_uri())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MASTERPLAN_LOG_INFO("Shutting down masterplan publisher");

    server.Stop();
    app.Shutdown();
    masterplan::observability::ShutdownLogging();
    masterplan::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    MASTERPLAN_LOG_ERROR("Fatal error", {masterplan::observability::StringField("error", e.what())});
    masterplan::observability::ShutdownLogging();
    masterplan::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}

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

using tasktree::factory::Build;
using tasktree::runtime::Server;

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
    std::cerr << "Usage: tasktree-server <config.yaml> OR tasktree-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tasktree::config::ConfigLoader::LoadFromYaml(config_path);

    tasktree::observability::InitializeTracing(config);
    tasktree::observability::InitializeMetrics(config);
    tasktree::observability::InitializeLogging(config);

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
    TASKTREE_LOG_INFO("tasktree server started", {tasktree::observability::StringField("bind_address", config.server().bind_address()),
                                                  tasktree::observability::BoolField("strict_mode", config.resolver().strict_mode())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TASKTREE_LOG_INFO("Shutting down tasktree server");

    server.Stop();
    app.Shutdown();
    tasktree::observability::ShutdownLogging();
    tasktree::observability::ShutdownMetrics();
    tasktree::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TASKTREE_LOG_ERROR("Fatal error", {tasktree::observability::StringField("error", e.what())});
    tasktree::observability::ShutdownLogging();
    tasktree::observability::ShutdownMetrics();
    tasktree::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/expiry/expiry_worker.hpp"
#include "internal/factory.hpp"
#include "internal/http/http_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using streamgate::runtime::Server;

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
    std::cerr << "Usage: streamgate <config.yaml> OR streamgate --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = streamgate::config::ConfigLoader::LoadFromYaml(config_path);

    streamgate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = streamgate::factory::Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.expiry_worker->Start();
    server.Start();
    app.http_server->Start();
    STREAMGATE_LOG_INFO("streamgate started", {streamgate::observability::StringField("grpc_bind_address", config.server().bind_address()),
                                               streamgate::observability::UintField("http_port", app.http_server->Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STREAMGATE_LOG_INFO("Shutting down streamgate");

    // Stop accepting streams first; in-flight bodies are cancelled by Stop().
    app.http_server->Stop();
    server.Stop();
    app.expiry_worker->Stop();
    streamgate::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    STREAMGATE_LOG_ERROR("Fatal error", {streamgate::observability::StringField("error", e.what())});
    streamgate::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

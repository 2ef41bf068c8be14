#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using chunkscribe::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

// Upload messages carry a whole chunk plus protobuf framing.
int MaxMessageBytes(const chunkscribe::runtime::config::RuntimeConfig& config) {
  const uint64_t wanted = config.ingest().max_blob_bytes() + 1024 * 1024;
  return wanted > static_cast<uint64_t>(std::numeric_limits<int>::max()) ? std::numeric_limits<int>::max() : static_cast<int>(wanted);
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: chunkscribe <config.yaml> OR chunkscribe --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chunkscribe::config::ConfigLoader::LoadFromYaml(config_path);

    chunkscribe::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = chunkscribe::factory::Build(config);
    app.Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services), MaxMessageBytes(config));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CHUNKSCRIBE_LOG_INFO("chunkscribe started", {chunkscribe::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHUNKSCRIBE_LOG_INFO("Shutting down chunkscribe");

    server.Stop();
    app.Stop();
    chunkscribe::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CHUNKSCRIBE_LOG_ERROR("Fatal error", {chunkscribe::observability::StringField("error", e.what())});
    chunkscribe::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using chatrelay::observability::StringField;

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
    std::cerr << "Usage: chatrelay-engine <config.yaml> OR chatrelay-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chatrelay::config::ConfigLoader::LoadEngineFromYaml(config_path);

    chatrelay::observability::InitializeLogging(config.logging(), "chatrelay-engine");

    // ------------------------------------------------------------
    // Build and start
    // ------------------------------------------------------------
    auto runtime = chatrelay::factory::BuildEngine(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime->Start();
    CHATRELAY_LOG_INFO("engine_ready", {StringField("control", config.control().bind_address()), StringField("history", config.history().sqlite_path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CHATRELAY_LOG_INFO("engine_shutting_down");
    runtime->Shutdown();
    runtime.reset();
    chatrelay::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("fatal", {StringField("error", e.what())});
    chatrelay::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

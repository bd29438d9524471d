#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using chatrelay::observability::BoolField;
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
    std::cerr << "Usage: chatrelay-ingest <config.yaml> OR chatrelay-ingest --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = chatrelay::config::ConfigLoader::LoadIngestFromYaml(config_path);

    chatrelay::observability::InitializeLogging(config.logging(), "chatrelay-ingest");

    auto runtime = chatrelay::factory::BuildIngest(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime->Start();
    CHATRELAY_LOG_INFO("ingest_ready", {StringField("bind_address", config.server().bind_address()),
                                        BoolField("require_signature", config.security().require_signature()),
                                        BoolField("business", !config.business().url().empty())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CHATRELAY_LOG_INFO("ingest_shutting_down");
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

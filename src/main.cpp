#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const host_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | interval_ms=" << config.interval.count()
         << " | cpu_window_ms=" << config.cpu_window.count()
         << " | collector_url=" << config.collector.url
         << " | collector_timeout_ms=" << config.collector.timeout.count()
         << " | auth=" << (config.collector.auth_token.empty() ? "none" : "bearer")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false");

  for (const auto& [reader, enabled] : config.reader_enabled) {
    if (!enabled) {
      output << " | " << reader << "=disabled";
    }
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/agent.yaml";

  host_agent::core::AgentConfig config{};
  try {
    config = host_agent::core::load_agent_config(config_path);
    host_agent::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  host_agent::core::Agent agent{config};
  while (g_shutdown_requested == 0) {
    agent.run_for_cycles(1);
  }

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";

  return 0;
}

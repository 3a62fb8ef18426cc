#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace host_agent::core {

struct CollectorConfig {
  std::string url{"http://localhost:25800"};
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds connect_timeout{2000};
  std::string auth_token{};
};

struct AgentConfig {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds cpu_window{200};
  bool stdout_debug{false};
  CollectorConfig collector{};
  std::unordered_map<std::string, bool> reader_enabled{};
};

// Throws std::runtime_error on unreadable files and invalid values.
AgentConfig load_agent_config(const std::string& path);

// HOST_AGENT_COLLECTOR_URL, HOST_AGENT_INTERVAL_MS, HOST_AGENT_AUTH_TOKEN.
void apply_env_overrides(AgentConfig& config);

void validate_agent_config(const AgentConfig& config);

}  // namespace host_agent::core

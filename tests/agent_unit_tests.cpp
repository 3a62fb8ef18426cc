#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/sampler.hpp"
#include "model/snapshot.hpp"
#include "model/snapshot_json.hpp"
#include "sensors/counter_reader.hpp"
#include "sinks/http_transport.hpp"

using host_agent::core::Agent;
using host_agent::core::AgentConfig;
using host_agent::core::AgentStats;
using host_agent::core::Sampler;
using host_agent::core::apply_env_overrides;
using host_agent::core::load_agent_config;
using host_agent::model::InterfaceMap;
using host_agent::model::MemoryUsage;
using host_agent::model::ProcessCounts;
using host_agent::model::Snapshot;
using host_agent::model::encode;
using host_agent::sensors::CounterReader;
using host_agent::sensors::ReadError;
using host_agent::sensors::ReaderSet;
using host_agent::sinks::HttpRequest;
using host_agent::sinks::HttpResponse;
using host_agent::sinks::HttpTransport;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

template <typename T>
class FixedReader final : public CounterReader<T> {
 public:
  explicit FixedReader(T value, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
      : value_(std::move(value)), delay_(delay) {}

  T read() override {
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    return value_;
  }

 private:
  T value_;
  std::chrono::milliseconds delay_;
};

// Fails the first fail_count reads, then returns value.
template <typename T>
class FailingReader final : public CounterReader<T> {
 public:
  FailingReader(std::string family, int fail_count, T value = {})
      : family_(std::move(family)), remaining_failures_(fail_count), value_(std::move(value)) {}

  T read() override {
    if (remaining_failures_ != 0) {
      if (remaining_failures_ > 0) {
        --remaining_failures_;
      }
      throw ReadError(family_, "source unavailable");
    }
    return value_;
  }

 private:
  std::string family_;
  int remaining_failures_;
  T value_;
};

struct TransportLog {
  std::vector<HttpRequest> requests{};
  std::size_t failures_remaining{0};
};

class RecordingTransport final : public HttpTransport {
 public:
  explicit RecordingTransport(std::shared_ptr<TransportLog> log) : log_(std::move(log)) {}

  HttpResponse post(const HttpRequest& request) override {
    log_->requests.push_back(request);
    HttpResponse response{};
    if (log_->failures_remaining > 0) {
      --log_->failures_remaining;
      response.error = "Couldn't connect to server";
      return response;
    }
    response.status_code = 200;
    return response;
  }

 private:
  std::shared_ptr<TransportLog> log_;
};

MemoryUsage scenario_memory() { return {.total = 16360284160ULL, .used = 10183102464ULL}; }

MemoryUsage scenario_swap() { return {.total = 17179865088ULL, .used = 4194304ULL}; }

ProcessCounts scenario_processes() { return {.total = 280, .running = 0, .sleeping = 215, .zombie = 0}; }

InterfaceMap scenario_interfaces() {
  InterfaceMap net;
  net["lo"] = {.rx = 4094, .tx = 4094};
  return net;
}

ReaderSet scenario_readers(std::chrono::milliseconds cpu_delay = std::chrono::milliseconds(0)) {
  ReaderSet readers{};
  readers.cpu = std::make_unique<FixedReader<std::vector<double>>>(std::vector<double>{12.5, 0.0, 100.0, 3.25},
                                                                   cpu_delay);
  readers.memory = std::make_unique<FixedReader<MemoryUsage>>(scenario_memory());
  readers.swap = std::make_unique<FixedReader<MemoryUsage>>(scenario_swap());
  readers.network = std::make_unique<FixedReader<InterfaceMap>>(scenario_interfaces());
  readers.process = std::make_unique<FixedReader<ProcessCounts>>(scenario_processes());
  return readers;
}

Snapshot scenario_snapshot() {
  Snapshot snapshot{};
  snapshot.cpu = {12.5, 0.0, 100.0, 3.25};
  snapshot.mem = scenario_memory();
  snapshot.swap = scenario_swap();
  snapshot.net = scenario_interfaces();
  snapshot.proc = scenario_processes();
  return snapshot;
}

AgentConfig fast_config() {
  AgentConfig config{};
  config.interval = std::chrono::milliseconds(5);
  config.cpu_window = std::chrono::milliseconds(0);
  config.collector.url = "http://collector.test:25800/ingest";
  return config;
}

int test_sampler_collects_every_family() {
  Sampler sampler(scenario_readers());
  const Snapshot snapshot = sampler.sample();

  if (snapshot != scenario_snapshot()) {
    return fail("test_sampler_collects_every_family", "snapshot should carry every reader value");
  }
  if (!sampler.last_failures().empty() || sampler.core_count() != 4) {
    return fail("test_sampler_collects_every_family", "no failures expected and core count should track cpu");
  }

  return 0;
}

int test_sampler_substitutes_zero_values() {
  ReaderSet readers = scenario_readers();
  readers.memory = std::make_unique<FailingReader<MemoryUsage>>("memory", -1);
  readers.network = std::make_unique<FailingReader<InterfaceMap>>("network", 1, scenario_interfaces());
  Sampler sampler(std::move(readers));

  const Snapshot first = sampler.sample();
  if (first.mem != MemoryUsage{} || !first.net.empty()) {
    return fail("test_sampler_substitutes_zero_values", "failed readers should contribute zero values");
  }
  if (first.cpu.size() != 4 || first.swap != scenario_swap() || first.proc != scenario_processes()) {
    return fail("test_sampler_substitutes_zero_values", "healthy readers should be unaffected");
  }
  if (sampler.last_failures().size() != 2 || sampler.last_failures().front().family != "memory") {
    return fail("test_sampler_substitutes_zero_values", "both failures should be recorded in order");
  }

  const Snapshot second = sampler.sample();
  if (second.net != scenario_interfaces() || sampler.last_failures().size() != 1) {
    return fail("test_sampler_substitutes_zero_values", "recovered reader should report again next cycle");
  }

  return 0;
}

int test_sampler_cpu_zero_value_keeps_core_count() {
  ReaderSet readers = scenario_readers();
  readers.cpu = std::make_unique<FailingReader<std::vector<double>>>("cpu", -1);
  Sampler cold_sampler(std::move(readers));

  const Snapshot cold = cold_sampler.sample();
  if (cold.cpu.size() != cold_sampler.core_count()) {
    return fail("test_sampler_cpu_zero_value_keeps_core_count", "cold cpu failure should use the host core count");
  }
  for (const double value : cold.cpu) {
    if (value != 0.0) {
      return fail("test_sampler_cpu_zero_value_keeps_core_count", "cpu zero value should be all zeros");
    }
  }

  class FlakyCpu final : public CounterReader<std::vector<double>> {
   public:
    std::vector<double> read() override {
      ++calls_;
      if (calls_ == 2) {
        throw ReadError("cpu", "unable to read /proc/stat");
      }
      return {10.0, 20.0, 30.0, 40.0, 50.0, 60.0};
    }

   private:
    int calls_{0};
  };

  ReaderSet flaky = scenario_readers();
  flaky.cpu = std::make_unique<FlakyCpu>();
  Sampler sampler(std::move(flaky));
  (void)sampler.sample();
  const Snapshot failed = sampler.sample();
  if (failed.cpu != std::vector<double>(6, 0.0)) {
    return fail("test_sampler_cpu_zero_value_keeps_core_count", "cpu zero value should keep the last core count");
  }

  return 0;
}

int test_sampler_disabled_and_missing_readers() {
  ReaderSet readers = scenario_readers();
  readers.swap.reset();
  Sampler sampler(std::move(readers), {{"process", false}, {"memory", true}});

  const Snapshot snapshot = sampler.sample();
  if (snapshot.swap != MemoryUsage{} || snapshot.proc != ProcessCounts{}) {
    return fail("test_sampler_disabled_and_missing_readers", "disabled or missing readers report zero values");
  }
  if (snapshot.mem != scenario_memory() || !sampler.last_failures().empty()) {
    return fail("test_sampler_disabled_and_missing_readers", "disabled readers are not failures");
  }

  return 0;
}

int test_agent_keeps_reporting_through_collector_outage() {
  auto log = std::make_shared<TransportLog>();
  log->failures_remaining = 10;

  Agent agent(fast_config(), scenario_readers(), std::make_unique<RecordingTransport>(log));
  const AgentStats stats = agent.run_for_cycles(11);

  if (stats.cycles_executed != 11 || stats.send_failures != 10 || stats.snapshots_sent != 1) {
    return fail("test_agent_keeps_reporting_through_collector_outage", "ten failed posts then one success expected");
  }
  if (log->requests.size() != 11) {
    return fail("test_agent_keeps_reporting_through_collector_outage", "every cycle should attempt one post");
  }

  const std::string expected = encode(scenario_snapshot());
  for (const auto& request : log->requests) {
    if (request.body != expected || request.url != "http://collector.test:25800/ingest") {
      return fail("test_agent_keeps_reporting_through_collector_outage", "payload should not depend on past failures");
    }
  }

  return 0;
}

int test_agent_posts_when_readers_fail() {
  auto log = std::make_shared<TransportLog>();
  ReaderSet readers = scenario_readers();
  readers.network = std::make_unique<FailingReader<InterfaceMap>>("network", -1);
  readers.process = std::make_unique<FailingReader<ProcessCounts>>("process", -1);

  Agent agent(fast_config(), std::move(readers), std::make_unique<RecordingTransport>(log));
  const AgentStats stats = agent.run_for_cycles(2);

  if (stats.snapshots_sent != 2 || stats.read_failures != 4) {
    return fail("test_agent_posts_when_readers_fail", "reader failures should not stop reporting");
  }

  Snapshot expected = scenario_snapshot();
  expected.net.clear();
  expected.proc = {};
  if (log->requests.size() != 2 || log->requests.back().body != encode(expected)) {
    return fail("test_agent_posts_when_readers_fail", "payload should carry zero values with an empty net map");
  }
  if (log->requests.back().body.find("\"net\":{}") == std::string::npos) {
    return fail("test_agent_posts_when_readers_fail", "empty interface map should still be sent");
  }

  return 0;
}

int test_agent_drops_overrun_slots() {
  auto log = std::make_shared<TransportLog>();
  AgentConfig config = fast_config();
  config.interval = std::chrono::milliseconds(10);

  Agent agent(config, scenario_readers(std::chrono::milliseconds(35)), std::make_unique<RecordingTransport>(log));
  const AgentStats stats = agent.run_for_cycles(2);

  if (stats.cycles_executed != 2 || log->requests.size() != 2) {
    return fail("test_agent_drops_overrun_slots", "slow cycles still run one at a time");
  }
  if (stats.dropped_cycles == 0) {
    return fail("test_agent_drops_overrun_slots", "missed timer slots should be counted as dropped");
  }

  return 0;
}

int test_agent_stop_interrupts_wait() {
  auto log = std::make_shared<TransportLog>();
  AgentConfig config = fast_config();
  config.interval = std::chrono::milliseconds(60000);

  Agent agent(config, scenario_readers(), std::make_unique<RecordingTransport>(log));
  AgentStats stats{};
  const auto started = std::chrono::steady_clock::now();
  std::thread runner([&agent, &stats]() { stats = agent.run_for_cycles(0); });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  agent.stop();
  runner.join();

  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(10)) {
    return fail("test_agent_stop_interrupts_wait", "stop should not wait for the next interval");
  }
  if (!agent.stop_requested() || stats.cycles_executed != 1 || log->requests.size() != 1) {
    return fail("test_agent_stop_interrupts_wait", "exactly one cycle should run before stop");
  }

  return 0;
}

bool config_throws(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  {
    std::ofstream out(path);
    out << content;
  }

  bool threw = false;
  try {
    (void)load_agent_config(path.string());
  } catch (const std::exception&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_config_parsing_edge_cases() {
  if (!config_throws("host_agent_bad_interval.yaml", "interval_ms: fast\n")) {
    return fail("test_config_parsing_edge_cases", "non-numeric interval should throw");
  }
  if (!config_throws("host_agent_zero_interval.yaml", "interval_ms: 0\n")) {
    return fail("test_config_parsing_edge_cases", "zero interval should throw");
  }
  if (!config_throws("host_agent_wide_window.yaml", "interval_ms: 500\ncpu_window_ms: 500\n")) {
    return fail("test_config_parsing_edge_cases", "cpu window must be shorter than the interval");
  }
  if (!config_throws("host_agent_bad_url.yaml", "collector:\n  url: localhost:25800\n")) {
    return fail("test_config_parsing_edge_cases", "collector url without scheme should throw");
  }
  if (!config_throws("host_agent_bad_timeout.yaml", "collector:\n  timeout_ms: -5\n")) {
    return fail("test_config_parsing_edge_cases", "negative timeout should throw");
  }

  bool missing_threw = false;
  try {
    (void)load_agent_config("/nonexistent/host_agent.yaml");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing_edge_cases", "missing config file should throw");
  }

  const auto path = std::filesystem::temp_directory_path() / "host_agent_full.yaml";
  {
    std::ofstream out(path);
    out << "# agent settings\n"
           "interval_ms: 2000\n"
           "cpu_window_ms: 250\n"
           "collector:\n"
           "  url: \"https://metrics.example.com/v1/ingest\"\n"
           "  timeout_ms: 3000\n"
           "  auth_token: 'abc123'\n"
           "agent:\n"
           "  stdout_debug: yes\n"
           "readers:\n"
           "  network: false\n"
           "  cpu: true\n";
  }
  const AgentConfig config = load_agent_config(path.string());
  std::filesystem::remove(path);

  if (config.interval != std::chrono::milliseconds(2000) || config.cpu_window != std::chrono::milliseconds(250)) {
    return fail("test_config_parsing_edge_cases", "interval and window should parse");
  }
  if (config.collector.url != "https://metrics.example.com/v1/ingest" || config.collector.auth_token != "abc123" ||
      config.collector.timeout != std::chrono::milliseconds(3000) ||
      config.collector.connect_timeout != std::chrono::milliseconds(2000)) {
    return fail("test_config_parsing_edge_cases", "collector section should parse with quotes stripped");
  }
  if (!config.stdout_debug || config.reader_enabled.at("network") || !config.reader_enabled.at("cpu")) {
    return fail("test_config_parsing_edge_cases", "agent and readers sections should parse");
  }

  const auto hash_path = std::filesystem::temp_directory_path() / "host_agent_hash_values.yaml";
  {
    std::ofstream out(hash_path);
    out << "collector:\n"
           "  url: http://collector.test/ingest#frag   # trailing comment\n"
           "  auth_token: \"s3cr#t\" # quoted hash is part of the token\n"
           "#interval_ms: 5\n";
  }
  const AgentConfig hash_config = load_agent_config(hash_path.string());
  std::filesystem::remove(hash_path);

  if (hash_config.collector.auth_token != "s3cr#t") {
    return fail("test_config_parsing_edge_cases", "quoted value containing '#' should load intact");
  }
  if (hash_config.collector.url != "http://collector.test/ingest#frag" ||
      hash_config.interval != std::chrono::milliseconds(1000)) {
    return fail("test_config_parsing_edge_cases", "'#' starts a comment only at line start or after whitespace");
  }

  return 0;
}

int test_env_overrides() {
  AgentConfig config{};
  ::setenv("HOST_AGENT_COLLECTOR_URL", "http://10.0.0.5:9000/", 1);
  ::setenv("HOST_AGENT_INTERVAL_MS", "750", 1);
  ::setenv("HOST_AGENT_AUTH_TOKEN", "tok", 1);
  apply_env_overrides(config);

  if (config.collector.url != "http://10.0.0.5:9000/" || config.interval != std::chrono::milliseconds(750) ||
      config.collector.auth_token != "tok") {
    return fail("test_env_overrides", "environment should override config values");
  }

  ::setenv("HOST_AGENT_INTERVAL_MS", "100", 1);
  bool threw = false;
  try {
    apply_env_overrides(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  ::unsetenv("HOST_AGENT_COLLECTOR_URL");
  ::unsetenv("HOST_AGENT_INTERVAL_MS");
  ::unsetenv("HOST_AGENT_AUTH_TOKEN");

  if (!threw) {
    return fail("test_env_overrides", "override shorter than the cpu window should throw");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sampler_collects_every_family(); rc != 0) return rc;
  if (int rc = test_sampler_substitutes_zero_values(); rc != 0) return rc;
  if (int rc = test_sampler_cpu_zero_value_keeps_core_count(); rc != 0) return rc;
  if (int rc = test_sampler_disabled_and_missing_readers(); rc != 0) return rc;
  if (int rc = test_agent_keeps_reporting_through_collector_outage(); rc != 0) return rc;
  if (int rc = test_agent_posts_when_readers_fail(); rc != 0) return rc;
  if (int rc = test_agent_drops_overrun_slots(); rc != 0) return rc;
  if (int rc = test_agent_stop_interrupts_wait(); rc != 0) return rc;
  if (int rc = test_config_parsing_edge_cases(); rc != 0) return rc;
  if (int rc = test_env_overrides(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}

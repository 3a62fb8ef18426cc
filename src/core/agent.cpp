#include "core/agent.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "model/snapshot_json.hpp"

namespace host_agent::core {
namespace {

sinks::HttpPostOptions reporter_options(const AgentConfig& config) {
  sinks::HttpPostOptions options{};
  options.url = config.collector.url;
  options.timeout = config.collector.timeout;
  options.connect_timeout = config.collector.connect_timeout;
  options.auth_token = config.collector.auth_token;
  return options;
}

}  // namespace

Agent::Agent(AgentConfig config)
    : Agent(config, sensors::make_procfs_readers(config.cpu_window), sinks::make_curl_transport()) {}

Agent::Agent(AgentConfig config, sensors::ReaderSet readers, std::unique_ptr<sinks::HttpTransport> transport)
    : interval_(config.interval),
      sampler_(std::move(readers), config.reader_enabled),
      reporter_(reporter_options(config), std::move(transport)),
      publish_stdout_(config.stdout_debug) {
  std::cerr << "[agent] reporting to " << config.collector.url << " every " << interval_.count()
            << " ms (cpu window " << config.cpu_window.count() << " ms)\n";
}

AgentStats Agent::run_for_cycles(const std::size_t total_cycles) {
  AgentStats stats{};

  if (first_cycle_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_cycle_ = false;
  }

  for (std::size_t i = 0; (total_cycles == 0 || i < total_cycles) && !stop_requested(); ++i) {
    run_cycle(stats);
    ++stats.cycles_executed;

    schedule_next_slot(stats);
    wait_for_next_slot();
  }

  return stats;
}

void Agent::stop() noexcept {
  {
    const std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

bool Agent::stop_requested() const noexcept {
  const std::lock_guard<std::mutex> lock(stop_mutex_);
  return stop_requested_;
}

void Agent::run_cycle(AgentStats& stats) {
  const model::Snapshot snapshot = sampler_.sample();
  stats.read_failures += sampler_.last_failures().size();

  const std::string payload = model::encode(snapshot);

  if (publish_stdout_) {
    stdout_sink_.publish(snapshot);
  }

  const sinks::SendResult result = reporter_.send(payload);
  if (result.ok()) {
    ++stats.snapshots_sent;
    if (!reporter_was_ok_) {
      std::cerr << "[reporter] collector reachable again\n";
      reporter_was_ok_ = true;
    }
  } else {
    ++stats.send_failures;
    reporter_was_ok_ = false;
  }
}

void Agent::schedule_next_slot(AgentStats& stats) {
  next_wakeup_ += interval_;

  const auto now = std::chrono::steady_clock::now();
  if (now <= next_wakeup_) {
    return;
  }

  const auto missed_slots = static_cast<std::size_t>((now - next_wakeup_) / interval_) + 1;
  next_wakeup_ += interval_ * static_cast<long long>(missed_slots);
  stats.dropped_cycles += missed_slots;
  std::cerr << "[agent] cycle overran its interval; dropped " << missed_slots << " slot(s)\n";
}

void Agent::wait_for_next_slot() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_until(lock, next_wakeup_, [this] { return stop_requested_; });
}

}  // namespace host_agent::core

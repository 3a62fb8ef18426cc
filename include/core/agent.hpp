#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

#include "core/config.hpp"
#include "core/sampler.hpp"
#include "sensors/counter_reader.hpp"
#include "sinks/http_post.hpp"
#include "sinks/http_transport.hpp"
#include "sinks/stdout_debug.hpp"

namespace host_agent::core {

struct AgentStats {
  std::size_t cycles_executed{0};
  std::size_t snapshots_sent{0};
  std::size_t send_failures{0};
  std::size_t read_failures{0};
  std::size_t dropped_cycles{0};
};

// Fixed-interval loop: sample, encode, post. One cycle runs at a time; timer
// slots that pass while a cycle is still running are dropped, not queued.
class Agent {
 public:
  explicit Agent(AgentConfig config = {});
  Agent(AgentConfig config, sensors::ReaderSet readers, std::unique_ptr<sinks::HttpTransport> transport);

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Runs total_cycles cycles, or until stop() when total_cycles is 0.
  AgentStats run_for_cycles(std::size_t total_cycles);

  // Safe to call from any thread; interrupts the wait between cycles.
  void stop() noexcept;
  [[nodiscard]] bool stop_requested() const noexcept;

 private:
  void run_cycle(AgentStats& stats);
  void schedule_next_slot(AgentStats& stats);
  void wait_for_next_slot();

  std::chrono::milliseconds interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_cycle_{true};
  Sampler sampler_;
  sinks::HttpPostSink reporter_;
  sinks::StdoutDebugSink stdout_sink_{};
  bool publish_stdout_{false};
  bool reporter_was_ok_{true};

  mutable std::mutex stop_mutex_{};
  std::condition_variable stop_cv_{};
  bool stop_requested_{false};
};

}  // namespace host_agent::core

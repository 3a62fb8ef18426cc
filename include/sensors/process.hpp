#pragma once

#include <string>

#include "sensors/counter_reader.hpp"

namespace host_agent::sensors {

class ProcessSensor final : public ProcessReader {
 public:
  ProcessSensor();
  explicit ProcessSensor(std::string proc_root);

  model::ProcessCounts read() override;

 private:
  static constexpr std::size_t kReadBufferSize = 1024;

  static bool is_pid_name(const std::string& name) noexcept;
  static bool read_state(const std::string& stat_path, char& state) noexcept;

  std::string proc_root_;
};

}  // namespace host_agent::sensors

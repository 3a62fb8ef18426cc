#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

#include "sensors/counter_reader.hpp"

namespace host_agent::sensors {

// Per-core utilization from two /proc/stat reads taken one window apart.
class CpuSensor final : public CpuReader {
 public:
  using WaitFn = std::function<void(std::chrono::milliseconds)>;

  explicit CpuSensor(std::chrono::milliseconds window);
  CpuSensor(std::FILE* file, std::chrono::milliseconds window, WaitFn wait, bool owns_file = false);
  ~CpuSensor() override;

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  std::vector<double> read() override;

 private:
  static constexpr std::size_t kReadBufferSize = 512;
  static constexpr std::size_t kMaxCores = 8192;

  struct CoreTicks {
    std::uint64_t busy{0};
    std::uint64_t total{0};
    bool present{false};
  };

  std::vector<CoreTicks> read_ticks();
  static bool parse_core_line(const char* line, std::size_t& index, CoreTicks& ticks) noexcept;

  std::string path_{};
  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::chrono::milliseconds window_{};
  WaitFn wait_{};
};

}  // namespace host_agent::sensors

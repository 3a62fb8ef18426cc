#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "model/snapshot.hpp"

namespace host_agent::sensors {

// Thrown when a metric family cannot be read or its source is malformed.
class ReadError : public std::runtime_error {
 public:
  ReadError(std::string family, const std::string& message)
      : std::runtime_error(message), family_(std::move(family)) {}

  [[nodiscard]] const std::string& family() const noexcept { return family_; }

 private:
  std::string family_;
};

template <typename T>
class CounterReader {
 public:
  using value_type = T;

  virtual ~CounterReader() = default;

  virtual T read() = 0;
};

using CpuReader = CounterReader<std::vector<double>>;
using MemoryReader = CounterReader<model::MemoryUsage>;
using NetworkReader = CounterReader<model::InterfaceMap>;
using ProcessReader = CounterReader<model::ProcessCounts>;

// One reader per metric family. A null entry means the family is not sampled.
struct ReaderSet {
  std::unique_ptr<CpuReader> cpu{};
  std::unique_ptr<MemoryReader> memory{};
  std::unique_ptr<MemoryReader> swap{};
  std::unique_ptr<NetworkReader> network{};
  std::unique_ptr<ProcessReader> process{};
};

ReaderSet make_procfs_readers(std::chrono::milliseconds cpu_window);

}  // namespace host_agent::sensors

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace host_agent::model {

struct MemoryUsage {
  std::uint64_t total{0};
  std::uint64_t used{0};

  bool operator==(const MemoryUsage&) const = default;
};

struct InterfaceCounters {
  std::uint64_t rx{0};
  std::uint64_t tx{0};

  bool operator==(const InterfaceCounters&) const = default;
};

using InterfaceMap = std::map<std::string, InterfaceCounters>;

struct ProcessCounts {
  std::uint64_t total{0};
  std::uint64_t running{0};
  std::uint64_t sleeping{0};
  std::uint64_t zombie{0};

  bool operator==(const ProcessCounts&) const = default;
};

// One sampling cycle. Built once by the sampler, then only read.
struct Snapshot {
  std::vector<double> cpu{};
  MemoryUsage mem{};
  MemoryUsage swap{};
  InterfaceMap net{};
  ProcessCounts proc{};

  bool operator==(const Snapshot&) const = default;
};

}  // namespace host_agent::model

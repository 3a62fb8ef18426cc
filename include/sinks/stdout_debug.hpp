#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include "model/snapshot.hpp"

namespace host_agent::sinks {

// Human-readable byte count, base 1024, two decimals ("1.50 KB").
std::string format_bytes(std::uint64_t bytes);

class StdoutDebugSink {
 public:
  StdoutDebugSink() = default;
  explicit StdoutDebugSink(std::FILE* out);

  void publish(const model::Snapshot& snapshot) const;

 private:
  std::FILE* out_{stdout};
};

}  // namespace host_agent::sinks

#include "sinks/stdout_debug.hpp"

#include <array>
#include <cstddef>
#include <numeric>

#include "core/math.hpp"

namespace host_agent::sinks {

std::string format_bytes(const std::uint64_t bytes) {
  static constexpr std::array<const char*, 6> kUnits = {"B", "KB", "MB", "GB", "TB", "PB"};

  double size = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (size >= 1024.0 && unit < kUnits.size() - 1) {
    size /= 1024.0;
    ++unit;
  }

  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.2f %s", size, kUnits[unit]);
  return buffer;
}

StdoutDebugSink::StdoutDebugSink(std::FILE* out) : out_(out) {}

void StdoutDebugSink::publish(const model::Snapshot& snapshot) const {
  if (out_ == nullptr) {
    return;
  }

  std::fprintf(out_, "[cpu] cores=%zu\n", snapshot.cpu.size());
  for (std::size_t i = 0; i < snapshot.cpu.size(); ++i) {
    std::fprintf(out_, "[cpu]   core %zu: %.1f%%\n", i, snapshot.cpu[i]);
  }
  const double average =
      snapshot.cpu.empty() ? 0.0
                           : std::accumulate(snapshot.cpu.begin(), snapshot.cpu.end(), 0.0) /
                                 static_cast<double>(snapshot.cpu.size());
  std::fprintf(out_, "[cpu] average=%.1f%%\n", average);

  std::fprintf(out_, "[mem] %s / %s (%.1f%%)\n", format_bytes(snapshot.mem.used).c_str(),
               format_bytes(snapshot.mem.total).c_str(),
               core::percent_of(static_cast<double>(snapshot.mem.used), static_cast<double>(snapshot.mem.total)));
  std::fprintf(out_, "[swap] %s / %s (%.1f%%)\n", format_bytes(snapshot.swap.used).c_str(),
               format_bytes(snapshot.swap.total).c_str(),
               core::percent_of(static_cast<double>(snapshot.swap.used), static_cast<double>(snapshot.swap.total)));

  for (const auto& [name, counters] : snapshot.net) {
    std::fprintf(out_, "[net] %s: rx %s, tx %s\n", name.c_str(), format_bytes(counters.rx).c_str(),
                 format_bytes(counters.tx).c_str());
  }

  std::fprintf(out_, "[proc] total=%llu running=%llu sleeping=%llu zombie=%llu\n",
               static_cast<unsigned long long>(snapshot.proc.total),
               static_cast<unsigned long long>(snapshot.proc.running),
               static_cast<unsigned long long>(snapshot.proc.sleeping),
               static_cast<unsigned long long>(snapshot.proc.zombie));
  std::fflush(out_);
}

}  // namespace host_agent::sinks

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include "sensors/counter_reader.hpp"

namespace host_agent::sensors {

enum class MemoryKind : std::uint8_t {
  RAM = 0,
  SWAP = 1,
};

// Reads /proc/meminfo. RAM "used" is MemTotal - MemAvailable, so reclaimable
// page cache and buffers count as free. Swap "used" is SwapTotal - SwapFree.
class MemorySensor final : public MemoryReader {
 public:
  struct RawFields {
    std::uint64_t mem_total_kb{0};
    std::uint64_t mem_free_kb{0};
    std::uint64_t mem_available_kb{0};
    std::uint64_t buffers_kb{0};
    std::uint64_t cached_kb{0};
    std::uint64_t sreclaimable_kb{0};
    std::uint64_t swap_total_kb{0};
    std::uint64_t swap_free_kb{0};
    bool has_mem_total{false};
    bool has_mem_available{false};
    bool has_swap_total{false};
    bool has_swap_free{false};
  };

  explicit MemorySensor(MemoryKind kind);
  MemorySensor(MemoryKind kind, std::FILE* meminfo, bool owns_file = false);
  ~MemorySensor() override;

  MemorySensor(const MemorySensor&) = delete;
  MemorySensor& operator=(const MemorySensor&) = delete;

  model::MemoryUsage read() override;
  const RawFields& raw() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  [[nodiscard]] const char* family() const noexcept;
  bool parse_meminfo() noexcept;
  std::uint64_t to_bytes(std::uint64_t kb) const;

  MemoryKind kind_;
  std::FILE* meminfo_{nullptr};
  bool owns_file_{true};
  RawFields raw_{};
};

}  // namespace host_agent::sensors

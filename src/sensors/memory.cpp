#include "sensors/memory.hpp"

#include <cstring>
#include <limits>

namespace host_agent::sensors {

namespace {

constexpr const char* kProcMeminfo = "/proc/meminfo";

// Every reported byte count must fit a signed 64-bit integer.
constexpr std::uint64_t kMaxKb = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) / 1024U;

std::uint64_t saturating_sub(const std::uint64_t lhs, const std::uint64_t rhs) noexcept {
  return lhs > rhs ? lhs - rhs : 0;
}

}  // namespace

MemorySensor::MemorySensor(const MemoryKind kind) : kind_(kind), meminfo_(std::fopen(kProcMeminfo, "r")) {}

MemorySensor::MemorySensor(const MemoryKind kind, std::FILE* meminfo, const bool owns_file)
    : kind_(kind), meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

model::MemoryUsage MemorySensor::read() {
  if (meminfo_ == nullptr && owns_file_) {
    meminfo_ = std::fopen(kProcMeminfo, "r");
  }
  if (!parse_meminfo()) {
    throw ReadError(family(), "unable to read /proc/meminfo");
  }

  model::MemoryUsage usage{};
  if (kind_ == MemoryKind::SWAP) {
    if (!raw_.has_swap_total || !raw_.has_swap_free) {
      throw ReadError(family(), "SwapTotal/SwapFree missing from /proc/meminfo");
    }
    usage.total = to_bytes(raw_.swap_total_kb);
    usage.used = to_bytes(saturating_sub(raw_.swap_total_kb, raw_.swap_free_kb));
    return usage;
  }

  if (!raw_.has_mem_total) {
    throw ReadError(family(), "MemTotal missing from /proc/meminfo");
  }

  // Kernels before 3.14 lack MemAvailable.
  const std::uint64_t available_kb =
      raw_.has_mem_available ? raw_.mem_available_kb
                             : raw_.mem_free_kb + raw_.buffers_kb + raw_.cached_kb + raw_.sreclaimable_kb;

  usage.total = to_bytes(raw_.mem_total_kb);
  usage.used = to_bytes(saturating_sub(raw_.mem_total_kb, available_kb));
  return usage;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

const char* MemorySensor::family() const noexcept { return kind_ == MemoryKind::SWAP ? "swap" : "memory"; }

bool MemorySensor::parse_meminfo() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
      raw_.has_mem_total = true;
    } else if (std::strcmp(key, "MemFree") == 0) {
      raw_.mem_free_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
      raw_.has_mem_available = true;
    } else if (std::strcmp(key, "Buffers") == 0) {
      raw_.buffers_kb = value;
    } else if (std::strcmp(key, "Cached") == 0) {
      raw_.cached_kb = value;
    } else if (std::strcmp(key, "SReclaimable") == 0) {
      raw_.sreclaimable_kb = value;
    } else if (std::strcmp(key, "SwapTotal") == 0) {
      raw_.swap_total_kb = value;
      raw_.has_swap_total = true;
    } else if (std::strcmp(key, "SwapFree") == 0) {
      raw_.swap_free_kb = value;
      raw_.has_swap_free = true;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }
  std::clearerr(meminfo_);
  return true;
}

std::uint64_t MemorySensor::to_bytes(const std::uint64_t kb) const {
  if (kb > kMaxKb) {
    throw ReadError(family(), "byte count exceeds signed 64-bit range");
  }
  return kb * 1024U;
}

}  // namespace host_agent::sensors

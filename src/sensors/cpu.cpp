#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstdlib>
#include <thread>
#include <utility>

#include "core/math.hpp"

namespace host_agent::sensors {

namespace {
constexpr const char* kProcStat = "/proc/stat";
constexpr const char* kFamily = "cpu";
}  // namespace

CpuSensor::CpuSensor(const std::chrono::milliseconds window)
    : path_(kProcStat),
      file_(std::fopen(kProcStat, "r")),
      owns_file_(true),
      window_(window),
      wait_([](const std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }) {}

CpuSensor::CpuSensor(std::FILE* file, const std::chrono::milliseconds window, WaitFn wait, const bool owns_file)
    : file_(file), owns_file_(owns_file), window_(window), wait_(std::move(wait)) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

std::vector<double> CpuSensor::read() {
  const std::vector<CoreTicks> before = read_ticks();
  if (wait_) {
    wait_(window_);
  }
  const std::vector<CoreTicks> after = read_ticks();

  if (before.size() != after.size()) {
    throw ReadError(kFamily, "core count changed during sampling window");
  }

  std::vector<double> usage(after.size(), 0.0);
  for (std::size_t i = 0; i < after.size(); ++i) {
    if (!before[i].present || !after[i].present) {
      continue;
    }

    const std::uint64_t total_delta = after[i].total >= before[i].total ? (after[i].total - before[i].total) : 0;
    const std::uint64_t busy_delta = after[i].busy >= before[i].busy ? (after[i].busy - before[i].busy) : 0;
    if (total_delta == 0) {
      continue;
    }

    usage[i] = core::percent_of(static_cast<double>(busy_delta), static_cast<double>(total_delta));
  }

  return usage;
}

std::vector<CpuSensor::CoreTicks> CpuSensor::read_ticks() {
  if (file_ == nullptr && owns_file_ && !path_.empty()) {
    file_ = std::fopen(path_.c_str(), "r");
  }
  if (file_ == nullptr) {
    throw ReadError(kFamily, "unable to open /proc/stat");
  }

  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    throw ReadError(kFamily, "unable to rewind /proc/stat");
  }

  std::vector<CoreTicks> cores;
  bool seen_cpu_line = false;
  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file_) != nullptr) {
    if (buffer[0] != 'c' || buffer[1] != 'p' || buffer[2] != 'u') {
      // cpu lines come first; everything after them (intr, ctxt, ...) is ignored.
      if (seen_cpu_line) {
        break;
      }
      continue;
    }
    seen_cpu_line = true;

    if (buffer[3] == ' ') {
      continue;
    }

    std::size_t index = 0;
    CoreTicks ticks{};
    if (!parse_core_line(buffer, index, ticks)) {
      std::clearerr(file_);
      throw ReadError(kFamily, "malformed per-core line in /proc/stat");
    }

    if (index >= kMaxCores) {
      throw ReadError(kFamily, "core index out of range");
    }
    if (index >= cores.size()) {
      cores.resize(index + 1);
    }
    cores[index] = ticks;
  }

  if (std::ferror(file_) != 0) {
    std::clearerr(file_);
    throw ReadError(kFamily, "read error on /proc/stat");
  }
  std::clearerr(file_);

  if (cores.empty()) {
    throw ReadError(kFamily, "no per-core lines in /proc/stat");
  }

  return cores;
}

bool CpuSensor::parse_core_line(const char* line, std::size_t& index, CoreTicks& ticks) noexcept {
  const char* cursor = line + 3;

  char* end = nullptr;
  errno = 0;
  const unsigned long long parsed_index = std::strtoull(cursor, &end, 10);
  if (errno != 0 || end == cursor || *end != ' ') {
    return false;
  }
  index = static_cast<std::size_t>(parsed_index);
  cursor = end;

  // user nice system idle iowait irq softirq steal; guest time is already part of user.
  std::uint64_t values[8]{};
  std::size_t parsed_fields = 0;
  for (; parsed_fields < 8; ++parsed_fields) {
    while (*cursor == ' ') {
      ++cursor;
    }
    if (*cursor == '\0' || *cursor == '\n') {
      break;
    }

    errno = 0;
    const unsigned long long value = std::strtoull(cursor, &end, 10);
    if (errno != 0 || end == cursor) {
      return false;
    }
    values[parsed_fields] = value;
    cursor = end;
  }

  if (parsed_fields < 4) {
    return false;
  }

  const std::uint64_t idle = values[3] + values[4];
  const std::uint64_t busy = values[0] + values[1] + values[2] + values[5] + values[6] + values[7];
  ticks.busy = busy;
  ticks.total = busy + idle;
  ticks.present = true;
  return true;
}

}  // namespace host_agent::sensors

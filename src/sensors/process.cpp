#include "sensors/process.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace host_agent::sensors {

namespace {
constexpr const char* kProcRoot = "/proc";
constexpr const char* kFamily = "process";
constexpr char kStateUnknown = '?';
}  // namespace

ProcessSensor::ProcessSensor() : proc_root_(kProcRoot) {}

ProcessSensor::ProcessSensor(std::string proc_root) : proc_root_(std::move(proc_root)) {}

model::ProcessCounts ProcessSensor::read() {
  model::ProcessCounts counts{};

  std::error_code error;
  std::filesystem::directory_iterator it(proc_root_, error);
  if (error) {
    throw ReadError(kFamily, "unable to list " + proc_root_ + ": " + error.message());
  }

  for (const std::filesystem::directory_iterator end{}; !error && it != end; it.increment(error)) {
    const std::string name = it->path().filename().string();
    if (!is_pid_name(name)) {
      continue;
    }

    char state = kStateUnknown;
    if (!read_state((it->path() / "stat").string(), state)) {
      // The process exited between listing and reading.
      continue;
    }

    ++counts.total;
    switch (state) {
      case 'R':
        ++counts.running;
        break;
      case 'S':
        ++counts.sleeping;
        break;
      case 'Z':
        ++counts.zombie;
        break;
      default:
        break;
    }
  }

  if (error) {
    throw ReadError(kFamily, "scan of " + proc_root_ + " failed: " + error.message());
  }

  return counts;
}

bool ProcessSensor::is_pid_name(const std::string& name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (const char c : name) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

bool ProcessSensor::read_state(const std::string& stat_path, char& state) noexcept {
  std::FILE* file = std::fopen(stat_path.c_str(), "r");
  if (file == nullptr) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  const bool read_ok = std::fgets(buffer, static_cast<int>(sizeof(buffer)), file) != nullptr;
  std::fclose(file);
  if (!read_ok) {
    return false;
  }

  // comm may itself contain ')' and spaces; the state follows the last one.
  const char* close_paren = std::strrchr(buffer, ')');
  if (close_paren == nullptr || close_paren[1] != ' ' || close_paren[2] == '\0') {
    state = kStateUnknown;
    return true;
  }

  state = close_paren[2];
  return true;
}

}  // namespace host_agent::sensors

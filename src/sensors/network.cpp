#include "sensors/network.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

namespace host_agent::sensors {

namespace {

constexpr const char* kProcNetDev = "/proc/net/dev";
constexpr const char* kFamily = "network";

std::string trim_name(const char* begin, const char* end) {
  while (begin < end && (*begin == ' ' || *begin == '\t')) {
    ++begin;
  }
  while (end > begin && (end[-1] == ' ' || end[-1] == '\t')) {
    --end;
  }
  return std::string(begin, end);
}

}  // namespace

NetworkSensor::NetworkSensor() : net_dev_(std::fopen(kProcNetDev, "r")), owns_file_(true) {}

NetworkSensor::NetworkSensor(std::FILE* net_dev, const bool owns_file) : net_dev_(net_dev), owns_file_(owns_file) {}

NetworkSensor::~NetworkSensor() {
  if (owns_file_ && net_dev_ != nullptr) {
    std::fclose(net_dev_);
    net_dev_ = nullptr;
  }
}

model::InterfaceMap NetworkSensor::read() {
  if (net_dev_ == nullptr && owns_file_) {
    net_dev_ = std::fopen(kProcNetDev, "r");
  }
  if (net_dev_ == nullptr) {
    throw ReadError(kFamily, "unable to open /proc/net/dev");
  }

  if (std::fseek(net_dev_, 0L, SEEK_SET) != 0) {
    throw ReadError(kFamily, "unable to rewind /proc/net/dev");
  }

  model::InterfaceMap interfaces;
  std::size_t line_no = 0;
  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), net_dev_) != nullptr) {
    ++line_no;
    if (line_no <= kHeaderLines) {
      if (std::strchr(buffer, '|') == nullptr) {
        std::clearerr(net_dev_);
        throw ReadError(kFamily, "unexpected /proc/net/dev header");
      }
      continue;
    }

    const char* colon = std::strchr(buffer, ':');
    if (colon == nullptr) {
      std::clearerr(net_dev_);
      throw ReadError(kFamily, "interface line without ':' in /proc/net/dev");
    }

    const std::string name = trim_name(buffer, colon);
    if (name.empty()) {
      std::clearerr(net_dev_);
      throw ReadError(kFamily, "empty interface name in /proc/net/dev");
    }

    // Receive: bytes packets errs drop fifo frame compressed multicast,
    // then transmit: bytes packets errs drop fifo colls carrier compressed.
    std::uint64_t fields[kCounterFields]{};
    const char* cursor = colon + 1;
    for (std::size_t i = 0; i < kCounterFields; ++i) {
      char* end = nullptr;
      errno = 0;
      const unsigned long long value = std::strtoull(cursor, &end, 10);
      if (errno != 0 || end == cursor) {
        std::clearerr(net_dev_);
        throw ReadError(kFamily, "malformed counters for interface " + name);
      }
      fields[i] = value;
      cursor = end;
    }

    interfaces[name] = model::InterfaceCounters{.rx = fields[0], .tx = fields[8]};
  }

  if (std::ferror(net_dev_) != 0) {
    std::clearerr(net_dev_);
    throw ReadError(kFamily, "read error on /proc/net/dev");
  }
  std::clearerr(net_dev_);

  if (line_no < kHeaderLines) {
    throw ReadError(kFamily, "/proc/net/dev header missing");
  }

  return interfaces;
}

}  // namespace host_agent::sensors

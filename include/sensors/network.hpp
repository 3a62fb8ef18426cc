#pragma once

#include <cstdio>

#include "sensors/counter_reader.hpp"

namespace host_agent::sensors {

// Raw cumulative byte counters for every interface in /proc/net/dev,
// loopback and virtual interfaces included.
class NetworkSensor final : public NetworkReader {
 public:
  NetworkSensor();
  explicit NetworkSensor(std::FILE* net_dev, bool owns_file = false);
  ~NetworkSensor() override;

  NetworkSensor(const NetworkSensor&) = delete;
  NetworkSensor& operator=(const NetworkSensor&) = delete;
  NetworkSensor(NetworkSensor&&) = delete;
  NetworkSensor& operator=(NetworkSensor&&) = delete;

  model::InterfaceMap read() override;

 private:
  static constexpr std::size_t kReadBufferSize = 1024;
  static constexpr std::size_t kHeaderLines = 2;
  static constexpr std::size_t kCounterFields = 16;

  std::FILE* net_dev_{nullptr};
  bool owns_file_{true};
};

}  // namespace host_agent::sensors

#include "sensors/counter_reader.hpp"

#include <memory>

#include "sensors/cpu.hpp"
#include "sensors/memory.hpp"
#include "sensors/network.hpp"
#include "sensors/process.hpp"

namespace host_agent::sensors {

ReaderSet make_procfs_readers(const std::chrono::milliseconds cpu_window) {
  ReaderSet readers{};
  readers.cpu = std::make_unique<CpuSensor>(cpu_window);
  readers.memory = std::make_unique<MemorySensor>(MemoryKind::RAM);
  readers.swap = std::make_unique<MemorySensor>(MemoryKind::SWAP);
  readers.network = std::make_unique<NetworkSensor>();
  readers.process = std::make_unique<ProcessSensor>();
  return readers;
}

}  // namespace host_agent::sensors

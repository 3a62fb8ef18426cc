#include "model/snapshot_json.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace host_agent::model {

namespace {

const nlohmann::json& require_object(const nlohmann::json& in, const char* key) {
  const auto it = in.find(key);
  if (it == in.end() || !it->is_object()) {
    throw std::invalid_argument(std::string(key) + " must be an object");
  }
  return *it;
}

std::uint64_t require_unsigned(const nlohmann::json& in, const char* key) {
  const auto it = in.find(key);
  if (it == in.end() || !it->is_number_unsigned()) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  return it->get<std::uint64_t>();
}

}  // namespace

void to_json(nlohmann::json& out, const MemoryUsage& usage) {
  out = nlohmann::json{{"total", usage.total}, {"used", usage.used}};
}

void to_json(nlohmann::json& out, const InterfaceCounters& counters) {
  out = nlohmann::json{{"rx", counters.rx}, {"tx", counters.tx}};
}

void to_json(nlohmann::json& out, const ProcessCounts& counts) {
  out = nlohmann::json{
      {"total", counts.total}, {"running", counts.running}, {"sleeping", counts.sleeping}, {"zombie", counts.zombie}};
}

void to_json(nlohmann::json& out, const Snapshot& snapshot) {
  // An empty map must still serialize as an object, not null.
  nlohmann::json net = nlohmann::json::object();
  for (const auto& [name, counters] : snapshot.net) {
    net[name] = counters;
  }

  out = nlohmann::json{{"cpu", snapshot.cpu},
                       {"mem", snapshot.mem},
                       {"swap", snapshot.swap},
                       {"net", std::move(net)},
                       {"proc", snapshot.proc}};
}

void from_json(const nlohmann::json& in, MemoryUsage& usage) {
  usage.total = require_unsigned(in, "total");
  usage.used = require_unsigned(in, "used");
}

void from_json(const nlohmann::json& in, InterfaceCounters& counters) {
  counters.rx = require_unsigned(in, "rx");
  counters.tx = require_unsigned(in, "tx");
}

void from_json(const nlohmann::json& in, ProcessCounts& counts) {
  counts.total = require_unsigned(in, "total");
  counts.running = require_unsigned(in, "running");
  counts.sleeping = require_unsigned(in, "sleeping");
  counts.zombie = require_unsigned(in, "zombie");
}

void from_json(const nlohmann::json& in, Snapshot& snapshot) {
  if (!in.is_object()) {
    throw std::invalid_argument("snapshot must be a JSON object");
  }

  const auto cpu_it = in.find("cpu");
  if (cpu_it == in.end() || !cpu_it->is_array()) {
    throw std::invalid_argument("cpu must be an array");
  }
  snapshot.cpu.clear();
  snapshot.cpu.reserve(cpu_it->size());
  for (const auto& core : *cpu_it) {
    if (!core.is_number()) {
      throw std::invalid_argument("cpu entries must be numbers");
    }
    snapshot.cpu.push_back(core.get<double>());
  }

  from_json(require_object(in, "mem"), snapshot.mem);
  from_json(require_object(in, "swap"), snapshot.swap);
  from_json(require_object(in, "proc"), snapshot.proc);

  snapshot.net.clear();
  for (const auto& [name, counters] : require_object(in, "net").items()) {
    if (!counters.is_object()) {
      throw std::invalid_argument("net." + name + " must be an object");
    }
    from_json(counters, snapshot.net[name]);
  }
}

std::string encode(const Snapshot& snapshot) {
  return nlohmann::json(snapshot).dump();
}

Snapshot decode(const std::string& payload) {
  const auto parsed = nlohmann::json::parse(payload, nullptr, false);
  if (parsed.is_discarded()) {
    throw std::invalid_argument("payload is not valid JSON");
  }

  Snapshot snapshot{};
  from_json(parsed, snapshot);
  return snapshot;
}

}  // namespace host_agent::model

#include "core/sampler.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace host_agent::core {

namespace {

bool is_reader_enabled(const std::unordered_map<std::string, bool>& enabled, const std::string& name) {
  const auto it = enabled.find(name);
  if (it == enabled.end()) {
    return true;
  }
  return it->second;
}

}  // namespace

Sampler::Sampler(sensors::ReaderSet readers, const std::unordered_map<std::string, bool>& enabled)
    : readers_(std::move(readers)), core_count_(std::thread::hardware_concurrency()) {
  register_readers(enabled);
}

void Sampler::register_readers(const std::unordered_map<std::string, bool>& enabled) {
  registry_.push_back({"cpu", is_reader_enabled(enabled, "cpu") && readers_.cpu != nullptr,
                       [this](model::Snapshot& snapshot) {
                         snapshot.cpu = readers_.cpu->read();
                         core_count_ = snapshot.cpu.size();
                       },
                       [this](model::Snapshot& snapshot) { snapshot.cpu.assign(core_count_, 0.0); }});
  registry_.push_back({"memory", is_reader_enabled(enabled, "memory") && readers_.memory != nullptr,
                       [this](model::Snapshot& snapshot) { snapshot.mem = readers_.memory->read(); },
                       [](model::Snapshot& snapshot) { snapshot.mem = {}; }});
  registry_.push_back({"swap", is_reader_enabled(enabled, "swap") && readers_.swap != nullptr,
                       [this](model::Snapshot& snapshot) { snapshot.swap = readers_.swap->read(); },
                       [](model::Snapshot& snapshot) { snapshot.swap = {}; }});
  registry_.push_back({"network", is_reader_enabled(enabled, "network") && readers_.network != nullptr,
                       [this](model::Snapshot& snapshot) { snapshot.net = readers_.network->read(); },
                       [](model::Snapshot& snapshot) { snapshot.net.clear(); }});
  registry_.push_back({"process", is_reader_enabled(enabled, "process") && readers_.process != nullptr,
                       [this](model::Snapshot& snapshot) { snapshot.proc = readers_.process->read(); },
                       [](model::Snapshot& snapshot) { snapshot.proc = {}; }});
}

model::Snapshot Sampler::sample() {
  model::Snapshot snapshot{};
  last_failures_.clear();

  for (auto& reader : registry_) {
    if (!reader.enabled) {
      reader.zero(snapshot);
      continue;
    }

    try {
      reader.read(snapshot);
      record_success(reader.name);
    } catch (const sensors::ReadError& ex) {
      reader.zero(snapshot);
      record_failure(reader.name, ex.what());
    } catch (const std::exception& ex) {
      reader.zero(snapshot);
      record_failure(reader.name, std::string("unexpected error: ") + ex.what());
    }
  }

  return snapshot;
}

const std::vector<ReadFailure>& Sampler::last_failures() const noexcept { return last_failures_; }

std::size_t Sampler::core_count() const noexcept { return core_count_; }

void Sampler::record_failure(const std::string& family, const std::string& message) {
  std::cerr << "[sampler] " << family << " reader failed: " << message << "; reporting zero value\n";
  failing_.insert(family);
  last_failures_.push_back({family, message});
}

void Sampler::record_success(const std::string& family) {
  if (failing_.erase(family) > 0) {
    std::cerr << "[sampler] " << family << " reader recovered\n";
  }
}

}  // namespace host_agent::core

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/snapshot.hpp"
#include "sensors/counter_reader.hpp"

namespace host_agent::core {

struct ReadFailure {
  std::string family;
  std::string message;
};

// Runs every counter reader once per call. A reader that fails contributes
// its zero value; the failure is logged and kept in last_failures().
class Sampler {
 public:
  explicit Sampler(sensors::ReaderSet readers, const std::unordered_map<std::string, bool>& enabled = {});

  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  [[nodiscard]] model::Snapshot sample();

  [[nodiscard]] const std::vector<ReadFailure>& last_failures() const noexcept;
  [[nodiscard]] std::size_t core_count() const noexcept;

 private:
  struct ReaderRegistration {
    std::string name;
    bool enabled;
    std::function<void(model::Snapshot&)> read;
    std::function<void(model::Snapshot&)> zero;
  };

  void register_readers(const std::unordered_map<std::string, bool>& enabled);
  void record_failure(const std::string& family, const std::string& message);
  void record_success(const std::string& family);

  sensors::ReaderSet readers_;
  std::vector<ReaderRegistration> registry_{};
  std::vector<ReadFailure> last_failures_{};
  std::unordered_set<std::string> failing_{};
  std::size_t core_count_{0};
};

}  // namespace host_agent::core

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/snapshot.hpp"

namespace host_agent::model {

void to_json(nlohmann::json& out, const MemoryUsage& usage);
void to_json(nlohmann::json& out, const InterfaceCounters& counters);
void to_json(nlohmann::json& out, const ProcessCounts& counts);
void to_json(nlohmann::json& out, const Snapshot& snapshot);

void from_json(const nlohmann::json& in, MemoryUsage& usage);
void from_json(const nlohmann::json& in, InterfaceCounters& counters);
void from_json(const nlohmann::json& in, ProcessCounts& counts);
void from_json(const nlohmann::json& in, Snapshot& snapshot);

// Compact, key-sorted wire payload.
std::string encode(const Snapshot& snapshot);

// Throws std::invalid_argument when the payload does not match the schema.
Snapshot decode(const std::string& payload);

}  // namespace host_agent::model

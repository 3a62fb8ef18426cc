#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace host_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// '#' starts a comment at line start or after whitespace, outside quotes.
void strip_comment(std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
      continue;
    }
    const bool after_space = i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0;
    if ((c == '"' || c == '\'') && (after_space || line[i - 1] == ':')) {
      quote = c;
      continue;
    }
    if (c == '#' && after_space) {
      line.erase(i);
      return;
    }
  }
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::chrono::milliseconds parse_ms(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer number of milliseconds");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer number of milliseconds");
  }
  return std::chrono::milliseconds(parsed);
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "interval_ms") {
    config.interval = parse_ms(key, value);
    return;
  }

  if (key == "cpu_window_ms") {
    config.cpu_window = parse_ms(key, value);
    return;
  }

  if (key == "collector.url") {
    config.collector.url = value;
    return;
  }

  if (key == "collector.timeout_ms") {
    config.collector.timeout = parse_ms(key, value);
    return;
  }

  if (key == "collector.connect_timeout_ms") {
    config.collector.connect_timeout = parse_ms(key, value);
    return;
  }

  if (key == "collector.auth_token") {
    config.collector.auth_token = value;
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key.rfind("readers.", 0) == 0) {
    const std::string reader_name = key.substr(std::string("readers.").size());
    config.reader_enabled[reader_name] = parse_bool(value);
  }
}

const char* getenv_or_null(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth + 1);
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_agent_config(config);
  return config;
}

void apply_env_overrides(AgentConfig& config) {
  if (const char* url = getenv_or_null("HOST_AGENT_COLLECTOR_URL"); url != nullptr) {
    config.collector.url = url;
  }
  if (const char* interval = getenv_or_null("HOST_AGENT_INTERVAL_MS"); interval != nullptr) {
    config.interval = parse_ms("HOST_AGENT_INTERVAL_MS", interval);
  }
  if (const char* token = getenv_or_null("HOST_AGENT_AUTH_TOKEN"); token != nullptr) {
    config.collector.auth_token = token;
  }

  validate_agent_config(config);
}

void validate_agent_config(const AgentConfig& config) {
  if (config.interval.count() <= 0) {
    throw std::runtime_error("interval_ms must be greater than 0");
  }

  if (config.cpu_window.count() < 0) {
    throw std::runtime_error("cpu_window_ms must be greater than or equal to 0");
  }

  if (config.cpu_window >= config.interval) {
    throw std::runtime_error("cpu_window_ms must be less than interval_ms");
  }

  const std::string& url = config.collector.url;
  if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
    throw std::runtime_error("collector.url must start with http:// or https://");
  }

  if (config.collector.timeout.count() <= 0) {
    throw std::runtime_error("collector.timeout_ms must be greater than 0");
  }

  if (config.collector.connect_timeout.count() <= 0) {
    throw std::runtime_error("collector.connect_timeout_ms must be greater than 0");
  }
}

}  // namespace host_agent::core

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "sinks/http_transport.hpp"

namespace host_agent::sinks {

struct HttpPostOptions {
  std::string url{"http://localhost:25800"};
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds connect_timeout{2000};
  std::string auth_token{};
  std::string user_agent{"host-agent/1.0"};
};

enum class SendErrorKind : std::uint8_t {
  TRANSPORT = 0,
  HTTP_STATUS = 1,
};

struct SendError {
  SendErrorKind kind{SendErrorKind::TRANSPORT};
  long status_code{0};
  std::string message{};
};

struct SendResult {
  long status_code{0};
  std::optional<SendError> error{};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Posts one encoded snapshot per call. No retries: a failed payload is dropped.
class HttpPostSink {
 public:
  HttpPostSink(HttpPostOptions options, std::unique_ptr<HttpTransport> transport);

  HttpPostSink(const HttpPostSink&) = delete;
  HttpPostSink& operator=(const HttpPostSink&) = delete;

  SendResult send(const std::string& body);

 private:
  HttpRequest build_request(const std::string& body) const;

  HttpPostOptions options_;
  std::unique_ptr<HttpTransport> transport_;
};

}  // namespace host_agent::sinks

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace host_agent::sinks {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds connect_timeout{2000};
  std::string user_agent{};
};

struct HttpResponse {
  long status_code{0};
  std::string body{};
  // Non-empty when no HTTP response was received (refused, timeout, DNS).
  std::string error{};
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse post(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpTransport> make_curl_transport();

}  // namespace host_agent::sinks

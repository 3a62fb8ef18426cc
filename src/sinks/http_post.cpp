#include "sinks/http_post.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace host_agent::sinks {

namespace {

bool is_success_status(const long status_code) noexcept { return status_code >= 200 && status_code < 300; }

}  // namespace

HttpPostSink::HttpPostSink(HttpPostOptions options, std::unique_ptr<HttpTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

SendResult HttpPostSink::send(const std::string& body) {
  SendResult result{};

  if (transport_ == nullptr) {
    result.error = SendError{SendErrorKind::TRANSPORT, 0, "no transport configured"};
  } else {
    HttpResponse response{};
    try {
      response = transport_->post(build_request(body));
    } catch (const std::exception& ex) {
      response.error = ex.what();
    }

    result.status_code = response.status_code;
    if (!response.error.empty()) {
      result.error = SendError{SendErrorKind::TRANSPORT, 0, response.error};
    } else if (!is_success_status(response.status_code)) {
      std::string message = "collector responded with HTTP " + std::to_string(response.status_code);
      if (!response.body.empty()) {
        message += ": " + response.body;
      }
      result.error = SendError{SendErrorKind::HTTP_STATUS, response.status_code, std::move(message)};
    }
  }

  if (!result.ok()) {
    std::cerr << "[reporter] POST " << options_.url << " failed: " << result.error->message << '\n';
  }
  return result;
}

HttpRequest HttpPostSink::build_request(const std::string& body) const {
  HttpRequest request{};
  request.url = options_.url;
  request.body = body;
  request.timeout = options_.timeout;
  request.connect_timeout = options_.connect_timeout;
  request.user_agent = options_.user_agent;
  request.headers.emplace_back("Content-Type", "application/json");
  if (!options_.auth_token.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + options_.auth_token);
  }
  return request;
}

}  // namespace host_agent::sinks

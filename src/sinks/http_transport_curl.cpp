#include "sinks/http_transport.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace host_agent::sinks {
namespace {

// Only the head of a response body is kept; it is used for diagnostics.
constexpr std::size_t kMaxResponseBodyBytes = 512;

std::size_t write_callback(char* contents, const std::size_t size, const std::size_t nmemb, void* userp) {
  const std::size_t total_size = size * nmemb;
  auto* body = static_cast<std::string*>(userp);
  if (body->size() < kMaxResponseBodyBytes) {
    body->append(contents, std::min(total_size, kMaxResponseBodyBytes - body->size()));
  }
  return total_size;
}

class CurlTransport final : public HttpTransport {
 public:
  CurlTransport() : global_init_(curl_global_init(CURL_GLOBAL_DEFAULT)), handle_(curl_easy_init()) {}

  ~CurlTransport() override {
    handle_.reset();
    if (global_init_ == CURLE_OK) {
      curl_global_cleanup();
    }
  }

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  HttpResponse post(const HttpRequest& request) override {
    HttpResponse response{};

    if (global_init_ != CURLE_OK) {
      response.error = std::string("curl_global_init failed: ") + curl_easy_strerror(global_init_);
      return response;
    }
    if (handle_ == nullptr) {
      handle_.reset(curl_easy_init());
      if (handle_ == nullptr) {
        response.error = "curl_easy_init failed";
        return response;
      }
    }

    // The handle is reused so that keep-alive connections survive across cycles.
    CURL* curl = handle_.get();
    curl_easy_reset(curl);

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : request.headers) {
      const std::string line = name + ": " + value;
      curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
      if (appended == nullptr) {
        response.error = "unable to build request headers";
        return response;
      }
      header_list.release();
      header_list.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!request.user_agent.empty()) {
      curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
    }

    const CURLcode result = curl_easy_perform(curl);
    if (result != CURLE_OK) {
      response.error = curl_easy_strerror(result);
      return response;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = http_code;
    return response;
  }

 private:
  struct EasyDeleter {
    void operator()(CURL* handle) const {
      if (handle != nullptr) {
        curl_easy_cleanup(handle);
      }
    }
  };

  struct SlistDeleter {
    void operator()(curl_slist* list) const {
      if (list != nullptr) {
        curl_slist_free_all(list);
      }
    }
  };

  CURLcode global_init_;
  std::unique_ptr<CURL, EasyDeleter> handle_;
};

}  // namespace

std::unique_ptr<HttpTransport> make_curl_transport() { return std::make_unique<CurlTransport>(); }

}  // namespace host_agent::sinks

#include "scapi/net/curl_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace scapi::net {

namespace {

class CurlGlobal {
public:
  CurlGlobal() {
    const auto rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
  }

  ~CurlGlobal() { curl_global_cleanup(); }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensureGlobalInit() {
  static CurlGlobal global;
}

struct CurlDefaults {
  static constexpr long FOLLOW_LOCATION = 1L;
  static constexpr long MAX_REDIRECTS = 10L;
  static constexpr long NO_PROGRESS = 1L;
  static constexpr long NO_SIGNAL = 1L;
  static constexpr long FORBID_REUSE = 1L;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string_view trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

size_t writeCallback(char* contents, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total_size = size * nmemb;
  body->append(contents, total_size);
  return total_size;
}

// Collects the status line and headers of the final response. A new status
// line (redirect, 100 Continue) resets what was collected so far.
size_t headerCallback(char* buffer, size_t size, size_t n_items, void* userdata) {
  auto* response = static_cast<Response*>(userdata);
  const size_t bytes = size * n_items;
  std::string_view line = trim(std::string_view(buffer, bytes));

  if (line.rfind("HTTP/", 0) == 0) {
    response->headers.clear();
    response->status_description.clear();

    auto first_space = line.find(' ');
    if (first_space != std::string_view::npos) {
      std::string_view rest = line.substr(first_space + 1);
      auto second_space = rest.find(' ');
      if (second_space != std::string_view::npos) {
        response->status_description = std::string(trim(rest.substr(second_space + 1)));
      }
    }
    return bytes;
  }

  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    response->headers.emplace_back(std::string(trim(line.substr(0, colon))),
                                   std::string(trim(line.substr(colon + 1))));
  }
  return bytes;
}

}  // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
  ensureGlobalInit();
}

std::string CurlTransport::defaultUserAgent() {
  return "scapi/" + getVersion().toString() + " " + curl_version_info(CURLVERSION_NOW)->version;
}

TransportResult CurlTransport::send(const Request& request) {
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return std::unexpected(TransportError{ErrorCode::kSystemError, "Failed to initialize CURL", std::nullopt});
  }

  std::array<char, CURL_ERROR_SIZE> error_buf{};
  Response response;
  std::string body;
  CURLcode rc = CURLE_OK;

  auto setopt = [&](CURLoption option, auto value) {
    if (rc == CURLE_OK) {
      rc = curl_easy_setopt(curl.get(), option, value);
    }
  };

  setopt(CURLOPT_ERRORBUFFER, error_buf.data());
  setopt(CURLOPT_URL, request.url.c_str());
  setopt(CURLOPT_USERAGENT, user_agent_.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
  setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
  setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
  setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
  setopt(CURLOPT_WRITEFUNCTION, &writeCallback);
  setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
  setopt(CURLOPT_HEADERFUNCTION, &headerCallback);
  setopt(CURLOPT_HEADERDATA, static_cast<void*>(&response));

  const bool sends_body = request.method == HttpMethod::POST ||
                          request.method == HttpMethod::PUT || !request.body.empty();
  if (request.method == HttpMethod::GET) {
    setopt(CURLOPT_HTTPGET, 1L);
  } else if (request.method == HttpMethod::POST) {
    setopt(CURLOPT_POST, 1L);
  } else {
    setopt(CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (sends_body) {
    setopt(CURLOPT_POSTFIELDS, request.body.c_str());
    setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  if (!request.keep_alive) {
    setopt(CURLOPT_FORBID_REUSE, CurlDefaults::FORBID_REUSE);
  }

  CurlHeaders header_list(nullptr, &curl_slist_free_all);
  auto appendHeader = [&header_list](const std::string& line) {
    curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
    if (appended != nullptr) {
      header_list.release();
      header_list.reset(appended);
    }
  };
  for (const auto& [name, value] : request.headers) {
    appendHeader(name + ": " + value);
  }
  if (!request.content_type.empty()) {
    appendHeader("Content-Type: " + request.content_type);
  }
  if (!request.keep_alive) {
    appendHeader("Connection: close");
  }
  if (sends_body) {
    appendHeader("Expect:");
  }
  if (header_list) {
    setopt(CURLOPT_HTTPHEADER, header_list.get());
  }

  if (rc != CURLE_OK) {
    return std::unexpected(TransportError{
        ErrorCode::kSystemError,
        std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc), std::nullopt});
  }

  spdlog::debug("{} {} ({} header(s), {} byte body)", request.method, request.url,
                request.headers.size(), request.body.size());

  rc = curl_easy_perform(curl.get());

  long response_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
  char* effective_url = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);

  response.status_code = static_cast<int>(response_code);
  response.body = std::move(body);
  response.effective_url = effective_url != nullptr ? effective_url : request.url;
  if (response.status_description.empty()) {
    response.status_description = std::string(reasonPhrase(response.status_code));
  }

  if (rc != CURLE_OK) {
    std::string message = "HTTP request failed: ";
    message += error_buf[0] != '\0' ? error_buf.data() : curl_easy_strerror(rc);

    TransportError error{ErrorCode::kNetworkError, std::move(message), std::nullopt};
    if (response_code > 0) {
      error.code = ErrorCode::kHttpError;
      error.response = std::move(response);
    }
    return std::unexpected(std::move(error));
  }

  return response;
}

} // namespace scapi::net

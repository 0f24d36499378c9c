#pragma once

#include <expected>

#include "scapi/net/http.hpp"

namespace scapi::net {

using TransportResult = std::expected<Response, TransportError>;

// Sends one request synchronously and reads the whole response body.
// Any HTTP status counts as a response; only failures to complete the
// exchange are reported as TransportError.
class HttpTransport {
public:
  HttpTransport() = default;
  virtual ~HttpTransport() = default;
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;
  HttpTransport(HttpTransport&&) = delete;
  HttpTransport& operator=(HttpTransport&&) = delete;

  virtual TransportResult send(const Request& request) = 0;
};

} // namespace scapi::net

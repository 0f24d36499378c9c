#pragma once

#include <string>

#include "scapi/net/http_transport.hpp"

namespace scapi::net {

// libcurl-backed transport. Each send() uses its own easy handle, so one
// instance can be shared between contexts and threads.
class CurlTransport : public HttpTransport {
public:
  explicit CurlTransport(std::string user_agent = defaultUserAgent());
  ~CurlTransport() override = default;

  TransportResult send(const Request& request) override;

  static std::string defaultUserAgent();

private:
  std::string user_agent_;
};

} // namespace scapi::net

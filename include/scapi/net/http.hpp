#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scapi/common.hpp"

namespace scapi::net {

enum class HttpStatusCode : int {
  OK = 200,
  BAD_REQUEST = 400,
  UNAUTHORIZED = 401,
  FORBIDDEN = 403,
  NOT_FOUND = 404,
  INTERNAL_SERVER_ERROR = 500,
};

struct HttpMethod {
  static constexpr const char* GET = "GET";
  static constexpr const char* POST = "POST";
  static constexpr const char* PUT = "PUT";
  static constexpr const char* DELETE = "DELETE";
};

constexpr std::string_view kFormUrlEncoded = "application/x-www-form-urlencoded";

// Standard reason phrase for a status code, empty when unknown
std::string_view reasonPhrase(int status_code);

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Outgoing request. Header names are matched case-insensitively.
struct Request {
  std::string url;
  std::string method = HttpMethod::GET;
  HeaderList headers;
  std::string content_type;
  std::string body;
  bool keep_alive = true;

  void setHeader(const std::string& name, const std::string& value);
  std::optional<std::string> header(std::string_view name) const;
  bool hasHeader(std::string_view name) const { return header(name).has_value(); }
  size_t contentLength() const { return body.size(); }
};

struct Response {
  int status_code = 0;
  std::string status_description;
  HeaderList headers;
  std::string body;
  std::string effective_url;

  std::optional<std::string> header(std::string_view name) const;
};

// A failed exchange. `response` is set when a status line was received
// before the failure.
struct TransportError {
  ErrorCode code = ErrorCode::kNetworkError;
  std::string message;
  std::optional<Response> response;
};

} // namespace scapi::net

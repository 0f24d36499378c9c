#include "scapi/net/http.hpp"

#include <algorithm>
#include <cctype>

namespace scapi::net {

namespace {

bool equalsNoCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::optional<std::string> findHeader(const HeaderList& headers, std::string_view name) {
  for (const auto& [key, value] : headers) {
    if (equalsNoCase(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view reasonPhrase(int status_code) {
  switch (status_code) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return {};
  }
}

void Request::setHeader(const std::string& name, const std::string& value) {
  for (auto& [key, existing] : headers) {
    if (equalsNoCase(key, name)) {
      existing = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

std::optional<std::string> Request::header(std::string_view name) const {
  return findHeader(headers, name);
}

std::optional<std::string> Response::header(std::string_view name) const {
  return findHeader(headers, name);
}

} // namespace scapi::net

#include "scapi/util/url.hpp"

#include <curl/curl.h>

#include <memory>

namespace scapi::util {

std::string urlEncode(std::string_view value) {
  if (value.empty()) {
    return {};
  }

  std::unique_ptr<char, decltype(&curl_free)> escaped(
      curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())), &curl_free);
  if (!escaped) {
    return std::string(value);
  }
  return std::string(escaped.get());
}

std::string toQueryString(const QueryParameters& parameters) {
  std::string query;
  for (const auto& [name, value] : parameters) {
    if (name.empty()) {
      continue;
    }
    if (!query.empty()) {
      query += '&';
    }
    query += urlEncode(name);
    query += '=';
    query += urlEncode(value);
  }
  return query;
}

std::string appendQuery(const std::string& uri, const std::string& query) {
  if (query.empty()) {
    return uri;
  }
  return uri + (uri.find('?') == std::string::npos ? "?" : "&") + query;
}

} // namespace scapi::util

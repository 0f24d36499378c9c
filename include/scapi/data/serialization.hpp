#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "scapi/common.hpp"
#include "scapi/model/query.hpp"
#include "scapi/util/security.hpp"
#include "scapi/util/xml.hpp"

namespace scapi::data {

// Parse a JSON body into T through its from_json overload
template<typename T>
Result<T> deserializeJson(const std::string& body) {
  T result{};
  if (util::Security::isBlank(body)) {
    return result;
  }
  try {
    nlohmann::json::parse(body).get_to(result);
  } catch (const nlohmann::json::exception& e) {
    return makeErrorResult<T>(ErrorCode::kParseError,
                              std::string("Failed to parse JSON response: ") + e.what());
  }
  return result;
}

// Parse an XML body into T through its fromXml(const util::XmlNode&, T&) overload
template<typename T>
Result<T> deserializeXml(const std::string& body) {
  T result{};
  if (util::Security::isBlank(body)) {
    return result;
  }
  auto document = util::XmlDocument::parse(body);
  if (!document) {
    return std::unexpected(document.error());
  }
  fromXml(document->root(), result);
  return result;
}

// Empty or whitespace-only bodies yield a default-constructed T
template<typename T>
Result<T> deserialize(const std::string& body, model::ResponseFormat format) {
  switch (format) {
    case model::ResponseFormat::kXml:
      return deserializeXml<T>(body);
    case model::ResponseFormat::kJson:
      break;
  }
  return deserializeJson<T>(body);
}

} // namespace scapi::data

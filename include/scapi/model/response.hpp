#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "scapi/util/xml.hpp"

namespace scapi::model {

// How an exchange ended, independent of the HTTP status
enum class ExchangeOutcome {
  kCompleted,       // A response was received and its body deserialized
  kHttpError,       // The transport failed after a status line arrived
  kTransportError,  // No response at all (DNS, refused, timeout)
  kUnexpectedError  // Anything else, including unparseable bodies
};

std::string_view exchangeOutcomeToString(ExchangeOutcome outcome);

// Metadata attached to every response, on success and on failure
struct ResponseInfo {
  std::string uri;
  std::chrono::milliseconds response_time{0};
  std::string error_message;
  std::string stack_trace;
  ExchangeOutcome outcome = ExchangeOutcome::kCompleted;
};

// Fields common to every typed response
class BaseResponse {
public:
  virtual ~BaseResponse() = default;

  int status_code = 0;
  std::string status_description;
  std::optional<ResponseInfo> info;

  // 2xx status and a completed exchange
  bool succeeded() const;

  // Error text from the info block, empty when none
  std::string errorMessage() const;
};

// Reads the optional "statusCode" member shared by all JSON bodies
void readBaseJson(const nlohmann::json& j, BaseResponse& response);

// Reads the optional <statusCode> element shared by all XML bodies
void readBaseXml(const util::XmlNode& node, BaseResponse& response);

void to_json(nlohmann::json& j, const ResponseInfo& info);
void to_json(nlohmann::json& j, const BaseResponse& response);

} // namespace scapi::model

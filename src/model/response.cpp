#include "scapi/model/response.hpp"

namespace scapi::model {

std::string_view exchangeOutcomeToString(ExchangeOutcome outcome) {
  switch (outcome) {
    case ExchangeOutcome::kCompleted: return "completed";
    case ExchangeOutcome::kHttpError: return "http_error";
    case ExchangeOutcome::kTransportError: return "transport_error";
    case ExchangeOutcome::kUnexpectedError: return "unexpected_error";
  }
  return "unexpected_error";
}

bool BaseResponse::succeeded() const {
  const bool completed = !info.has_value() || info->outcome == ExchangeOutcome::kCompleted;
  return completed && status_code >= 200 && status_code < 300;
}

std::string BaseResponse::errorMessage() const {
  return info ? info->error_message : std::string{};
}

void readBaseJson(const nlohmann::json& j, BaseResponse& response) {
  if (j.is_object() && j.contains("statusCode") && j["statusCode"].is_number_integer()) {
    response.status_code = j["statusCode"].get<int>();
  }
}

void readBaseXml(const util::XmlNode& node, BaseResponse& response) {
  auto status = node.childText("statusCode");
  if (!status.empty()) {
    try {
      response.status_code = std::stoi(status);
    } catch (const std::exception&) {
      // non-numeric status element; the HTTP status is used instead
    }
  }
}

void to_json(nlohmann::json& j, const ResponseInfo& info) {
  j = nlohmann::json{
      {"uri", info.uri},
      {"response_time_ms", info.response_time.count()},
      {"outcome", std::string(exchangeOutcomeToString(info.outcome))},
  };
  if (!info.error_message.empty()) {
    j["error_message"] = info.error_message;
  }
  if (!info.stack_trace.empty()) {
    j["stack_trace"] = info.stack_trace;
  }
}

void to_json(nlohmann::json& j, const BaseResponse& response) {
  j["status_code"] = response.status_code;
  j["status_description"] = response.status_description;
  if (response.info) {
    j["info"] = *response.info;
  }
}

} // namespace scapi::model

#include "scapi/model/query.hpp"

#include "scapi/net/http.hpp"

namespace scapi::model {

const char* toHttpMethod(QueryType type) {
  switch (type) {
    case QueryType::kRead:
      return net::HttpMethod::GET;
    case QueryType::kCreate:
      return net::HttpMethod::POST;
    case QueryType::kUpdate:
      return net::HttpMethod::PUT;
    case QueryType::kDelete:
      return net::HttpMethod::DELETE;
  }
  return net::HttpMethod::GET;
}

bool isMutating(QueryType type) {
  return type == QueryType::kCreate || type == QueryType::kUpdate;
}

std::string_view queryTypeToString(QueryType type) {
  switch (type) {
    case QueryType::kRead: return "read";
    case QueryType::kCreate: return "create";
    case QueryType::kUpdate: return "update";
    case QueryType::kDelete: return "delete";
  }
  return "read";
}

const FieldMap& BaseQuery::fieldsToUpdate() const {
  static const FieldMap kNoFields;
  return kNoFields;
}

ActionQuery::ActionQuery(std::string action, ResponseFormat format, int api_version)
    : action_(std::move(action)), format_(format), api_version_(api_version) {}

std::string ActionQuery::buildUri(const std::string& host_name) const {
  return host_name + "/-/item/v" + std::to_string(api_version_) + "/-/actions/" +
         util::urlEncode(action_);
}

} // namespace scapi::model

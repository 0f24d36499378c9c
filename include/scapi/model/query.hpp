#pragma once

#include <string>
#include <string_view>

#include "scapi/util/url.hpp"

namespace scapi::model {

enum class QueryType {
  kRead,
  kCreate,
  kUpdate,
  kDelete
};

enum class ResponseFormat {
  kJson,
  kXml
};

// Field name/value pairs written as the form-encoded body of Create/Update
using FieldMap = util::QueryParameters;

// Read -> GET, Create -> POST, Update -> PUT, Delete -> DELETE
const char* toHttpMethod(QueryType type);

// Create and Update need an authenticated context
bool isMutating(QueryType type);

std::string_view queryTypeToString(QueryType type);

// Default item web API version used in request paths
constexpr int kDefaultApiVersion = 1;

// Abstract query interface
class BaseQuery {
public:
  virtual ~BaseQuery() = default;

  virtual QueryType queryType() const = 0;

  // Full request URI for the given scheme-prefixed host
  virtual std::string buildUri(const std::string& host_name) const = 0;

  virtual ResponseFormat responseFormat() const { return ResponseFormat::kJson; }

  // Fields to send in the body of a Create or Update
  virtual const FieldMap& fieldsToUpdate() const;
};

// Invokes a named server action, e.g. "getpublickey"
class ActionQuery : public BaseQuery {
public:
  explicit ActionQuery(std::string action,
                       ResponseFormat format = ResponseFormat::kJson,
                       int api_version = kDefaultApiVersion);

  QueryType queryType() const override { return QueryType::kRead; }
  std::string buildUri(const std::string& host_name) const override;
  ResponseFormat responseFormat() const override { return format_; }

  const std::string& action() const { return action_; }

private:
  std::string action_;
  ResponseFormat format_;
  int api_version_;
};

} // namespace scapi::model

#pragma once

#include <optional>
#include <string>

#include "scapi/model/query.hpp"

namespace scapi::model {

// Amount of field data returned per item
enum class Payload {
  kMin,
  kContent,
  kFull
};

std::string_view payloadToString(Payload payload);

// Query against the item web API, addressing an item by path or id.
//
//   auto query = ItemQuery::byPath("/sitecore/content/Home")
//                    .withDatabase("web")
//                    .withScope("s|c");
class ItemQuery : public BaseQuery {
public:
  explicit ItemQuery(QueryType type = QueryType::kRead);

  static ItemQuery byPath(std::string path, QueryType type = QueryType::kRead);
  static ItemQuery byId(std::string id, QueryType type = QueryType::kRead);

  ItemQuery& withPath(std::string path);
  ItemQuery& withId(std::string id);
  ItemQuery& withDatabase(std::string database);
  ItemQuery& withLanguage(std::string language);
  ItemQuery& withScope(std::string scope);
  ItemQuery& withPayload(Payload payload);
  ItemQuery& withFormat(ResponseFormat format);
  ItemQuery& withApiVersion(int version);

  // Create only: name and template of the new child item
  ItemQuery& withName(std::string name);
  ItemQuery& withTemplate(std::string template_path);

  ItemQuery& withField(std::string name, std::string value);

  QueryType queryType() const override { return type_; }
  std::string buildUri(const std::string& host_name) const override;
  ResponseFormat responseFormat() const override { return format_; }
  const FieldMap& fieldsToUpdate() const override { return fields_; }

  const std::string& path() const { return path_; }
  const std::optional<std::string>& id() const { return id_; }

private:
  QueryType type_;
  ResponseFormat format_ = ResponseFormat::kJson;
  int api_version_ = kDefaultApiVersion;
  std::string path_;
  std::optional<std::string> id_;
  std::optional<std::string> database_;
  std::optional<std::string> language_;
  std::optional<std::string> scope_;
  std::optional<Payload> payload_;
  std::optional<std::string> name_;
  std::optional<std::string> template_;
  FieldMap fields_;
};

} // namespace scapi::model

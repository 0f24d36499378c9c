#include "scapi/model/item_query.hpp"

namespace scapi::model {

namespace {

// Encode each path segment, keep the separators
std::string encodePath(const std::string& path) {
  std::string encoded;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    encoded += util::urlEncode(segment);
    if (slash == std::string::npos) {
      break;
    }
    encoded += '/';
    start = slash + 1;
  }
  return encoded;
}

}  // namespace

std::string_view payloadToString(Payload payload) {
  switch (payload) {
    case Payload::kMin: return "min";
    case Payload::kContent: return "content";
    case Payload::kFull: return "full";
  }
  return "min";
}

ItemQuery::ItemQuery(QueryType type) : type_(type) {}

ItemQuery ItemQuery::byPath(std::string path, QueryType type) {
  ItemQuery query(type);
  query.withPath(std::move(path));
  return query;
}

ItemQuery ItemQuery::byId(std::string id, QueryType type) {
  ItemQuery query(type);
  query.withId(std::move(id));
  return query;
}

ItemQuery& ItemQuery::withPath(std::string path) {
  if (!path.empty() && path.front() != '/') {
    path.insert(path.begin(), '/');
  }
  path_ = std::move(path);
  return *this;
}

ItemQuery& ItemQuery::withId(std::string id) {
  id_ = std::move(id);
  return *this;
}

ItemQuery& ItemQuery::withDatabase(std::string database) {
  database_ = std::move(database);
  return *this;
}

ItemQuery& ItemQuery::withLanguage(std::string language) {
  language_ = std::move(language);
  return *this;
}

ItemQuery& ItemQuery::withScope(std::string scope) {
  scope_ = std::move(scope);
  return *this;
}

ItemQuery& ItemQuery::withPayload(Payload payload) {
  payload_ = payload;
  return *this;
}

ItemQuery& ItemQuery::withFormat(ResponseFormat format) {
  format_ = format;
  return *this;
}

ItemQuery& ItemQuery::withApiVersion(int version) {
  api_version_ = version;
  return *this;
}

ItemQuery& ItemQuery::withName(std::string name) {
  name_ = std::move(name);
  return *this;
}

ItemQuery& ItemQuery::withTemplate(std::string template_path) {
  template_ = std::move(template_path);
  return *this;
}

ItemQuery& ItemQuery::withField(std::string name, std::string value) {
  fields_.emplace_back(std::move(name), std::move(value));
  return *this;
}

std::string ItemQuery::buildUri(const std::string& host_name) const {
  std::string uri = host_name + "/-/item/v" + std::to_string(api_version_);
  uri += path_.empty() ? "/" : encodePath(path_);

  util::QueryParameters parameters;
  if (id_) parameters.emplace_back("sc_itemid", *id_);
  if (database_) parameters.emplace_back("sc_database", *database_);
  if (language_) parameters.emplace_back("language", *language_);
  if (payload_) parameters.emplace_back("payload", std::string(payloadToString(*payload_)));
  if (scope_) parameters.emplace_back("scope", *scope_);
  if (type_ == QueryType::kCreate) {
    if (name_) parameters.emplace_back("name", *name_);
    if (template_) parameters.emplace_back("template", *template_);
  }

  return util::appendQuery(uri, util::toQueryString(parameters));
}

} // namespace scapi::model

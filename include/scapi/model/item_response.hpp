#pragma once

#include <string>
#include <vector>

#include "scapi/model/response.hpp"

namespace scapi::model {

struct ItemField {
  std::string id;
  std::string name;
  std::string type;
  std::string value;
};

struct Item {
  std::string id;
  std::string name;
  std::string display_name;
  std::string path;
  std::string template_id;
  std::string template_name;
  std::string database;
  std::string language;
  int version = 0;
  bool has_children = false;
  std::vector<ItemField> fields;

  // Value of the field with the given name, empty when absent
  std::string fieldValue(const std::string& field_name) const;
};

// Result of read, create, update and delete queries
class ItemResponse : public BaseResponse {
public:
  int total_count = 0;
  int result_count = 0;
  std::vector<Item> items;

  // Server-side error message ({"error": {"message": ...}})
  std::string server_error;
};

void from_json(const nlohmann::json& j, ItemField& field);
void from_json(const nlohmann::json& j, Item& item);
void from_json(const nlohmann::json& j, ItemResponse& response);

void to_json(nlohmann::json& j, const ItemField& field);
void to_json(nlohmann::json& j, const Item& item);
void to_json(nlohmann::json& j, const ItemResponse& response);

// XML bodies mirror the JSON shape:
// <response><statusCode/><result><totalCount/><resultCount/><items><item>...
void fromXml(const util::XmlNode& node, ItemResponse& response);

} // namespace scapi::model
